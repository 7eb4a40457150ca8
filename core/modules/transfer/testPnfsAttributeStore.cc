/*
 * LSST Data Management System
 * Copyright 2017 LSST Corporation.
 *
 * This product includes software developed by the
 * LSST Project (http://www.lsst.org/).
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the LSST License Statement and
 * the GNU General Public License along with this program.  If not,
 * see <http://www.lsstcorp.org/LegalNotices/>.
 */

/**
  * @file
  *
  * @brief Unit tests for the attributes read from the pnfs pseudo-files.
  */

// System headers
#include <string>

// Boost unit test header
#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE PnfsAttributeStore
#include "boost/test/unit_test.hpp"

// Dsync headers
#include "transfer/PnfsAttributeStore.h"
#include "transfer/TransferError.h"
#include "transfer/TransferMocks.h"

namespace transfer = lsst::dsync::transfer;

using transfer::PnfsAttributeStore;

struct PnfsFixture {
    PnfsFixture() : file(dir.write("data.fits", "abc")) {}

    transfer::TempDir dir;
    PnfsAttributeStore store;
    std::string file;
};

BOOST_FIXTURE_TEST_SUITE(Suite, PnfsFixture)

BOOST_AUTO_TEST_CASE(PseudoFileNames) {
    BOOST_CHECK_EQUAL(PnfsAttributeStore::checksumPath("/pnfs/lsst/raw/data.fits"),
                      "/pnfs/lsst/raw/.(get)(data.fits)(checksum)");
    BOOST_CHECK_EQUAL(PnfsAttributeStore::identifierPath("/pnfs/lsst/raw/data.fits"),
                      "/pnfs/lsst/raw/.(id)(data.fits)");
    BOOST_CHECK_EQUAL(PnfsAttributeStore::checksumPath("data.fits"),
                      "./.(get)(data.fits)(checksum)");
    BOOST_CHECK_EQUAL(PnfsAttributeStore::identifierPath("data.fits"),
                      "./.(id)(data.fits)");
}

BOOST_AUTO_TEST_CASE(ChecksumLine) {
    dir.write(".(get)(data.fits)(checksum)", "MD5_TYPE:900150983cd24fb0\nADLER32:024d0127 \n");
    const boost::optional<std::string> cs = store.checksum(file);
    BOOST_REQUIRE(cs);
    BOOST_CHECK_EQUAL(*cs, "024d0127");
}

BOOST_AUTO_TEST_CASE(ChecksumPrefixInsideLine) {
    dir.write(".(get)(data.fits)(checksum)", "  ADLER32:  1a2b3c4d\r\n");
    const boost::optional<std::string> cs = store.checksum(file);
    BOOST_REQUIRE(cs);
    BOOST_CHECK_EQUAL(*cs, "1a2b3c4d");
}

BOOST_AUTO_TEST_CASE(NoChecksumLine) {
    dir.write(".(get)(data.fits)(checksum)", "MD5_TYPE:900150983cd24fb0\n");
    BOOST_CHECK(!store.checksum(file));
}

BOOST_AUTO_TEST_CASE(MissingPseudoFiles) {
    BOOST_CHECK_THROW(store.checksum(file),   transfer::MetadataError);
    BOOST_CHECK_THROW(store.identifier(file), transfer::MetadataError);
}

BOOST_AUTO_TEST_CASE(Identifier) {
    dir.write(".(id)(data.fits)", "0000A1B2C3D4E5F6\n");
    BOOST_CHECK_EQUAL(store.identifier(file), "0000A1B2C3D4E5F6");
}

BOOST_AUTO_TEST_SUITE_END()
