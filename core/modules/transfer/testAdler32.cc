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
  * @brief Unit tests for the Adler-32 accumulator.
  */

// System headers
#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

// Boost unit test header
#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE Adler32
#include "boost/test/unit_test.hpp"

// Dsync headers
#include "transfer/Adler32.h"

using lsst::dsync::transfer::Adler32;

namespace {

uint32_t checksumOf (const std::string &data) {
    return Adler32::update(Adler32::seed, data.data(), data.size());
}

} // namespace

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(KnownValues) {
    BOOST_CHECK_EQUAL(checksumOf("abc"), 0x024d0127u);
    BOOST_CHECK_EQUAL(Adler32::finalize(checksumOf("abc")), "024d0127");
    BOOST_CHECK_EQUAL(checksumOf("Wikipedia"), 0x11e60398u);
    BOOST_CHECK_EQUAL(Adler32::finalize(checksumOf("Wikipedia")), "11e60398");
}

BOOST_AUTO_TEST_CASE(EmptyInputKeepsSeed) {
    BOOST_CHECK_EQUAL(checksumOf(""), Adler32::seed);
    BOOST_CHECK_EQUAL(Adler32::finalize(Adler32::seed), "00000001");
}

BOOST_AUTO_TEST_CASE(FinalizeRendersEightDigits) {
    BOOST_CHECK_EQUAL(Adler32::finalize(0), "00000000");
    BOOST_CHECK_EQUAL(Adler32::finalize(0xabcu), "00000abc");
    BOOST_CHECK_EQUAL(Adler32::finalize(0xffffffffu), "ffffffff");
    BOOST_CHECK_EQUAL(Adler32::finalize(0x80000001u), "80000001");
}

BOOST_AUTO_TEST_CASE(ChunkingInvariance) {

    // Large enough for the second sum to wrap around the modulus many times
    std::string data(300000, '\0');
    std::srand(12345);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>(std::rand() & 0xff);
    }
    const uint32_t whole = checksumOf(data);

    std::vector<size_t> blockSizes = {1, 7, 4096, 65521, 100000, 299999};
    for (size_t blockSize: blockSizes) {
        uint32_t state = Adler32::seed;
        for (size_t off = 0; off < data.size(); off += blockSize) {
            const size_t len = std::min(blockSize, data.size() - off);
            state = Adler32::update(state, data.data() + off, len);
        }
        BOOST_CHECK_MESSAGE(state == whole, "block size " << blockSize);
    }
}

BOOST_AUTO_TEST_CASE(Normalize) {
    BOOST_CHECK_EQUAL(Adler32::normalize("024d0127"),       "024d0127");
    BOOST_CHECK_EQUAL(Adler32::normalize(" 024D0127 \n"),   "024d0127");
    BOOST_CHECK_EQUAL(Adler32::normalize("0x24d0127"),      "024d0127");
    BOOST_CHECK_EQUAL(Adler32::normalize("1"),              "00000001");
    BOOST_CHECK_EQUAL(Adler32::normalize(""),               "");
    BOOST_CHECK_EQUAL(Adler32::normalize("not-hex"),        "not-hex");
}

BOOST_AUTO_TEST_CASE(Equal) {
    BOOST_CHECK(Adler32::equal("024d0127", "024D0127"));
    BOOST_CHECK(Adler32::equal("00000001", "1"));
    BOOST_CHECK(!Adler32::equal("024d0127", "00000000"));
    BOOST_CHECK(!Adler32::equal("024d0127", ""));
}

BOOST_AUTO_TEST_SUITE_END()
