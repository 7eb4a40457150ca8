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
  * @brief Unit tests for the success record and its formatting helpers.
  */

// System headers
#include <chrono>
#include <sstream>
#include <string>

// Boost unit test header
#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE TransferOutcome
#include "boost/test/unit_test.hpp"

// Dsync headers
#include "transfer/TransferOutcome.h"

namespace transfer = lsst::dsync::transfer;

using std::chrono::microseconds;
using transfer::TransferOutcome;

BOOST_AUTO_TEST_SUITE(Suite)

BOOST_AUTO_TEST_CASE(SizeToString) {
    BOOST_CHECK_EQUAL(transfer::size2string(0),    "0");
    BOOST_CHECK_EQUAL(transfer::size2string(3),    "3");
    BOOST_CHECK_EQUAL(transfer::size2string(1023), "1023");
    BOOST_CHECK_EQUAL(transfer::size2string(1024), "1KB");
    BOOST_CHECK_EQUAL(transfer::size2string(8192), "8KB");
    BOOST_CHECK_EQUAL(transfer::size2string(3.5 * 1024 * 1024), "3MB");
    BOOST_CHECK_EQUAL(transfer::size2string(2.0 * 1024 * 1024 * 1024), "2GB");
    BOOST_CHECK_EQUAL(transfer::size2string(7.0 * 1024 * 1024 * 1024 * 1024), "7TB");

    // Nothing above TB
    BOOST_CHECK_EQUAL(transfer::size2string(5.0 * 1024 * 1024 * 1024 * 1024 * 1024), "5120TB");
}

BOOST_AUTO_TEST_CASE(DurationToString) {
    BOOST_CHECK_EQUAL(transfer::duration2string(microseconds(0)), "0:00:00.000000");
    BOOST_CHECK_EQUAL(transfer::duration2string(microseconds(12345)), "0:00:00.012345");
    BOOST_CHECK_EQUAL(transfer::duration2string(microseconds(3723000004LL)), "1:02:03.000004");
    BOOST_CHECK_EQUAL(transfer::duration2string(microseconds(90000000000LL)), "25:00:00.000000");
}

BOOST_AUTO_TEST_CASE(Throughput) {
    TransferOutcome outcome;
    outcome.size    = 4 * 1024 * 1024;
    outcome.elapsed = microseconds(2000000);
    BOOST_CHECK_CLOSE(outcome.throughput(), 2.0 * 1024 * 1024, 1e-9);

    // Instantaneous transfers don't divide by zero
    outcome.elapsed = microseconds(0);
    BOOST_CHECK_CLOSE(outcome.throughput(), 4.0 * 1024 * 1024 * 1e6, 1e-9);
}

BOOST_AUTO_TEST_CASE(Record) {
    TransferOutcome outcome;
    outcome.source         = "/data/raw/visit-1.fits";
    outcome.destination    = "/pnfs/lsst/raw/visit-1.fits";
    outcome.identifier     = "0000A1B2C3D4";
    outcome.localChecksum  = "024d0127";
    outcome.remoteChecksum = "024d0127";
    outcome.size           = 3 * 1024 * 1024;
    outcome.elapsed        = microseconds(1500000);

    BOOST_CHECK_EQUAL(outcome.toRecord(),
                      "source=/data/raw/visit-1.fits"
                      " destination=/pnfs/lsst/raw/visit-1.fits"
                      " id=0000A1B2C3D4"
                      " checksum=024d0127"
                      " size=3145728"
                      " size_human=3MB"
                      " elapsed=0:00:01.500000"
                      " throughput=2MB/s");

    std::ostringstream os;
    os << outcome;
    BOOST_CHECK(os.str().find("identifier: 0000A1B2C3D4") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
