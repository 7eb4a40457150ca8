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
  * @brief Unit tests for the bounded wait for the destination size.
  */

// System headers
#include <chrono>
#include <fstream>
#include <string>
#include <thread>

// Boost unit test header
#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE SizeWaiter
#include "boost/test/unit_test.hpp"

// Dsync headers
#include "transfer/CancellationToken.h"
#include "transfer/SizeWaiter.h"
#include "transfer/TransferError.h"
#include "transfer/TransferMocks.h"

namespace transfer = lsst::dsync::transfer;

using std::chrono::milliseconds;
using transfer::CancellationToken;
using transfer::SizeWaiter;

typedef std::chrono::steady_clock clock_type;

struct WaiterFixture {
    WaiterFixture() : path(dir.write("file", "abc")) {}

    transfer::TempDir dir;
    transfer::CapturingReporter reporter;
    CancellationToken token;
    std::string path;
};

BOOST_FIXTURE_TEST_SUITE(Suite, WaiterFixture)

BOOST_AUTO_TEST_CASE(SizeAlreadyMatches) {
    SizeWaiter waiter(reporter, milliseconds(10), milliseconds(1000));
    BOOST_CHECK_EQUAL(waiter.wait(path, 3, token), 1u);
    BOOST_CHECK(reporter.infos.empty());
}

BOOST_AUTO_TEST_CASE(AttemptLimit) {
    SizeWaiter waiter(reporter, milliseconds(1), milliseconds(10000), 3);
    BOOST_CHECK_THROW(waiter.wait(path, 5, token), transfer::SizeWaitTimeout);

    // One retry notice between each pair of checks
    BOOST_CHECK_EQUAL(reporter.infos.size(), 2u);
    BOOST_CHECK_EQUAL(reporter.infos.front(), "File size is not ready yet, waiting");
}

BOOST_AUTO_TEST_CASE(Deadline) {
    SizeWaiter waiter(reporter, milliseconds(10), milliseconds(50));
    const clock_type::time_point start = clock_type::now();
    try {
        waiter.wait(path, 5, token);
        BOOST_FAIL("SizeWaitTimeout expected");
    } catch (transfer::SizeWaitTimeout const& ex) {
        BOOST_CHECK_EQUAL(ex.status(), transfer::SIZE_WAIT_TIMEOUT);
    }
    const milliseconds elapsed = std::chrono::duration_cast<milliseconds>(clock_type::now() - start);
    BOOST_CHECK(elapsed >= milliseconds(50));
    BOOST_CHECK(elapsed <  milliseconds(5000));
    BOOST_CHECK(!reporter.infos.empty());
}

BOOST_AUTO_TEST_CASE(FileGrowsLater) {
    std::thread writer([this]() {
        std::this_thread::sleep_for(milliseconds(100));
        std::ofstream f(path.c_str(), std::ios::binary | std::ios::app);
        f << "de";
    });
    SizeWaiter waiter(reporter, milliseconds(20), milliseconds(10000));
    const unsigned int attempts = waiter.wait(path, 5, token);
    writer.join();

    BOOST_CHECK(attempts > 1u);
    BOOST_CHECK_EQUAL(reporter.infos.size(), attempts - 1);
}

BOOST_AUTO_TEST_CASE(CancelInterruptsSleep) {
    std::thread canceller([this]() {
        std::this_thread::sleep_for(milliseconds(100));
        token.cancel();
    });
    SizeWaiter waiter(reporter, milliseconds(60000), milliseconds(600000));
    const clock_type::time_point start = clock_type::now();
    BOOST_CHECK_THROW(waiter.wait(path, 5, token), transfer::TransferCancelled);
    canceller.join();

    BOOST_CHECK(clock_type::now() - start < milliseconds(30000));
    BOOST_CHECK(token.cancelled());
}

BOOST_AUTO_TEST_CASE(CancelledBeforeWait) {
    token.cancel();
    SizeWaiter waiter(reporter, milliseconds(10), milliseconds(1000));
    BOOST_CHECK_THROW(waiter.wait(path, 3, token), transfer::TransferCancelled);
    BOOST_CHECK(reporter.infos.empty());
}

BOOST_AUTO_TEST_CASE(MissingFile) {
    SizeWaiter waiter(reporter, milliseconds(10), milliseconds(1000));
    BOOST_CHECK_THROW(waiter.wait(dir.file("missing"), 3, token), transfer::MetadataError);
}

BOOST_AUTO_TEST_SUITE_END()
