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
  * @brief Unit tests for the configuration of the transfers.
  */

// System headers
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// Boost unit test header
#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE Configuration
#include "boost/test/unit_test.hpp"

// Dsync headers
#include "transfer/Configuration.h"
#include "transfer/Transfer.h"
#include "transfer/TransferMocks.h"

namespace transfer = lsst::dsync::transfer;

using transfer::Configuration;

struct ConfigFixture {
    transfer::TempDir dir;
};

BOOST_FIXTURE_TEST_SUITE(Suite, ConfigFixture)

BOOST_AUTO_TEST_CASE(Defaults) {
    Configuration config("");
    BOOST_CHECK_EQUAL(config.blockSizeBytes(),  1024u * 1024u);
    BOOST_CHECK_EQUAL(config.waitIntervalSec(), 10u);
    BOOST_CHECK_EQUAL(config.waitTimeoutSec(),  3600u);
    BOOST_CHECK_EQUAL(config.waitMaxAttempts(), 0u);
    BOOST_CHECK(config.recordFile().empty());
    BOOST_CHECK(config.logConfigFile().empty());
}

BOOST_AUTO_TEST_CASE(ParseFile) {
    const std::string file = dir.write("dsync.cfg",
        "# transfer tunables\n"
        "[transfer]\n"
        "block_size_bytes = 65536\n"
        "\n"
        "[wait]\n"
        "interval_sec = 2\n"
        "max_attempts = 30\n"
        "\n"
        "[output]\n"
        "record_file = /var/log/dsync.records\n");

    Configuration config(file);
    BOOST_CHECK_EQUAL(config.configFile(),      file);
    BOOST_CHECK_EQUAL(config.blockSizeBytes(),  65536u);
    BOOST_CHECK_EQUAL(config.waitIntervalSec(), 2u);
    BOOST_CHECK_EQUAL(config.waitTimeoutSec(),  3600u);
    BOOST_CHECK_EQUAL(config.waitMaxAttempts(), 30u);
    BOOST_CHECK_EQUAL(config.recordFile(),      "/var/log/dsync.records");

    const transfer::TransferParameters p = transfer::TransferParameters::fromConfiguration(config);
    BOOST_CHECK_EQUAL(p.blockSizeBytes, 65536u);
    BOOST_CHECK(p.waitInterval == std::chrono::seconds(2));
    BOOST_CHECK(p.waitTimeout  == std::chrono::seconds(3600));
    BOOST_CHECK_EQUAL(p.waitMaxAttempts, 30u);
}

BOOST_AUTO_TEST_CASE(UnknownKey) {
    const std::string file = dir.write("dsync.cfg", "[wait]\nforever = 1\n");
    BOOST_CHECK_THROW(Configuration config(file), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(BadValue) {
    const std::string file = dir.write("dsync.cfg", "[wait]\ntimeout_sec = soon\n");
    BOOST_CHECK_THROW(Configuration config(file), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ZeroBlockSize) {
    const std::string file = dir.write("dsync.cfg", "[transfer]\nblock_size_bytes = 0\n");
    BOOST_CHECK_THROW(Configuration config(file), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(NegativeValue) {
    const std::string timeout = dir.write("timeout.cfg", "[wait]\ntimeout_sec = -1\n");
    BOOST_CHECK_THROW(Configuration config(timeout), std::range_error);

    const std::string blockSize = dir.write("block.cfg", "[transfer]\nblock_size_bytes = -1\n");
    BOOST_CHECK_THROW(Configuration config(blockSize), std::range_error);
}

BOOST_AUTO_TEST_CASE(ValueTooLarge) {
    const std::string file = dir.write("dsync.cfg", "[wait]\nmax_attempts = 4294967296\n");
    BOOST_CHECK_THROW(Configuration config(file), std::range_error);
}

BOOST_AUTO_TEST_CASE(CheckedUnsigned) {
    BOOST_CHECK_EQUAL(transfer::checkedUnsigned<unsigned int>("n", 0),  0u);
    BOOST_CHECK_EQUAL(transfer::checkedUnsigned<unsigned int>("n", 42), 42u);
    BOOST_CHECK_EQUAL(transfer::checkedUnsigned<uint32_t>("n", std::numeric_limits<uint32_t>::max()),
                      std::numeric_limits<uint32_t>::max());
    BOOST_CHECK_THROW(transfer::checkedUnsigned<unsigned int>("n", -1), std::range_error);
    BOOST_CHECK_THROW(transfer::checkedUnsigned<uint16_t>("n", 65536), std::range_error);
}

BOOST_AUTO_TEST_CASE(MissingFile) {
    BOOST_CHECK_THROW(Configuration config(dir.file("missing.cfg")), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
