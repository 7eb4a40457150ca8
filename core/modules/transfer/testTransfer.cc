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
  * @brief Unit tests for the complete copy-and-verify transfer.
  */

// System headers
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

// Boost unit test header
#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE Transfer
#include "boost/test/unit_test.hpp"

#include <boost/filesystem.hpp>

// Dsync headers
#include "transfer/CancellationToken.h"
#include "transfer/PnfsAttributeStore.h"
#include "transfer/Transfer.h"
#include "transfer/TransferMocks.h"

namespace transfer = lsst::dsync::transfer;

using transfer::TempDir;
using transfer::Transfer;
using transfer::TransferParameters;

namespace {

TransferParameters fastParameters () {
    TransferParameters p;
    p.blockSizeBytes = 2;
    p.waitInterval   = std::chrono::milliseconds(1);
    p.waitTimeout    = std::chrono::milliseconds(200);
    return p;
}

} // namespace

struct TransferFixture {
    TransferFixture()
        :   src(dir.write("src", "abc")),
            dst(dir.file("dst")),
            job(store, reporter, fastParameters()) {
        store.identifiers[dst] = "0000ABCDEF";
    }

    TempDir dir;
    transfer::MemoryAttributeStore store;
    transfer::CapturingReporter reporter;
    transfer::CancellationToken token;
    std::string src;
    std::string dst;
    Transfer job;
};

BOOST_FIXTURE_TEST_SUITE(Suite, TransferFixture)

BOOST_AUTO_TEST_CASE(Success) {
    store.checksums[dst] = "024d0127";

    BOOST_CHECK_EQUAL(job.run(src, dst, token), transfer::SUCCESS);
    BOOST_CHECK_EQUAL(TempDir::read(dst), "abc");
    BOOST_CHECK(reporter.errors.empty());

    BOOST_REQUIRE_EQUAL(reporter.records.size(), 1u);
    const transfer::TransferOutcome &outcome = reporter.records.front();
    BOOST_CHECK_EQUAL(outcome.source,         src);
    BOOST_CHECK_EQUAL(outcome.destination,    dst);
    BOOST_CHECK_EQUAL(outcome.identifier,     "0000ABCDEF");
    BOOST_CHECK_EQUAL(outcome.localChecksum,  "024d0127");
    BOOST_CHECK_EQUAL(outcome.remoteChecksum, "024d0127");
    BOOST_CHECK_EQUAL(outcome.size,           3u);
    BOOST_CHECK_EQUAL(job.outcome().localChecksum, "024d0127");

    BOOST_REQUIRE(!reporter.infos.empty());
    BOOST_CHECK_EQUAL(reporter.infos.front(), "Starting backup of " + src);
    BOOST_CHECK(reporter.infos.back().find("Copy of " + src + " to " + dst + " complete in ") == 0);
}

BOOST_AUTO_TEST_CASE(RemoteChecksumInOtherCase) {
    store.checksums[dst] = "024D0127";
    BOOST_CHECK_EQUAL(job.run(src, dst, token), transfer::SUCCESS);
}

BOOST_AUTO_TEST_CASE(ChecksumMismatch) {
    store.checksums[dst] = "00000000";

    BOOST_CHECK_EQUAL(job.run(src, dst, token), transfer::CHECKSUM_MISMATCH);
    BOOST_CHECK(!TempDir::exists(dst));
    BOOST_CHECK(reporter.records.empty());
    BOOST_REQUIRE_EQUAL(reporter.errors.size(), 1u);
    BOOST_CHECK_EQUAL(reporter.errors.front(), "Checksum mismatch: <expected/actual> 024d0127/00000000");
}

BOOST_AUTO_TEST_CASE(ChecksumUnavailable) {
    BOOST_CHECK_EQUAL(job.run(src, dst, token), transfer::CHECKSUM_UNAVAILABLE);
    BOOST_CHECK(!TempDir::exists(dst));
    BOOST_CHECK(reporter.records.empty());
}

BOOST_AUTO_TEST_CASE(DestinationExists) {
    dir.write("dst", "precious");
    store.checksums[dst] = "024d0127";

    BOOST_CHECK_EQUAL(job.run(src, dst, token), transfer::DESTINATION_CREATE_FAILED);
    BOOST_CHECK_EQUAL(TempDir::read(dst), "precious");
    BOOST_CHECK_EQUAL(TempDir::read(src), "abc");
    BOOST_CHECK_EQUAL(store.numChecksumCalls,   0u);
    BOOST_CHECK_EQUAL(store.numIdentifierCalls, 0u);
    BOOST_CHECK_EQUAL(reporter.errors.size(), 1u);
}

BOOST_AUTO_TEST_CASE(SourceMissing) {
    BOOST_CHECK_EQUAL(job.run(dir.file("missing"), dst, token), transfer::SOURCE_OPEN_FAILED);
    BOOST_CHECK(!TempDir::exists(dst));
    BOOST_CHECK_EQUAL(store.numChecksumCalls, 0u);
}

BOOST_AUTO_TEST_CASE(MetadataFailure) {
    store.failing = true;
    BOOST_CHECK_EQUAL(job.run(src, dst, token), transfer::METADATA_FAILED);
    BOOST_CHECK(!TempDir::exists(dst));
}

BOOST_AUTO_TEST_CASE(Cancelled) {
    store.checksums[dst] = "024d0127";
    token.cancel();
    BOOST_CHECK_EQUAL(job.run(src, dst, token), transfer::CANCELLED);
    BOOST_CHECK(!TempDir::exists(dst));
    BOOST_CHECK_EQUAL(store.numChecksumCalls, 0u);
}

BOOST_AUTO_TEST_CASE(EmptySource) {
    const std::string empty = dir.write("empty", "");
    store.checksums[dst] = "00000001";
    BOOST_CHECK_EQUAL(job.run(empty, dst, token), transfer::SUCCESS);
    BOOST_CHECK_EQUAL(job.outcome().localChecksum, "00000001");
    BOOST_CHECK_EQUAL(job.outcome().size, 0u);
}

BOOST_AUTO_TEST_CASE(PnfsPseudoFiles) {

    // The local file system stands in for the storage namespace
    dir.write(".(get)(dst)(checksum)", "ADLER32:024d0127\n");
    dir.write(".(id)(dst)", "000012345678\n");

    transfer::PnfsAttributeStore pnfs;
    Transfer pnfsTransfer(pnfs, reporter, fastParameters());

    BOOST_CHECK_EQUAL(pnfsTransfer.run(src, dst, token), transfer::SUCCESS);
    BOOST_CHECK_EQUAL(pnfsTransfer.outcome().identifier, "000012345678");
    BOOST_CHECK_EQUAL(TempDir::read(dst), "abc");
}

BOOST_AUTO_TEST_CASE(CopyFailureRemovesDestination) {

    // A directory opens read-only, but reading it fails
    const std::string subdir = dir.file("subdir");
    boost::filesystem::create_directory(subdir);
    store.checksums[dst] = "024d0127";

    BOOST_CHECK_EQUAL(job.run(subdir, dst, token), transfer::COPY_FAILED);
    BOOST_CHECK(!TempDir::exists(dst));
    BOOST_CHECK(reporter.records.empty());
    BOOST_CHECK_EQUAL(reporter.errors.size(), 1u);
    BOOST_CHECK_EQUAL(store.numChecksumCalls,   0u);
    BOOST_CHECK_EQUAL(store.numIdentifierCalls, 0u);
}

BOOST_AUTO_TEST_CASE(WaitTimeoutRemovesDestination) {
    store.checksums[dst] = "024d0127";

    // The storage never shows more than a part of the file
    unsigned int numChecks = 0;
    TransferParameters p = fastParameters();
    p.waitMaxAttempts = 3;
    Transfer slowStorage(store, reporter, p,
                         [&numChecks](const std::string&) -> uint64_t { ++numChecks; return 1; });

    BOOST_CHECK_EQUAL(slowStorage.run(src, dst, token), transfer::SIZE_WAIT_TIMEOUT);
    BOOST_CHECK_EQUAL(numChecks, 3u);
    BOOST_CHECK(!TempDir::exists(dst));
    BOOST_CHECK(reporter.records.empty());
    BOOST_CHECK_EQUAL(store.numChecksumCalls, 0u);
}

BOOST_AUTO_TEST_CASE(StorageSizeShownLater) {
    store.checksums[dst] = "024d0127";

    unsigned int numChecks = 0;
    Transfer delayedStorage(store, reporter, fastParameters(),
                            [&numChecks](const std::string&) -> uint64_t {
                                return ++numChecks < 3 ? 0 : 3;
                            });

    BOOST_CHECK_EQUAL(delayedStorage.run(src, dst, token), transfer::SUCCESS);
    BOOST_CHECK_EQUAL(numChecks, 3u);
    BOOST_CHECK(TempDir::exists(dst));
}

BOOST_AUTO_TEST_CASE(UnexpectedFailureStatus) {
    BOOST_CHECK(transfer::UNEXPECTED_FAILURE != transfer::USAGE_ERROR);
    BOOST_CHECK_EQUAL(transfer::status2string(transfer::UNEXPECTED_FAILURE), "UNEXPECTED_FAILURE");
    BOOST_CHECK_EQUAL(transfer::status2string(transfer::USAGE_ERROR),        "USAGE_ERROR");
}

BOOST_AUTO_TEST_CASE(ZeroBlockSize) {
    TransferParameters p;
    p.blockSizeBytes = 0;
    BOOST_CHECK_THROW(Transfer(store, reporter, p), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
