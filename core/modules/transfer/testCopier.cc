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
  * @brief Unit tests for the Copier.
  */

// System headers
#include <algorithm>
#include <stdexcept>
#include <string>

// Boost unit test header
#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE Copier
#include "boost/test/unit_test.hpp"

// Dsync headers
#include "transfer/Adler32.h"
#include "transfer/Copier.h"
#include "transfer/FileUtils.h"
#include "transfer/TransferError.h"
#include "transfer/TransferMocks.h"

namespace transfer = lsst::dsync::transfer;

using transfer::Adler32;
using transfer::Copier;
using transfer::DestinationFile;
using transfer::SourceFile;
using transfer::TempDir;

namespace {

/// Serves a string in pieces, counting the reads
struct StringReader : transfer::Reader {
    explicit StringReader (const std::string &data) : data(data), offset(0), numReads(0) {}

    size_t read (void *buf, size_t sz) override {
        ++numReads;
        const size_t n = std::min(sz, data.size() - offset);
        data.copy(static_cast<char*>(buf), n, offset);
        offset += n;
        return n;
    }
    std::string data;
    size_t offset;
    unsigned int numReads;
};

/// Accepts at most 'limit' bytes per write
struct ShortWriter : transfer::Writer {
    explicit ShortWriter (size_t limit) : limit(limit), numWrites(0) {}

    size_t write (const void *buf, size_t sz) override {
        ++numWrites;
        const size_t n = std::min(sz, limit);
        received.append(static_cast<const char*>(buf), n);
        return n;
    }
    size_t limit;
    unsigned int numWrites;
    std::string received;
};

std::string makeContent (size_t size) {
    std::string s(size, '\0');
    for (size_t i = 0; i < size; ++i) s[i] = static_cast<char>((i * 31 + 7) & 0xff);
    return s;
}

} // namespace

struct CopierFixture {
    TempDir dir;
};

BOOST_FIXTURE_TEST_SUITE(Suite, CopierFixture)

BOOST_AUTO_TEST_CASE(CopyIsIdentical) {
    const std::string content = makeContent(10000);
    const std::string src = dir.write("src", content);
    const std::string dst = dir.file("dst");

    std::string checksum;
    {
        SourceFile in(src);
        BOOST_CHECK_EQUAL(in.size(), 10000);
        DestinationFile out(dst);
        Copier copier(777);
        checksum = copier.copy(in, out);
        BOOST_CHECK_EQUAL(copier.bytesCopied(), 10000u);
        in.close();
        out.close();
    }
    BOOST_CHECK(TempDir::read(dst) == content);
    BOOST_CHECK_EQUAL(checksum,
                      Adler32::finalize(Adler32::update(Adler32::seed, content.data(), content.size())));
}

BOOST_AUTO_TEST_CASE(EmptySource) {
    StringReader in("");
    ShortWriter out(1024);
    Copier copier;
    BOOST_CHECK_EQUAL(copier.copy(in, out), "00000001");
    BOOST_CHECK_EQUAL(copier.bytesCopied(), 0u);
    BOOST_CHECK_EQUAL(out.numWrites, 0u);
}

BOOST_AUTO_TEST_CASE(SmallInput) {
    StringReader in("abc");
    ShortWriter out(1024);
    Copier copier;
    BOOST_CHECK_EQUAL(copier.copy(in, out), "024d0127");
    BOOST_CHECK_EQUAL(out.received, "abc");
}

BOOST_AUTO_TEST_CASE(ShortWriteStopsCopy) {
    StringReader in(makeContent(100));
    ShortWriter out(5);
    Copier copier(10);
    BOOST_CHECK_THROW(copier.copy(in, out), transfer::ShortWriteError);

    // Nothing past the first block was read or written
    BOOST_CHECK_EQUAL(in.numReads, 1u);
    BOOST_CHECK_EQUAL(out.numWrites, 1u);
    BOOST_CHECK_EQUAL(out.received.size(), 5u);
    BOOST_CHECK_EQUAL(copier.bytesCopied(), 0u);
}

BOOST_AUTO_TEST_CASE(ShortWriteIsCopyError) {
    StringReader in("abc");
    ShortWriter out(2);
    Copier copier;
    try {
        copier.copy(in, out);
        BOOST_FAIL("ShortWriteError expected");
    } catch (transfer::CopyError const& ex) {
        BOOST_CHECK_EQUAL(ex.status(), transfer::COPY_FAILED);
    }
}

BOOST_AUTO_TEST_CASE(ZeroBlockSize) {
    BOOST_CHECK_THROW(Copier(0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(ExclusiveCreate) {
    const std::string dst = dir.write("dst", "precious");
    BOOST_CHECK_THROW(DestinationFile out(dst), transfer::DestinationCreateError);
    BOOST_CHECK_EQUAL(TempDir::read(dst), "precious");
}

BOOST_AUTO_TEST_CASE(MissingSource) {
    BOOST_CHECK_THROW(SourceFile in(dir.file("missing")), transfer::SourceOpenError);
}

BOOST_AUTO_TEST_SUITE_END()
