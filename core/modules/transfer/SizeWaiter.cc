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

// Class header

#include "transfer/SizeWaiter.h"

// System headers

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

// Dsync headers

#include "lsst/log/Log.h"
#include "transfer/CancellationToken.h"
#include "transfer/TransferError.h"
#include "transfer/TransferReporter.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.dsync.transfer.SizeWaiter");

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

uint64_t
SizeWaiter::fileSize (const std::string &path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throw MetadataError("stat() failed for " + path + ": " + std::strerror(errno));
    }
    return static_cast<uint64_t>(st.st_size);
}

SizeWaiter::SizeWaiter (TransferReporter          &reporter,
                        std::chrono::milliseconds  interval,
                        std::chrono::milliseconds  timeout,
                        unsigned int               maxAttempts,
                        SizeFunction               sizeOf)
    :   _reporter    (reporter),
        _interval    (interval),
        _timeout     (timeout),
        _maxAttempts (maxAttempts),
        _sizeOf      (sizeOf) {

    if (!_sizeOf) _sizeOf = &SizeWaiter::fileSize;
}

unsigned int
SizeWaiter::wait (const std::string       &path,
                  uint64_t                 expectedSize,
                  const CancellationToken &token) const {

    typedef std::chrono::steady_clock clock;

    const clock::time_point deadline = clock::now() + _timeout;

    unsigned int attempts = 0;
    while (true) {

        if (token.cancelled()) throw TransferCancelled();

        ++attempts;
        const uint64_t size = _sizeOf(path);

        LOGS(_log, LOG_LVL_DEBUG, "wait  path: " << path
             << "  attempt: "  << attempts
             << "  size: "     << size
             << "  expected: " << expectedSize);

        if (size == expectedSize) return attempts;

        const std::string state =
            "size " + std::to_string(size) + " of " + std::to_string(expectedSize) +
            " bytes after " + std::to_string(attempts) + " check(s) of " + path;

        if (_maxAttempts && attempts >= _maxAttempts) throw SizeWaitTimeout(state);

        const clock::time_point now = clock::now();
        if (now >= deadline) throw SizeWaitTimeout(state);

        const std::chrono::milliseconds remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        _reporter.info("File size is not ready yet, waiting");

        if (token.sleepFor(std::min(_interval, remaining))) throw TransferCancelled();
    }
}

}}} // namespace lsst::dsync::transfer
