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
#ifndef LSST_DSYNC_TRANSFER_SIZEWAITER_H
#define LSST_DSYNC_TRANSFER_SIZEWAITER_H

/// SizeWaiter.h declares:
///
/// class SizeWaiter
/// (see individual class documentation for more information)

// System headers

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

// Forward declarations

namespace lsst {
namespace dsync {
namespace transfer {

class CancellationToken;
class TransferReporter;

}}} // namespace lsst::dsync::transfer

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Class SizeWaiter blocks until a file reaches the expected size.
  *
  * A networked storage may report the full size of a freshly written file
  * only some time after the file was closed. The waiter polls the size of
  * the file at a fixed interval. The wait is bounded by a deadline, and
  * optionally by the number of checks, and it can be interrupted through
  * a CancellationToken.
  */
class SizeWaiter {

public:

    /// Returns the current size of a file
    typedef std::function<uint64_t(const std::string&)> SizeFunction;

    // Default construction and copy semantics are prohibited

    SizeWaiter () = delete;
    SizeWaiter (SizeWaiter const&) = delete;
    SizeWaiter & operator= (SizeWaiter const&) = delete;

    /**
     * Construct the object
     *
     * @param reporter    - for the retry notices
     * @param interval    - the pause between two checks
     * @param timeout     - the maximum duration of the wait
     * @param maxAttempts - the maximum number of checks (0 means no limit)
     * @param sizeOf      - the source of the file sizes (stat() by default)
     */
    SizeWaiter (TransferReporter          &reporter,
                std::chrono::milliseconds  interval,
                std::chrono::milliseconds  timeout,
                unsigned int               maxAttempts = 0,
                SizeFunction               sizeOf      = &SizeWaiter::fileSize);

    /**
     * Wait until the file has the expected size.
     *
     * The method will throw one of these exceptions:
     *
     *   SizeWaitTimeout
     *      the deadline passed, or the limit of checks was reached
     *
     *   TransferCancelled
     *      the token was cancelled
     *
     *   MetadataError
     *      the size of the file couldn't be obtained
     *
     * @return the number of checks made
     */
    unsigned int wait (const std::string       &path,
                       uint64_t                 expectedSize,
                       const CancellationToken &token) const;

    /// Return the current size of a file, or throw MetadataError
    static uint64_t fileSize (const std::string &path);

private:

    TransferReporter &_reporter;

    std::chrono::milliseconds _interval;
    std::chrono::milliseconds _timeout;

    unsigned int _maxAttempts;

    SizeFunction _sizeOf;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_SIZEWAITER_H
