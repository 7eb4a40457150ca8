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
#ifndef LSST_DSYNC_TRANSFER_CANCELLATIONTOKEN_H
#define LSST_DSYNC_TRANSFER_CANCELLATIONTOKEN_H

/// CancellationToken.h declares:
///
/// class CancellationToken
/// (see individual class documentation for more information)

// System headers

#include <chrono>
#include <condition_variable>
#include <mutex>

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Class CancellationToken lets one thread ask an operation blocked in
  * another thread to stop. The blocked operation sleeps through the token,
  * so that a cancellation wakes it up immediately.
  *
  * A cancelled token stays cancelled.
  */
class CancellationToken {

public:

    CancellationToken ();

    // Copy semantics are prohibited

    CancellationToken (CancellationToken const&) = delete;
    CancellationToken & operator= (CancellationToken const&) = delete;

    /// Request the cancellation and wake up all sleepers
    void cancel ();

    bool cancelled () const;

    /**
     * Sleep for the specified interval or until the token gets cancelled,
     * whichever comes first.
     *
     * @return 'true' if the token was cancelled
     */
    bool sleepFor (std::chrono::milliseconds interval) const;

private:

    mutable std::mutex _mtx;
    mutable std::condition_variable _cv;

    bool _cancelled;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_CANCELLATIONTOKEN_H
