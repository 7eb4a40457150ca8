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

#include "transfer/CancellationToken.h"

namespace lsst {
namespace dsync {
namespace transfer {

CancellationToken::CancellationToken ()
    :   _cancelled (false) {
}

void
CancellationToken::cancel () {
    {
        std::lock_guard<std::mutex> lock(_mtx);
        _cancelled = true;
    }
    _cv.notify_all();
}

bool
CancellationToken::cancelled () const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _cancelled;
}

bool
CancellationToken::sleepFor (std::chrono::milliseconds interval) const {
    std::unique_lock<std::mutex> lock(_mtx);
    return _cv.wait_for(lock, interval, [this]() { return _cancelled; });
}

}}} // namespace lsst::dsync::transfer
