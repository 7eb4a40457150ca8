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

#include "transfer/TransferReporter.h"

// Dsync headers

#include "lsst/log/Log.h"
#include "transfer/TransferOutcome.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.dsync");

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

LogReporter::LogReporter (std::ostream *recordStream)
    :   _recordStream (recordStream) {
}

void
LogReporter::info (const std::string &msg) {
    LOGS(_log, LOG_LVL_INFO, msg);
}

void
LogReporter::warning (const std::string &msg) {
    LOGS(_log, LOG_LVL_WARN, msg);
}

void
LogReporter::error (const std::string &msg) {
    LOGS(_log, LOG_LVL_ERROR, msg);
}

void
LogReporter::record (const TransferOutcome &outcome) {
    const std::string line = outcome.toRecord();
    LOGS(_log, LOG_LVL_INFO, line);
    if (_recordStream) {
        *_recordStream << line << std::endl;
        if (!*_recordStream) {
            LOGS(_log, LOG_LVL_WARN, "failed to write the transfer record");
        }
    }
}

}}} // namespace lsst::dsync::transfer
