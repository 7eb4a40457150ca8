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

#include "transfer/TransferError.h"

namespace lsst {
namespace dsync {
namespace transfer {

std::string
status2string (ExitStatus status) {
    switch (status) {
        case SUCCESS:                   return "SUCCESS";
        case USAGE_ERROR:               return "USAGE_ERROR";
        case SOURCE_OPEN_FAILED:        return "SOURCE_OPEN_FAILED";
        case DESTINATION_CREATE_FAILED: return "DESTINATION_CREATE_FAILED";
        case COPY_FAILED:               return "COPY_FAILED";
        case DESTINATION_CLOSE_FAILED:  return "DESTINATION_CLOSE_FAILED";
        case CHECKSUM_MISMATCH:         return "CHECKSUM_MISMATCH";
        case SIZE_WAIT_TIMEOUT:         return "SIZE_WAIT_TIMEOUT";
        case CHECKSUM_UNAVAILABLE:      return "CHECKSUM_UNAVAILABLE";
        case METADATA_FAILED:           return "METADATA_FAILED";
        case CANCELLED:                 return "CANCELLED";
        case UNEXPECTED_FAILURE:        return "UNEXPECTED_FAILURE";
    }
    throw std::logic_error("status2string - unhandled status: " + std::to_string(status));
}

}}} // namespace lsst::dsync::transfer
