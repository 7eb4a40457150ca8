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
#ifndef LSST_DSYNC_TRANSFER_TRANSFEROUTCOME_H
#define LSST_DSYNC_TRANSFER_TRANSFEROUTCOME_H

/// TransferOutcome.h declares:
///
/// struct TransferOutcome
/// (see individual class documentation for more information)

// System headers

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
 * Return a human-readable form of a number of bytes, e.g. 8192 => "8KB".
 * The unit is chosen by the integer logarithm base 1024 of the value
 * (no larger than TB), and the integer part of the scaled value is printed.
 */
std::string size2string (double bytes);

/// Return the duration in the form H:MM:SS.ffffff
std::string duration2string (std::chrono::microseconds duration);

/**
  * Struct TransferOutcome is the record of a successful transfer.
  */
struct TransferOutcome {

    /// The absolute path of the source
    std::string source;

    std::string destination;

    /// The unique identifier assigned to the file by the remote storage
    std::string identifier;

    /// The checksum computed while copying
    std::string localChecksum;

    /// The checksum reported by the remote storage
    std::string remoteChecksum;

    uint64_t size = 0;

    std::chrono::microseconds elapsed {0};

    /// Bytes per second
    double throughput () const;

    /**
     * Return the structured one-line form of the record:
     *
     *   source=.. destination=.. id=.. checksum=.. size=.. size_human=.. elapsed=.. throughput=../s
     */
    std::string toRecord () const;
};

/// Overloaded streaming operator for type TransferOutcome
std::ostream& operator<< (std::ostream &os, const TransferOutcome &outcome);

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_TRANSFEROUTCOME_H
