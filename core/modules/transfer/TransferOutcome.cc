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

#include "transfer/TransferOutcome.h"

// System headers

#include <cstdio>
#include <sstream>

namespace {

const char* const sizeSuffix[] = {"", "KB", "MB", "GB", "TB"};
const int maxSuffix = 4;

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

std::string
size2string (double bytes) {
    if (bytes < 1) return "0";
    int f = 0;
    while (bytes >= 1024 && f < ::maxSuffix) {
        bytes /= 1024;
        ++f;
    }
    return std::to_string(static_cast<uint64_t>(bytes)) + ::sizeSuffix[f];
}

std::string
duration2string (std::chrono::microseconds duration) {
    const uint64_t total   = duration.count() < 0 ? 0 : duration.count();
    const uint64_t micros  = total % 1000000;
    const uint64_t seconds = total / 1000000;

    char buf[64];
    std::snprintf(buf, sizeof buf, "%llu:%02llu:%02llu.%06llu",
                  static_cast<unsigned long long>(seconds / 3600),
                  static_cast<unsigned long long>((seconds / 60) % 60),
                  static_cast<unsigned long long>(seconds % 60),
                  static_cast<unsigned long long>(micros));
    return std::string(buf);
}

double
TransferOutcome::throughput () const {

    // Transfers faster than the clock resolution are counted as 1 usec
    const double seconds = (elapsed.count() > 0 ? elapsed.count() : 1) / 1e6;
    return size / seconds;
}

std::string
TransferOutcome::toRecord () const {
    std::ostringstream ss;
    ss  << "source="       << source
        << " destination=" << destination
        << " id="          << identifier
        << " checksum="    << localChecksum
        << " size="        << size
        << " size_human="  << size2string(static_cast<double>(size))
        << " elapsed="     << duration2string(elapsed)
        << " throughput="  << size2string(throughput()) << "/s";
    return ss.str();
}

std::ostream&
operator<< (std::ostream &os, const TransferOutcome &outcome) {
    os  << "TransferOutcome ("
        << "source: "          << outcome.source         << ", "
        << "destination: "     << outcome.destination    << ", "
        << "identifier: "      << outcome.identifier     << ", "
        << "localChecksum: "   << outcome.localChecksum  << ", "
        << "remoteChecksum: "  << outcome.remoteChecksum << ", "
        << "size: "            << outcome.size           << ", "
        << "elapsed: "         << duration2string(outcome.elapsed) << ")";
    return os;
}

}}} // namespace lsst::dsync::transfer
