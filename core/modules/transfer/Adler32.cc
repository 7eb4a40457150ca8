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

#include "transfer/Adler32.h"

// System headers

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <limits>
#include <zlib.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace {

/// The number of hexadecimal digits in a rendered checksum
const size_t numDigits = 8;

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

const uint32_t Adler32::seed;

uint32_t
Adler32::update (uint32_t    state,
                 const char *data,
                 size_t      length) {

    // The length argument of zlib is 'uInt', which may be narrower
    // than size_t. Larger blocks are folded in pieces.

    const size_t maxPiece = std::numeric_limits<uInt>::max();

    uLong result = state;
    while (length > 0) {
        const size_t piece = std::min(length, maxPiece);
        result = ::adler32(result,
                           reinterpret_cast<const Bytef*>(data),
                           static_cast<uInt>(piece));
        data   += piece;
        length -= piece;
    }
    return static_cast<uint32_t>(result & 0xffffffffUL);
}

std::string
Adler32::finalize (uint32_t state) {
    char buf[numDigits + 1];
    std::snprintf(buf, sizeof buf, "%08x", static_cast<unsigned int>(state));
    return std::string(buf);
}

std::string
Adler32::normalize (const std::string &checksum) {

    std::string result = boost::algorithm::to_lower_copy(
                            boost::algorithm::trim_copy(checksum));

    if (boost::algorithm::starts_with(result, "0x")) result.erase(0, 2);

    const bool isHex =
        !result.empty() &&
        std::all_of(result.begin(), result.end(),
                    [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });

    if (isHex && result.size() < ::numDigits)
        result.insert(0, ::numDigits - result.size(), '0');

    return result;
}

bool
Adler32::equal (const std::string &lhs,
                const std::string &rhs) {
    return normalize(lhs) == normalize(rhs);
}

}}} // namespace lsst::dsync::transfer
