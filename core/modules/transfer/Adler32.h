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
#ifndef LSST_DSYNC_TRANSFER_ADLER32_H
#define LSST_DSYNC_TRANSFER_ADLER32_H

/// Adler32.h declares:
///
/// struct Adler32
/// (see individual class documentation for more information)

// System headers

#include <cstddef>
#include <cstdint>
#include <string>

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Struct Adler32 groups the operations on the running Adler-32 state
  * of a byte stream. The state is passed explicitly by the caller: it's
  * seeded with Adler32::seed, then folded with each block in the order
  * the blocks were read, and finally rendered into its textual form.
  */
struct Adler32 {

    /// The initial value of the state
    static const uint32_t seed = 1;

    /**
     * Fold a block of bytes into the state.
     *
     * @param state  - the current state
     * @param data   - a pointer to the block
     * @param length - the number of bytes in the block
     *
     * @return the new state
     */
    static uint32_t update (uint32_t    state,
                            const char *data,
                            size_t      length);

    /// Render the state as 8 lowercase hexadecimal digits
    static std::string finalize (uint32_t state);

    /**
     * Bring a checksum reported by some other party into the canonical form
     * produced by finalize(): surrounding whitespace and an optional "0x"
     * prefix are removed, letters are lower-cased, and shorter hexadecimal
     * strings are left-padded with zeros.
     */
    static std::string normalize (const std::string &checksum);

    /// Case-insensitive comparison of two checksums in their normalized form
    static bool equal (const std::string &lhs,
                       const std::string &rhs);
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_ADLER32_H
