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
#ifndef LSST_DSYNC_TRANSFER_COPIER_H
#define LSST_DSYNC_TRANSFER_COPIER_H

/// Copier.h declares:
///
/// class Copier
/// (see individual class documentation for more information)

// System headers

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Forward declarations

namespace lsst {
namespace dsync {
namespace transfer {

class Reader;
class Writer;

}}} // namespace lsst::dsync::transfer

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Class Copier streams bytes from a source into a destination block by
  * block, and computes the Adler-32 checksum of the stream on the fly.
  *
  * Each block read from the source is folded into the checksum and then
  * written into the destination with one write attempt. If the destination
  * accepts fewer bytes than the block has, the copy stops with ShortWriteError.
  */
class Copier {

public:

    /// The default size of the data blocks (1 MiB)
    static const size_t defaultBlockSize = 1024 * 1024;

    // Copy semantics are prohibited

    Copier (Copier const&) = delete;
    Copier & operator= (Copier const&) = delete;

    /**
     * Construct the object
     *
     * @param blockSize - the number of bytes to read in one go (must not be 0)
     */
    explicit Copier (size_t blockSize = defaultBlockSize);

    size_t blockSize () const { return _buffer.size(); }

    /// The number of bytes transferred by the last call to copy()
    uint64_t bytesCopied () const { return _bytesCopied; }

    /**
     * Copy everything from the source into the destination.
     *
     * The method will throw one of these exceptions:
     *
     *   CopyError
     *      reading or writing failed
     *
     *   ShortWriteError
     *      the destination didn't accept a whole block
     *
     * @return the checksum of the copied bytes as 8 hexadecimal digits
     */
    std::string copy (Reader &source,
                      Writer &destination);

private:

    std::vector<char> _buffer;

    uint64_t _bytesCopied;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_COPIER_H
