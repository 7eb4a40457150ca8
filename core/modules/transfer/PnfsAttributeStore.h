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
#ifndef LSST_DSYNC_TRANSFER_PNFSATTRIBUTESTORE_H
#define LSST_DSYNC_TRANSFER_PNFSATTRIBUTESTORE_H

/// PnfsAttributeStore.h declares:
///
/// class PnfsAttributeStore
/// (see individual class documentation for more information)

// System headers

#include <string>

// Dsync headers

#include "transfer/AttributeStore.h"

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Class PnfsAttributeStore reads file attributes from the pseudo-files
  * which a pnfs/dCache namespace exposes next to each file. For a file
  * B in a directory D:
  *
  *   D/.(get)(B)(checksum)  - lines of "<TYPE>:<value>", e.g. "ADLER32:024d0127"
  *   D/.(id)(B)             - the unique identifier of the file
  */
class PnfsAttributeStore
    :   public AttributeStore {

public:

    /// The prefix of the line carrying the Adler-32 checksum
    static const char* const checksumPrefix;

    PnfsAttributeStore () = default;

    // Copy semantics are prohibited

    PnfsAttributeStore (PnfsAttributeStore const&) = delete;
    PnfsAttributeStore & operator= (PnfsAttributeStore const&) = delete;

    boost::optional<std::string> checksum (const std::string &path) override;

    std::string identifier (const std::string &path) override;

    /// Return the path of the checksum pseudo-file of a file
    static std::string checksumPath (const std::string &path);

    /// Return the path of the identifier pseudo-file of a file
    static std::string identifierPath (const std::string &path);
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_PNFSATTRIBUTESTORE_H
