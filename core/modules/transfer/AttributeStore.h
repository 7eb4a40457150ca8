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
#ifndef LSST_DSYNC_TRANSFER_ATTRIBUTESTORE_H
#define LSST_DSYNC_TRANSFER_ATTRIBUTESTORE_H

/// AttributeStore.h declares:
///
/// class AttributeStore
/// (see individual class documentation for more information)

// System headers

#include <string>

#include <boost/optional.hpp>

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Class AttributeStore is an interface to the attributes which a remote
  * storage system computes for the files it holds.
  *
  * Implementations throw MetadataError when the storage can't be queried.
  */
class AttributeStore {

public:

    virtual ~AttributeStore () {}

    /**
     * Return the Adler-32 checksum of a file as reported by the storage,
     * or no value if the storage doesn't report one.
     */
    virtual boost::optional<std::string> checksum (const std::string &path) = 0;

    /// Return the unique identifier of a file within the storage
    virtual std::string identifier (const std::string &path) = 0;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_ATTRIBUTESTORE_H
