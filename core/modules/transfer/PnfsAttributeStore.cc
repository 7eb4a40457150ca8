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

#include "transfer/PnfsAttributeStore.h"

// System headers

#include <fstream>
#include <sstream>

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>

// Dsync headers

#include "lsst/log/Log.h"
#include "transfer/TransferError.h"

namespace fs = boost::filesystem;

namespace {

LOG_LOGGER _log = LOG_GET("lsst.dsync.transfer.PnfsAttributeStore");

/// Build the path of a pseudo-file in the directory of the file
std::string pseudoPath (const std::string &path,
                        const std::string &name) {
    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) dir = ".";
    return (dir / name).string();
}

/// Open a pseudo-file or throw MetadataError
void openPseudoFile (std::ifstream &f, const std::string &path) {
    f.open(path.c_str());
    if (!f) throw lsst::dsync::transfer::MetadataError("failed to open " + path);
}

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

const char* const PnfsAttributeStore::checksumPrefix = "ADLER32:";

std::string
PnfsAttributeStore::checksumPath (const std::string &path) {
    return ::pseudoPath(path, ".(get)(" + fs::path(path).filename().string() + ")(checksum)");
}

std::string
PnfsAttributeStore::identifierPath (const std::string &path) {
    return ::pseudoPath(path, ".(id)(" + fs::path(path).filename().string() + ")");
}

boost::optional<std::string>
PnfsAttributeStore::checksum (const std::string &path) {

    const std::string pseudoFile = checksumPath(path);
    LOGS(_log, LOG_LVL_DEBUG, "checksum  " << pseudoFile);

    std::ifstream f;
    ::openPseudoFile(f, pseudoFile);

    const std::string prefix(checksumPrefix);

    std::string line;
    while (std::getline(f, line)) {
        const std::string::size_type pos = line.find(prefix);
        if (pos != std::string::npos) {
            return boost::algorithm::trim_copy(line.substr(pos + prefix.size()));
        }
    }
    if (f.bad()) throw MetadataError("failed to read " + pseudoFile);
    return boost::none;
}

std::string
PnfsAttributeStore::identifier (const std::string &path) {

    const std::string pseudoFile = identifierPath(path);
    LOGS(_log, LOG_LVL_DEBUG, "identifier  " << pseudoFile);

    std::ifstream f;
    ::openPseudoFile(f, pseudoFile);

    std::ostringstream content;
    content << f.rdbuf();
    if (f.bad()) throw MetadataError("failed to read " + pseudoFile);

    return boost::algorithm::trim_copy(content.str());
}

}}} // namespace lsst::dsync::transfer
