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
#ifndef LSST_DSYNC_TRANSFER_TRANSFERMOCKS_H
#define LSST_DSYNC_TRANSFER_TRANSFERMOCKS_H

/// TransferMocks.h declares test doubles for the transfer tests:
///
/// class TempDir
/// class MemoryAttributeStore
/// class CapturingReporter

// System headers

#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

// Dsync headers

#include "transfer/AttributeStore.h"
#include "transfer/TransferError.h"
#include "transfer/TransferOutcome.h"
#include "transfer/TransferReporter.h"

namespace lsst {
namespace dsync {
namespace transfer {

/// A scratch directory which is removed with everything in it
class TempDir {
public:
    TempDir ()
        :   _path(boost::filesystem::temp_directory_path() /
                  boost::filesystem::unique_path("dsync-test-%%%%-%%%%-%%%%")) {
        boost::filesystem::create_directories(_path);
    }

    ~TempDir () {
        boost::system::error_code ec;
        boost::filesystem::remove_all(_path, ec);
    }

    TempDir (TempDir const&) = delete;
    TempDir & operator= (TempDir const&) = delete;

    std::string path () const { return _path.string(); }

    /// Return the path of a file in the directory
    std::string file (const std::string &name) const { return (_path / name).string(); }

    /// Create (or replace) a file with the specified content
    std::string write (const std::string &name,
                       const std::string &content) const {
        const std::string p = file(name);
        std::ofstream f(p.c_str(), std::ios::binary | std::ios::trunc);
        f << content;
        return p;
    }

    static std::string read (const std::string &path) {
        std::ifstream f(path.c_str(), std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }

    static bool exists (const std::string &path) {
        return boost::filesystem::exists(boost::filesystem::path(path));
    }

private:
    boost::filesystem::path _path;
};

/// An in-memory storage of the remote attributes
class MemoryAttributeStore
    :   public AttributeStore {

public:

    MemoryAttributeStore ()
        :   numChecksumCalls   (0),
            numIdentifierCalls (0),
            failing            (false) {}

    boost::optional<std::string> checksum (const std::string &path) override {
        ++numChecksumCalls;
        if (failing) throw MetadataError("storage is down");
        std::map<std::string, std::string>::const_iterator itr = checksums.find(path);
        if (itr == checksums.end()) return boost::none;
        return itr->second;
    }

    std::string identifier (const std::string &path) override {
        ++numIdentifierCalls;
        if (failing) throw MetadataError("storage is down");
        return identifiers[path];
    }

    std::map<std::string, std::string> checksums;
    std::map<std::string, std::string> identifiers;

    unsigned int numChecksumCalls;
    unsigned int numIdentifierCalls;

    /// Make all queries fail with MetadataError
    bool failing;
};

/// A reporter which keeps everything it's told
class CapturingReporter
    :   public TransferReporter {

public:

    void info    (const std::string &msg) override { infos.push_back(msg); }
    void warning (const std::string &msg) override { warnings.push_back(msg); }
    void error   (const std::string &msg) override { errors.push_back(msg); }

    void record (const TransferOutcome &outcome) override { records.push_back(outcome); }

    std::vector<std::string> infos;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    std::vector<TransferOutcome> records;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_TRANSFERMOCKS_H
