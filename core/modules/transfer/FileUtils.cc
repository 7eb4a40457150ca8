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

#include "transfer/FileUtils.h"

// System headers

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// Dsync headers

#include "lsst/log/Log.h"
#include "transfer/TransferError.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.dsync.transfer.FileUtils");

/// Describe the error of the last system call
std::string lastError (const std::string &call,
                       const std::string &path) {
    return call + "() failed for " + path + ": " + std::strerror(errno);
}

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

////////////////////////////////////////////////////////////
///////////////////////// SourceFile ///////////////////////
////////////////////////////////////////////////////////////

SourceFile::SourceFile (const std::string &path)
    :   _path (path),
        _fd   (-1),
        _sz   (-1) {

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd == -1) throw SourceOpenError(::lastError("open", path));

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        const std::string msg = ::lastError("fstat", path);
        ::close(fd);
        throw SourceOpenError(msg);
    }
    _fd = fd;
    _sz = st.st_size;
}

SourceFile::~SourceFile () {
    if (_fd != -1 && ::close(_fd) != 0) {
        LOGS(_log, LOG_LVL_WARN, ::lastError("close", _path));
    }
}

size_t
SourceFile::read (void *buf, size_t sz) {
    while (true) {
        ssize_t n = ::read(_fd, buf, sz);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno != EINTR) throw CopyError(::lastError("read", _path));
    }
}

void
SourceFile::close () {
    if (_fd == -1) return;
    int fd = _fd;
    _fd = -1;
    if (::close(fd) != 0) throw SourceCloseError(::lastError("close", _path));
}

/////////////////////////////////////////////////////////////
/////////////////////// DestinationFile /////////////////////
/////////////////////////////////////////////////////////////

const mode_t DestinationFile::defaultMode;

DestinationFile::DestinationFile (const std::string &path,
                                  mode_t             mode)
    :   _path (path),
        _fd   (-1) {

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_SYNC, mode);
    if (fd == -1) throw DestinationCreateError(::lastError("open", path));
    _fd = fd;
}

DestinationFile::~DestinationFile () {
    if (_fd != -1 && ::close(_fd) != 0) {
        LOGS(_log, LOG_LVL_WARN, ::lastError("close", _path));
    }
}

size_t
DestinationFile::write (const void *buf, size_t sz) {
    while (true) {
        ssize_t n = ::write(_fd, buf, sz);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno != EINTR) throw CopyError(::lastError("write", _path));
    }
}

void
DestinationFile::close () {
    if (_fd == -1) return;
    int fd = _fd;
    _fd = -1;
    if (::close(fd) != 0) throw DestinationCloseError(::lastError("close", _path));
}

}}} // namespace lsst::dsync::transfer
