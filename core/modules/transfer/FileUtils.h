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
#ifndef LSST_DSYNC_TRANSFER_FILEUTILS_H
#define LSST_DSYNC_TRANSFER_FILEUTILS_H

/// FileUtils.h declares:
///
/// class Reader
/// class Writer
/// class SourceFile
/// class DestinationFile
/// (see individual class documentation for more information)

// System headers

#include <sys/types.h>
#include <stdint.h>
#include <string>

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Class Reader is an abstract sequential source of bytes.
  */
class Reader {

public:

    virtual ~Reader () {}

    /**
     * Read at most sz bytes into buf. Return the number of bytes
     * actually read, or 0 at the end of the stream.
     */
    virtual size_t read (void *buf, size_t sz) = 0;
};

/**
  * Class Writer is an abstract sequential sink of bytes.
  */
class Writer {

public:

    virtual ~Writer () {}

    /**
     * Make one attempt to write sz bytes from buf. Return the number of
     * bytes actually accepted, which may be less than sz.
     */
    virtual size_t write (const void *buf, size_t sz) = 0;
};

/**
  * Class SourceFile is a read-only file whose size is captured once
  * when the file is opened.
  *
  * The constructor throws SourceOpenError, read() throws CopyError
  * and close() throws SourceCloseError.
  */
class SourceFile
    :   public Reader {

public:

    // Default construction and copy semantics are prohibited

    SourceFile () = delete;
    SourceFile (SourceFile const&) = delete;
    SourceFile & operator= (SourceFile const&) = delete;

    explicit SourceFile (const std::string &path);

    /// Close the file if it's still open
    ~SourceFile () override;

    const std::string& path () const { return _path; }

    /// Return the size of the file at the time it was opened.
    off_t size () const { return _sz; }

    size_t read (void *buf, size_t sz) override;

    /// Close the file. Subsequent calls have no effect.
    void close ();

private:

    std::string _path;
    int _fd;
    off_t _sz;
};

/**
  * Class DestinationFile is a write-only file which is created exclusively
  * (an existing file is never opened) and written synchronously: each
  * write is durable before it returns.
  *
  * The constructor throws DestinationCreateError, write() throws CopyError
  * and close() throws DestinationCloseError.
  */
class DestinationFile
    :   public Writer {

public:

    /// The permissions of newly created files
    static const mode_t defaultMode = 0600;

    // Default construction and copy semantics are prohibited

    DestinationFile () = delete;
    DestinationFile (DestinationFile const&) = delete;
    DestinationFile & operator= (DestinationFile const&) = delete;

    explicit DestinationFile (const std::string &path,
                              mode_t             mode = defaultMode);

    /// Close the file if it's still open
    ~DestinationFile () override;

    const std::string& path () const { return _path; }

    size_t write (const void *buf, size_t sz) override;

    /// Close the file. Subsequent calls have no effect.
    void close ();

private:

    std::string _path;
    int _fd;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_FILEUTILS_H
