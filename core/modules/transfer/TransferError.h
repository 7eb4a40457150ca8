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

/**
  * @file
  *
  * @brief Run-time errors of the file transfer stages.
  */

#ifndef LSST_DSYNC_TRANSFER_TRANSFERERROR_H
#define LSST_DSYNC_TRANSFER_TRANSFERERROR_H

// System headers

#include <stdexcept>
#include <string>

namespace lsst {
namespace dsync {
namespace transfer {

/// Exit statuses of the transfer. Each terminal failure has its own code.
enum ExitStatus {
    SUCCESS                   = 0,
    USAGE_ERROR               = 1,
    SOURCE_OPEN_FAILED        = 2,
    DESTINATION_CREATE_FAILED = 3,
    COPY_FAILED               = 4,
    DESTINATION_CLOSE_FAILED  = 5,
    CHECKSUM_MISMATCH         = 6,
    SIZE_WAIT_TIMEOUT         = 7,
    CHECKSUM_UNAVAILABLE      = 8,
    METADATA_FAILED           = 9,
    CANCELLED                 = 10,
    UNEXPECTED_FAILURE        = 11
};

/// Return the string representation of the status
std::string status2string (ExitStatus status);

/**
 * Base class for all transfer run-time errors
 */
class TransferError : public std::runtime_error {
public:
    ExitStatus status () const { return _status; }

protected:
    TransferError (ExitStatus status, std::string const& msg)
        : std::runtime_error(msg),
          _status(status) {}

private:
    ExitStatus _status;
};

/**
 * The source file can't be opened or examined.
 */
class SourceOpenError : public TransferError {
public:
    explicit SourceOpenError (std::string const& msg)
        : TransferError(SOURCE_OPEN_FAILED, "Failed to open source file: " + msg) {}
};

/**
 * The destination file can't be created (including the case when
 * it already exists).
 */
class DestinationCreateError : public TransferError {
public:
    explicit DestinationCreateError (std::string const& msg)
        : TransferError(DESTINATION_CREATE_FAILED, "Failed to create destination file: " + msg) {}
};

/**
 * Reading the source or writing the destination failed.
 */
class CopyError : public TransferError {
public:
    explicit CopyError (std::string const& msg)
        : TransferError(COPY_FAILED, "Failed to copy: " + msg) {}
};

/**
 * Fewer bytes were written into the destination than read from the source.
 */
class ShortWriteError : public CopyError {
public:
    ShortWriteError (size_t expected, size_t written)
        : CopyError("Short write: " + std::to_string(written) + " of " +
                    std::to_string(expected) + " bytes") {}
};

/**
 * Closing the source failed. Never fatal: the source has been read completely
 * by the time it's closed.
 */
class SourceCloseError : public std::runtime_error {
public:
    explicit SourceCloseError (std::string const& msg)
        : std::runtime_error("Failed to close source: " + msg) {}
};

class DestinationCloseError : public TransferError {
public:
    explicit DestinationCloseError (std::string const& msg)
        : TransferError(DESTINATION_CLOSE_FAILED, "Failed to close destination: " + msg) {}
};

/**
 * The destination didn't reach the expected size within the allowed
 * time or number of attempts.
 */
class SizeWaitTimeout : public TransferError {
public:
    explicit SizeWaitTimeout (std::string const& msg)
        : TransferError(SIZE_WAIT_TIMEOUT, "Timed out waiting for destination size: " + msg) {}
};

/**
 * The remote storage metadata (size, sidecar pseudo-files) can't be read.
 */
class MetadataError : public TransferError {
public:
    explicit MetadataError (std::string const& msg)
        : TransferError(METADATA_FAILED, "Failed to read remote metadata: " + msg) {}
};

/**
 * The remote storage didn't report an Adler-32 checksum for the destination.
 */
class ChecksumUnavailableError : public TransferError {
public:
    explicit ChecksumUnavailableError (std::string const& path)
        : TransferError(CHECKSUM_UNAVAILABLE, "No ADLER32 checksum reported for " + path) {}
};

class ChecksumMismatchError : public TransferError {
public:
    ChecksumMismatchError (std::string const& expected, std::string const& actual)
        : TransferError(CHECKSUM_MISMATCH,
                        "Checksum mismatch: <expected/actual> " + expected + "/" + actual) {}
};

/// Thrown when a transfer is cancelled while waiting on the remote storage
class TransferCancelled : public TransferError {
public:
    TransferCancelled ()
        : TransferError(CANCELLED, "cancelled") {}
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_TRANSFERERROR_H
