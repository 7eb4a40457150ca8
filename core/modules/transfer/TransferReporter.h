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
#ifndef LSST_DSYNC_TRANSFER_TRANSFERREPORTER_H
#define LSST_DSYNC_TRANSFER_TRANSFERREPORTER_H

/// TransferReporter.h declares:
///
/// class TransferReporter
/// class LogReporter
/// (see individual class documentation for more information)

// System headers

#include <ostream>
#include <string>

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

struct TransferOutcome;

/**
  * Class TransferReporter is the interface through which a transfer
  * tells the outside world about its progress, its failures and its
  * final outcome.
  */
class TransferReporter {

public:

    virtual ~TransferReporter () {}

    virtual void info    (const std::string &msg) = 0;
    virtual void warning (const std::string &msg) = 0;
    virtual void error   (const std::string &msg) = 0;

    /// Deliver the record of a successful transfer
    virtual void record (const TransferOutcome &outcome) = 0;
};

/**
  * Class LogReporter sends messages into the "lsst.dsync" logger. The success
  * records are logged as well, and also appended to an optional stream
  * (one record per line).
  */
class LogReporter
    :   public TransferReporter {

public:

    // Copy semantics are prohibited

    LogReporter (LogReporter const&) = delete;
    LogReporter & operator= (LogReporter const&) = delete;

    /**
     * Construct the object
     *
     * @param recordStream - the optional stream for the success records
     *                       (the reporter doesn't take the ownership)
     */
    explicit LogReporter (std::ostream *recordStream = nullptr);

    void info    (const std::string &msg) override;
    void warning (const std::string &msg) override;
    void error   (const std::string &msg) override;

    void record (const TransferOutcome &outcome) override;

private:

    std::ostream *_recordStream;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_TRANSFERREPORTER_H
