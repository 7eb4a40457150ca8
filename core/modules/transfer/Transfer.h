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
#ifndef LSST_DSYNC_TRANSFER_TRANSFER_H
#define LSST_DSYNC_TRANSFER_TRANSFER_H

/// Transfer.h declares:
///
/// struct TransferParameters
/// class Transfer
/// (see individual class documentation for more information)

// System headers

#include <chrono>
#include <cstddef>
#include <string>

// Dsync headers

#include "transfer/Copier.h"
#include "transfer/SizeWaiter.h"
#include "transfer/TransferError.h"
#include "transfer/TransferOutcome.h"

// Forward declarations

namespace lsst {
namespace dsync {
namespace transfer {

class AttributeStore;
class CancellationToken;
class Configuration;
class TransferReporter;

}}} // namespace lsst::dsync::transfer

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
  * Struct TransferParameters carries the tunables of a transfer.
  */
struct TransferParameters {

    /// Make parameters out of a configuration
    static TransferParameters fromConfiguration (const Configuration &config);

    size_t blockSizeBytes = Copier::defaultBlockSize;

    std::chrono::milliseconds waitInterval {10 * 1000};
    std::chrono::milliseconds waitTimeout  {3600 * 1000};

    /// The limit of the size checks (0 - limited by the timeout only)
    unsigned int waitMaxAttempts = 0;
};

/**
  * Class Transfer copies a local file into a networked storage and verifies
  * the copy against the checksum computed by the storage:
  *
  *   - the source is opened and its size recorded
  *   - the destination is created exclusively (an existing file is never
  *     overwritten) and written synchronously
  *   - the data are copied while computing the Adler-32 checksum
  *   - both files are closed
  *   - the destination is expected to reach the size of the source
  *   - the checksum and the identifier of the destination are obtained
  *     from the storage
  *   - the checksums are compared
  *
  * A failure at any stage stops the transfer. When the destination has been
  * created by then, it's removed. Each stage reports its failures under its
  * own exit status.
  */
class Transfer {

public:

    // Default construction and copy semantics are prohibited

    Transfer () = delete;
    Transfer (Transfer const&) = delete;
    Transfer & operator= (Transfer const&) = delete;

    /**
     * Construct the object
     *
     * @param store      - the source of the remote attributes of the destination
     * @param reporter   - receives the progress messages, the errors and the success record
     * @param parameters - the tunables
     * @param sizeOf     - the source of the destination size observed by the
     *                     storage (stat() of the destination if not set)
     */
    Transfer (AttributeStore              &store,
              TransferReporter            &reporter,
              const TransferParameters    &parameters = TransferParameters(),
              SizeWaiter::SizeFunction     sizeOf     = SizeWaiter::SizeFunction());

    /**
     * Copy and verify a file.
     *
     * Failures of the transfer are reported through the reporter and
     * translated into the return value. Exceptions of other kinds (such
     * as std::bad_alloc) are propagated after removing the destination.
     *
     * @param source      - the path of the local file
     * @param destination - the path of the file to be created in the storage
     * @param token       - allows to cancel the wait for the storage
     *
     * @return the completion status
     */
    ExitStatus run (const std::string       &source,
                    const std::string       &destination,
                    const CancellationToken &token);

    /// The outcome of the last successful run
    const TransferOutcome& outcome () const { return _outcome; }

    const TransferParameters& parameters () const { return _parameters; }

private:

    /**
     * Carry out all stages of the transfer. Stage failures are thrown as
     * TransferError.
     *
     * @param created - set to 'true' as soon as the destination exists
     */
    TransferOutcome execute (const std::string       &source,
                             const std::string       &destination,
                             const CancellationToken &token,
                             bool                    &created);

    /// Remove the destination after a failure
    void removeDestination (const std::string &destination);

private:

    AttributeStore   &_store;
    TransferReporter &_reporter;

    TransferParameters _parameters;

    SizeWaiter::SizeFunction _sizeOf;

    TransferOutcome _outcome;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_TRANSFER_H
