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

#include "transfer/Transfer.h"

// System headers

#include <stdexcept>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

// Dsync headers

#include "lsst/log/Log.h"
#include "transfer/Adler32.h"
#include "transfer/AttributeStore.h"
#include "transfer/CancellationToken.h"
#include "transfer/Configuration.h"
#include "transfer/FileUtils.h"
#include "transfer/SizeWaiter.h"
#include "transfer/TransferReporter.h"

namespace fs = boost::filesystem;

namespace {

LOG_LOGGER _log = LOG_GET("lsst.dsync.transfer.Transfer");

typedef std::chrono::steady_clock clock_type;

/// Return the absolute form of a path, or the path itself if the current
/// directory is not known
std::string absolutePath (const std::string &path) {
    boost::system::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (ec) return path;
    return fs::absolute(fs::path(path), cwd).string();
}

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

TransferParameters
TransferParameters::fromConfiguration (const Configuration &config) {
    TransferParameters p;
    p.blockSizeBytes  = config.blockSizeBytes();
    p.waitInterval    = std::chrono::seconds(config.waitIntervalSec());
    p.waitTimeout     = std::chrono::seconds(config.waitTimeoutSec());
    p.waitMaxAttempts = config.waitMaxAttempts();
    return p;
}

Transfer::Transfer (AttributeStore              &store,
                    TransferReporter            &reporter,
                    const TransferParameters    &parameters,
                    SizeWaiter::SizeFunction     sizeOf)
    :   _store      (store),
        _reporter   (reporter),
        _parameters (parameters),
        _sizeOf     (sizeOf),
        _outcome    () {

    if (!_parameters.blockSizeBytes)
        throw std::invalid_argument("Transfer - block size can't be 0");
}

ExitStatus
Transfer::run (const std::string       &source,
               const std::string       &destination,
               const CancellationToken &token) {

    LOGS(_log, LOG_LVL_DEBUG, "run  source: " << source << "  destination: " << destination);

    _reporter.info("Starting backup of " + source);

    bool created = false;
    try {
        TransferOutcome outcome = execute(source, destination, token, created);

        _outcome = outcome;
        _reporter.record(_outcome);
        _reporter.info("Copy of " + source + " to " + destination +
                       " complete in " + duration2string(_outcome.elapsed) +
                       " (" + size2string(_outcome.throughput()) + "/s)");
        return SUCCESS;

    } catch (TransferError const& ex) {
        _reporter.error(ex.what());
        if (created) removeDestination(destination);

        LOGS(_log, LOG_LVL_DEBUG, "run  status: " << status2string(ex.status()));
        return ex.status();

    } catch (std::exception const& ex) {
        _reporter.error(std::string("Unexpected failure: ") + ex.what());
        if (created) removeDestination(destination);
        throw;
    }
}

TransferOutcome
Transfer::execute (const std::string       &source,
                   const std::string       &destination,
                   const CancellationToken &token,
                   bool                    &created) {

    const clock_type::time_point start = clock_type::now();

    TransferOutcome outcome;
    outcome.source      = ::absolutePath(source);
    outcome.destination = destination;

    // Both files get closed when leaving the scope, including on failures.
    // The destination must be closed before the caller may remove it.
    {
        SourceFile in(source);
        outcome.size = static_cast<uint64_t>(in.size());

        DestinationFile out(destination);
        created = true;

        Copier copier(_parameters.blockSizeBytes);
        outcome.localChecksum = copier.copy(in, out);

        try {
            in.close();
        } catch (SourceCloseError const& ex) {
            _reporter.warning(ex.what());
        }
        out.close();
    }

    SizeWaiter waiter(_reporter,
                      _parameters.waitInterval,
                      _parameters.waitTimeout,
                      _parameters.waitMaxAttempts,
                      _sizeOf);
    waiter.wait(destination, outcome.size, token);

    const boost::optional<std::string> remoteChecksum = _store.checksum(destination);
    outcome.identifier = _store.identifier(destination);

    if (!remoteChecksum) throw ChecksumUnavailableError(destination);
    outcome.remoteChecksum = *remoteChecksum;

    if (!Adler32::equal(outcome.localChecksum, outcome.remoteChecksum)) {
        throw ChecksumMismatchError(outcome.localChecksum, outcome.remoteChecksum);
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                        clock_type::now() - start);
    return outcome;
}

void
Transfer::removeDestination (const std::string &destination) {
    boost::system::error_code ec;
    fs::remove(fs::path(destination), ec);
    if (ec) {
        _reporter.warning("Failed to remove destination " + destination + ": " + ec.message());
    } else {
        LOGS(_log, LOG_LVL_DEBUG, "removed  " << destination);
    }
}

}}} // namespace lsst::dsync::transfer
