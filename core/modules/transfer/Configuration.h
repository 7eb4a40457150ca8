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
#ifndef LSST_DSYNC_TRANSFER_CONFIGURATION_H
#define LSST_DSYNC_TRANSFER_CONFIGURATION_H

/// Configuration.h declares:
///
/// class Configuration
/// (see individual class documentation for more information)

// System headers

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

// This header declarations

namespace lsst {
namespace dsync {
namespace transfer {

/**
 * Convert a value of a parameter into an unsigned type. Values are read as
 * signed numbers so that negative ones get rejected instead of wrapping
 * around.
 *
 * The function will throw std::range_error if the value doesn't fit the type.
 */
template <typename T>
T checkedUnsigned (const std::string &key,
                   long long          value) {
    if (value < 0 ||
        static_cast<unsigned long long>(value) >
        static_cast<unsigned long long>(std::numeric_limits<T>::max()))
        throw std::range_error("parameter '" + key + "' is out of range: " + std::to_string(value));
    return static_cast<T>(value);
}

/**
  * Class Configuration provides the parameters of the transfers.
  *
  * The parameters are read from an optional INI-style configuration file:
  *
  *   [transfer]
  *   block_size_bytes = 1048576
  *
  *   [wait]
  *   interval_sec = 10
  *   timeout_sec  = 3600
  *   max_attempts = 0
  *
  *   [output]
  *   record_file = /var/log/dsync.records
  *
  *   [log]
  *   config_file = /etc/dsync/log4cxx.properties
  *
  * Parameters missing in the file get their default values. Unknown keys
  * are rejected.
  */
class Configuration {

public:

    // Default construction and copy semantics are prohibited

    Configuration () = delete;
    Configuration (Configuration const&) = delete;
    Configuration & operator= (Configuration const&) = delete;

    /**
     * Construct the object
     *
     * The constructor will throw std::runtime_error if the file can't be
     * read or if its content is not valid.
     *
     * @param configFile - the name of a configuration file (an empty
     *                     string means the default values of all parameters)
     */
    explicit Configuration (const std::string &configFile);

    ~Configuration ();

    const std::string& configFile () const { return _configFile; }

    /// The size of the data blocks used for copying
    size_t blockSizeBytes () const { return _blockSizeBytes; }

    /// The pause between two checks of the destination size
    unsigned int waitIntervalSec () const { return _waitIntervalSec; }

    /// The maximum duration of the wait for the destination size
    unsigned int waitTimeoutSec () const { return _waitTimeoutSec; }

    /// The maximum number of checks of the destination size (0 - no limit)
    unsigned int waitMaxAttempts () const { return _waitMaxAttempts; }

    /// The file where the success records are appended (empty - none)
    const std::string& recordFile () const { return _recordFile; }

    /// The configuration of the logger (empty - the default one)
    const std::string& logConfigFile () const { return _logConfigFile; }

private:

    /**
     * Parse the configuration file and initialize the cache of parameters.
     *
     * The method will throw one of these exceptions:
     *
     *   std::runtime_error
     *      the configuration is not consistent with expectations of the application
     */
    void loadConfiguration ();

private:

    // Parameters of the object

    const std::string _configFile;

    // Cached values of the parameters

    size_t       _blockSizeBytes;
    unsigned int _waitIntervalSec;
    unsigned int _waitTimeoutSec;
    unsigned int _waitMaxAttempts;

    std::string _recordFile;
    std::string _logConfigFile;
};

}}} // namespace lsst::dsync::transfer

#endif // LSST_DSYNC_TRANSFER_CONFIGURATION_H
