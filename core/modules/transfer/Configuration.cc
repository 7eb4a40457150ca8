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

#include "transfer/Configuration.h"

// System headers

#include <fstream>
#include <stdexcept>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace lsst {
namespace dsync {
namespace transfer {

Configuration::Configuration (const std::string &configFile)
    :   _configFile      (configFile),
        _blockSizeBytes  (1024 * 1024),
        _waitIntervalSec (10),
        _waitTimeoutSec  (3600),
        _waitMaxAttempts (0),
        _recordFile      (),
        _logConfigFile   () {

    if (!_configFile.empty()) loadConfiguration();
}

Configuration::~Configuration () {
}

void
Configuration::loadConfiguration () {

    long long blockSizeBytes  = _blockSizeBytes;
    long long waitIntervalSec = _waitIntervalSec;
    long long waitTimeoutSec  = _waitTimeoutSec;
    long long waitMaxAttempts = _waitMaxAttempts;

    po::options_description opts;
    opts.add_options()
        ("transfer.block_size_bytes", po::value<long long>  (&blockSizeBytes) ->default_value(blockSizeBytes))
        ("wait.interval_sec",         po::value<long long>  (&waitIntervalSec)->default_value(waitIntervalSec))
        ("wait.timeout_sec",          po::value<long long>  (&waitTimeoutSec) ->default_value(waitTimeoutSec))
        ("wait.max_attempts",         po::value<long long>  (&waitMaxAttempts)->default_value(waitMaxAttempts))
        ("output.record_file",        po::value<std::string>(&_recordFile)    ->default_value(_recordFile))
        ("log.config_file",           po::value<std::string>(&_logConfigFile) ->default_value(_logConfigFile));

    std::ifstream f(_configFile.c_str());
    if (!f) throw std::runtime_error("Configuration - failed to open file: " + _configFile);

    try {
        po::variables_map vm;
        po::store(po::parse_config_file(f, opts), vm);
        po::notify(vm);
    } catch (po::error const& ex) {
        throw std::runtime_error("Configuration - error in file " + _configFile + ": " + ex.what());
    }
    _blockSizeBytes  = checkedUnsigned<size_t>      ("transfer.block_size_bytes", blockSizeBytes);
    _waitIntervalSec = checkedUnsigned<unsigned int>("wait.interval_sec",         waitIntervalSec);
    _waitTimeoutSec  = checkedUnsigned<unsigned int>("wait.timeout_sec",          waitTimeoutSec);
    _waitMaxAttempts = checkedUnsigned<unsigned int>("wait.max_attempts",         waitMaxAttempts);

    if (!_blockSizeBytes)
        throw std::runtime_error("Configuration - transfer.block_size_bytes can't be 0");
}

}}} // namespace lsst::dsync::transfer
