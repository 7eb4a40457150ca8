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

/// \file
/// \brief Copy a local file into a pnfs/dCache namespace and verify
///        the copy against the checksum computed by the storage.

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "boost/program_options.hpp"

#include "lsst/log/Log.h"
#include "transfer/CancellationToken.h"
#include "transfer/Configuration.h"
#include "transfer/PnfsAttributeStore.h"
#include "transfer/Transfer.h"
#include "transfer/TransferReporter.h"

namespace po = boost::program_options;
namespace dt = lsst::dsync::transfer;

namespace {

LOG_LOGGER _log = LOG_GET("lsst.dsync");

char const * const help =
    "Copies <source> into <destination>, where <destination> is a new file\n"
    "in a pnfs/dCache namespace. The data are checksummed (Adler-32) while\n"
    "being copied, and the checksum is verified against the one computed\n"
    "by the storage. An existing destination is never overwritten.\n"
    "\n"
    "Exit statuses:\n"
    "  0 success, 1 usage, 2 source open, 3 destination create, 4 copy,\n"
    "  5 destination close, 6 checksum mismatch, 7 size wait timeout,\n"
    "  8 checksum unavailable, 9 remote metadata, 10 cancelled,\n"
    "  11 unexpected failure";

/// Define the options of the tool and parse the command line. Returns
/// 'false' if the program should exit without doing a transfer.
bool parseCommandLine (po::variables_map &vm,
                       int                argc,
                       char const * const *argv) {

    po::options_description common("\\_____________________ Common", 80);
    common.add_options()
        ("help,h",
         "Demystify program usage.")
        ("verbose,v",
         "Chatty output.")
        ("config-file,c", po::value<std::string>(),
         "The name of an INI-style configuration file. Command line options "
         "take precedence over the values found in the file.")
        ("log-config", po::value<std::string>(),
         "The name of a log4cxx configuration file for the logger.");

    po::options_description transfer("\\___________________ Transfer", 80);
    transfer.add_options()
        ("record-file,o", po::value<std::string>(),
         "Append the record of a successful transfer to this file.")
        ("block-size", po::value<long long>(),
         "The number of bytes to read and write in one go (default: 1048576).")
        ("wait-interval", po::value<long long>(),
         "Seconds between two checks of the destination size (default: 10).")
        ("wait-timeout", po::value<long long>(),
         "The maximum number of seconds to wait for the destination to reach "
         "the size of the source (default: 3600).")
        ("wait-attempts", po::value<long long>(),
         "The maximum number of checks of the destination size "
         "(default: 0, no limit other than the timeout).");

    po::options_description hidden;
    hidden.add_options()
        ("source",      po::value<std::string>(), "")
        ("destination", po::value<std::string>(), "");

    po::positional_options_description positional;
    positional.add("source", 1).add("destination", 1);

    po::options_description all;
    all.add(common).add(transfer).add(hidden);

    po::options_description visible;
    visible.add(common).add(transfer);

    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    po::notify(vm);

    if (vm.count("help") != 0) {
        std::cout << argv[0] << " [options] <source> <destination>\n\n"
                  << help << "\n" << visible << std::endl;
        return false;
    }
    if (vm.count("source") == 0 || vm.count("destination") == 0) {
        throw po::error("both <source> and <destination> are required");
    }
    return true;
}

/// Configure the logger. The verbose mode lowers the threshold to DEBUG.
void configureLogging (const std::string &logConfigFile,
                       bool               verbose) {
    if (logConfigFile.empty()) {
        LOG_CONFIG();
    } else {
        LOG_CONFIG(logConfigFile);
    }
    if (verbose) LOG_SET_LVL("lsst.dsync", LOG_LVL_DEBUG);
}

} // unnamed namespace

int main (int argc, char const * const * argv) {

    po::variables_map vm;
    std::unique_ptr<dt::Configuration> config;
    dt::TransferParameters parameters;
    try {
        if (!::parseCommandLine(vm, argc, argv)) return dt::SUCCESS;
        config.reset(new dt::Configuration(
            vm.count("config-file") ? vm["config-file"].as<std::string>() : std::string()));

        parameters = dt::TransferParameters::fromConfiguration(*config);
        if (vm.count("block-size"))
            parameters.blockSizeBytes = dt::checkedUnsigned<size_t>(
                "block-size", vm["block-size"].as<long long>());
        if (vm.count("wait-interval"))
            parameters.waitInterval = std::chrono::seconds(dt::checkedUnsigned<unsigned int>(
                "wait-interval", vm["wait-interval"].as<long long>()));
        if (vm.count("wait-timeout"))
            parameters.waitTimeout = std::chrono::seconds(dt::checkedUnsigned<unsigned int>(
                "wait-timeout", vm["wait-timeout"].as<long long>()));
        if (vm.count("wait-attempts"))
            parameters.waitMaxAttempts = dt::checkedUnsigned<unsigned int>(
                "wait-attempts", vm["wait-attempts"].as<long long>());

        if (!parameters.blockSizeBytes) throw std::range_error("the block size can't be 0");

    } catch (std::exception const& ex) {
        std::cerr << "error: " << ex.what() << "\n"
                  << "usage: " << argv[0] << " [options] <source> <destination>" << std::endl;
        return dt::USAGE_ERROR;
    }

    ::configureLogging(vm.count("log-config") ? vm["log-config"].as<std::string>()
                                              : config->logConfigFile(),
                       vm.count("verbose") != 0);

    // The record of a successful transfer goes to the log, and
    // optionally to a separate file.

    const std::string recordFile = vm.count("record-file") ? vm["record-file"].as<std::string>()
                                                           : config->recordFile();
    std::ofstream recordStream;
    if (!recordFile.empty()) {
        recordStream.open(recordFile.c_str(), std::ios::out | std::ios::app);
        if (!recordStream) {
            LOGS(_log, LOG_LVL_ERROR, "failed to open the record file: " << recordFile);
            return dt::USAGE_ERROR;
        }
    }

    dt::LogReporter        reporter(recordFile.empty() ? nullptr : &recordStream);
    dt::PnfsAttributeStore store;
    dt::CancellationToken  token;

    dt::Transfer transfer(store, reporter, parameters);

    try {
        return transfer.run(vm["source"].as<std::string>(),
                            vm["destination"].as<std::string>(),
                            token);
    } catch (std::exception const& ex) {
        LOGS(_log, LOG_LVL_ERROR, ex.what());
        return dt::UNEXPECTED_FAILURE;
    }
}
