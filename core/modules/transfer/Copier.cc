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

#include "transfer/Copier.h"

// System headers

#include <stdexcept>

// Dsync headers

#include "lsst/log/Log.h"
#include "transfer/Adler32.h"
#include "transfer/FileUtils.h"
#include "transfer/TransferError.h"

namespace {

LOG_LOGGER _log = LOG_GET("lsst.dsync.transfer.Copier");

} /// namespace

namespace lsst {
namespace dsync {
namespace transfer {

const size_t Copier::defaultBlockSize;

Copier::Copier (size_t blockSize)
    :   _buffer      (),
        _bytesCopied (0) {

    if (!blockSize) throw std::invalid_argument("Copier - block size can't be 0");
    _buffer.resize(blockSize);
}

std::string
Copier::copy (Reader &source,
              Writer &destination) {

    _bytesCopied = 0;

    uint32_t state = Adler32::seed;
    while (true) {
        const size_t bytesRead = source.read(_buffer.data(), _buffer.size());
        if (!bytesRead) break;

        state = Adler32::update(state, _buffer.data(), bytesRead);

        const size_t bytesWritten = destination.write(_buffer.data(), bytesRead);
        if (bytesWritten != bytesRead) throw ShortWriteError(bytesRead, bytesWritten);

        _bytesCopied += bytesRead;
    }
    const std::string checksum = Adler32::finalize(state);

    LOGS(_log, LOG_LVL_DEBUG, "copy  bytes: " << _bytesCopied << "  checksum: " << checksum);

    return checksum;
}

}}} // namespace lsst::dsync::transfer
