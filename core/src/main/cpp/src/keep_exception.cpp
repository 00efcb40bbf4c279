/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "keep_exception.h"
#include "util/log.h"

namespace keep {

    const char* errorCodeToString(ErrorCode code) {
        switch (code) {
        case ErrorCode::Initialization: return "InitializationError";
        case ErrorCode::Codec:          return "CodecError";
        case ErrorCode::IO:             return "IOError";
        case ErrorCode::Encryption:     return "EncryptionError";
        case ErrorCode::KeyConflict:    return "KeyConflictError";
        case ErrorCode::Superseded:     return "SupersededError";
        case ErrorCode::InvalidKey:     return "InvalidKeyError";
        case ErrorCode::NotInitialized: return "NotInitializedError";
        case ErrorCode::Internal:       return "InternalError";
        }
        return "UnknownError";
    }

    static std::string render(ErrorCode code, const std::string& message,
                              const std::string& physical_id, const std::string& cause) {
        std::string out = errorCodeToString(code);
        out += ": ";
        out += message;
        if (!physical_id.empty()) {
            out += " [key=" + physical_id + "]";
        }
        if (!cause.empty()) {
            out += " (cause: " + cause + ")";
        }
        return out;
    }

    KeepException::KeepException(ErrorCode code, const std::string& message,
                                 const std::string& physical_id, const std::string& cause)
        : std::runtime_error(render(code, message, physical_id, cause)),
          code_(code), message_(message), physical_id_(physical_id), cause_(cause) {}

    void report(const ErrorSink& sink, const KeepException& e) {
        error() << e.what();
        if (!sink) {
            return;
        }
        try {
            sink(e);
        } catch (const std::exception& sink_error) {
            severe() << "error sink threw while handling " << errorCodeToString(e.code())
                     << ": " << sink_error.what();
        }
    }

} // namespace keep
