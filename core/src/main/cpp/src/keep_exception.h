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

#pragma once
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace keep {

    enum class ErrorCode : uint8_t {
        Initialization,  // directory/file creation failed
        Codec,           // corrupt bytes or unsupported version
        IO,              // filesystem failure
        Encryption,
        KeyConflict,     // id re-registered with an incompatible shape
        Superseded,      // debounced op replaced before it ran
        InvalidKey,
        NotInitialized,
        Internal
    };

    const char* errorCodeToString(ErrorCode code);

    /**
     * The one exception type raised by the storage engine.
     *
     * what() renders "<Code>: <message> [key=<id>] (cause: <cause>)" so a
     * sink that only logs what() still sees every field.
     */
    class KeepException : public std::runtime_error {
    public:
        KeepException(ErrorCode code, const std::string& message,
                      const std::string& physical_id = std::string(),
                      const std::string& cause = std::string());

        ErrorCode code() const noexcept { return code_; }
        const std::string& message() const noexcept { return message_; }
        const std::string& physical_id() const noexcept { return physical_id_; }
        const std::string& cause() const noexcept { return cause_; }

    private:
        ErrorCode code_;
        std::string message_;
        std::string physical_id_;
        std::string cause_;
    };

    using ErrorSink = std::function<void(const KeepException&)>;

    /**
     * Log the error, then hand it to the sink.
     *
     * A throwing sink is logged and contained; storage threads never see it.
     */
    void report(const ErrorSink& sink, const KeepException& error);

} // namespace keep
