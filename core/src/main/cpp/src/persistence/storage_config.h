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
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace keep {
namespace persist {

/**
 * Runtime configuration for both stores
 */
struct StorageConfig {
    // Layout under the root directory passed to Keep::init
    std::string folder_name       = "keep";
    std::string main_file_name    = "main.keep";
    std::string external_dir_name = "external";

    // Bursts of consolidated writes within this window collapse into one save
    std::chrono::milliseconds save_debounce{150};

    // Fixed header plus two 255-byte names
    size_t header_prefix_bytes = 515;

    size_t io_threads   = 2;   // write coordinator lanes
    size_t task_threads = 4;   // async key operations

    // fdatasync temp files and fsync the directory after rename
    bool sync_writes = true;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StorageConfig defaults() {
        StorageConfig cfg;

        if (const char* env = std::getenv("KEEP_SAVE_DEBOUNCE_MS")) {
            cfg.save_debounce = std::chrono::milliseconds(std::stoull(env));
        }

        if (const char* env = std::getenv("KEEP_IO_THREADS")) {
            cfg.io_threads = std::stoull(env);
        }

        if (const char* env = std::getenv("KEEP_TASK_THREADS")) {
            cfg.task_threads = std::stoull(env);
        }

        if (const char* env = std::getenv("KEEP_SYNC_WRITES")) {
            cfg.sync_writes = std::string(env) != "0";
        }

        return cfg;
    }

    /**
     * Config for tests: no debounce wait, no fsync
     */
    static StorageConfig for_tests() {
        StorageConfig cfg;
        cfg.save_debounce = std::chrono::milliseconds(10);
        cfg.sync_writes = false;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (io_threads < 1 || task_threads < 1) {
            return false;
        }
        if (header_prefix_bytes < 5) {
            // Must cover the fixed record header
            return false;
        }
        for (const std::string* name : {&folder_name, &main_file_name, &external_dir_name}) {
            if (name->empty() || name->find('/') != std::string::npos || *name == "." || *name == "..") {
                return false;
            }
        }
        if (main_file_name == external_dir_name) {
            return false;
        }
        return save_debounce.count() >= 0;
    }
};

} // namespace persist
} // namespace keep
