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
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace keep {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Suffix of the temporary file an atomic write goes through
        constexpr const char* TMP_SUFFIX = ".tmp";

        class PlatformFS {
        public:
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(2); with sync the parent directory is fsync'ed afterwards
            static FSResult atomic_replace(const std::string& tmp, const std::string& final,
                                           bool sync = true);

            // Create/truncate and write; with sync the data is fdatasync'ed
            static FSResult write_file(const std::string& path, const uint8_t* data, size_t len,
                                       bool sync);

            /**
             * Write <path>.tmp, then rename it over <path>. A crash at any
             * point leaves either the previous file or the new one.
             */
            static FSResult write_file_atomic(const std::string& path, const std::vector<uint8_t>& data,
                                              bool sync = true);

            static std::pair<FSResult, std::vector<uint8_t>> read_file(const std::string& path);

            // At most max_bytes from the start of the file
            static std::pair<FSResult, std::vector<uint8_t>> read_prefix(const std::string& path,
                                                                         size_t max_bytes);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static FSResult ensure_directory(const std::string& path);

            // A missing file counts as removed
            static FSResult remove_file(const std::string& path);

            // Names of the regular files directly inside dir
            static std::pair<FSResult, std::vector<std::string>> list_files(const std::string& dir);

            // Test seam: the next n renames fail with err
            static void inject_rename_failures(int n, int err);
        };

    }
} // namespace keep::persist
