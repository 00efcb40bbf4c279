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
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace keep::persist::test {

// Create a temporary directory for testing
inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

// Overwrite len bytes at offset with 0xFF
inline void corrupt_file(const std::string& path, size_t offset, size_t len) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) return;

    file.seekp(offset);
    std::vector<char> garbage(len, static_cast<char>(0xFF));
    file.write(garbage.data(), len);
}

// Truncate file to simulate torn write
inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

inline void write_raw(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

inline std::vector<uint8_t> read_raw(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// True when needle occurs anywhere in the file's bytes
inline bool file_contains(const std::string& path, const std::string& needle) {
    std::vector<uint8_t> bytes = read_raw(path);
    std::string haystack(bytes.begin(), bytes.end());
    return haystack.find(needle) != std::string::npos;
}

// Poll until pred holds or the timeout expires
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Removes the directory tree on scope exit
class TempDir {
public:
    explicit TempDir(const std::string& prefix) : path_(create_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string operator/(const std::string& name) const {
        return (std::filesystem::path(path_) / name).string();
    }

private:
    std::string path_;
};

} // namespace keep::persist::test
