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

#include "platform_fs.h"

#ifdef KEEP_POSIX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cerrno>
#include <cstdio>
#include <filesystem>

namespace keep {
    namespace persist {

        static std::atomic<int> rename_failures{0};
        static std::atomic<int> rename_failure_errno{0};

        void PlatformFS::inject_rename_failures(int n, int err) {
            rename_failure_errno.store(err);
            rename_failures.store(n);
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }

            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst, bool sync) {
            if (rename_failures.load() > 0 && rename_failures.fetch_sub(1) > 0) {
                return {false, rename_failure_errno.load()};
            }

            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }
            if (!sync) {
                return {true, 0};
            }

            std::filesystem::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        FSResult PlatformFS::write_file(const std::string& path, const uint8_t* data, size_t len,
                                        bool sync) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            size_t written = 0;
            while (written < len) {
                ssize_t n = ::write(fd, data + written, len - written);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int ec = errno;
                    ::close(fd);
                    return {false, ec};
                }
                written += static_cast<size_t>(n);
            }

            if (sync && ::fdatasync(fd) != 0) {
                int ec = errno;
                ::close(fd);
                return {false, ec};
            }
            if (::close(fd) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::write_file_atomic(const std::string& path, const std::vector<uint8_t>& data,
                                               bool sync) {
            std::string tmp = path + TMP_SUFFIX;
            FSResult r = write_file(tmp, data.data(), data.size(), sync);
            if (!r.ok) {
                ::unlink(tmp.c_str());
                return r;
            }
            r = atomic_replace(tmp, path, sync);
            if (!r.ok) {
                ::unlink(tmp.c_str());
            }
            return r;
        }

        std::pair<FSResult, std::vector<uint8_t>> PlatformFS::read_prefix(const std::string& path,
                                                                          size_t max_bytes) {
            std::vector<uint8_t> out;
            int fd = ::open(path.c_str(), O_RDONLY);
            if (fd < 0) {
                return { {false, errno}, std::move(out) };
            }

            uint8_t buf[8192];
            while (out.size() < max_bytes) {
                size_t want = std::min(sizeof(buf), max_bytes - out.size());
                ssize_t n = ::read(fd, buf, want);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int ec = errno;
                    ::close(fd);
                    return { {false, ec}, std::vector<uint8_t>() };
                }
                if (n == 0) break;
                out.insert(out.end(), buf, buf + n);
            }
            ::close(fd);
            return { {true, 0}, std::move(out) };
        }

        std::pair<FSResult, std::vector<uint8_t>> PlatformFS::read_file(const std::string& path) {
            return read_prefix(path, SIZE_MAX);
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (!ec || std::filesystem::is_directory(path)) {
                return {true, 0};
            }
            return {false, ec.value() != 0 ? ec.value() : EIO};
        }

        FSResult PlatformFS::remove_file(const std::string& path) {
            if (::unlink(path.c_str()) == 0 || errno == ENOENT) {
                return {true, 0};
            }
            return {false, errno};
        }

        std::pair<FSResult, std::vector<std::string>> PlatformFS::list_files(const std::string& dir) {
            std::vector<std::string> names;
            std::error_code ec;
            std::filesystem::directory_iterator it(dir, ec), end;
            if (ec) {
                return { {false, ec.value()}, std::move(names) };
            }
            for (; it != end; it.increment(ec)) {
                if (ec) {
                    return { {false, ec.value()}, std::move(names) };
                }
                std::error_code type_ec;
                if (it->is_regular_file(type_ec)) {
                    names.push_back(it->path().filename().string());
                }
            }
            return { {true, 0}, std::move(names) };
        }

    } // namespace persist
} // namespace keep

#endif // KEEP_POSIX
