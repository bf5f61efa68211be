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

#ifdef DFSTATE_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <filesystem>
#include <cerrno>
#include <cstring>

namespace dfstate {
    namespace persist {

        FSResult PlatformFS::open_append(const std::string& path, int* out_fd, uint64_t* out_size) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }
            off_t end = ::lseek(fd, 0, SEEK_END);
            if (end < 0) {
                int e = errno;
                ::close(fd);
                return {false, e};
            }
            *out_fd = fd;
            *out_size = static_cast<uint64_t>(end);
            return {true, 0};
        }

        FSResult PlatformFS::write_all(int fd, const void* data, size_t len) {
            const char* p = static_cast<const char*>(data);
            while (len > 0) {
                ssize_t n = ::write(fd, p, len);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                p += n;
                len -= static_cast<size_t>(n);
            }
            return {true, 0};
        }

        FSResult PlatformFS::flush_file(int fd) {
            int rc = ::fdatasync(fd);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::close_file(int fd) {
            int rc = ::close(fd);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::read_file(const std::string& path, std::string* out) {
            int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }
            out->clear();
            char buf[64 * 1024];
            for (;;) {
                ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int e = errno;
                    ::close(fd);
                    return {false, e};
                }
                if (n == 0) break;
                out->append(buf, static_cast<size_t>(n));
            }
            ::close(fd);
            return {true, 0};
        }

        FSResult PlatformFS::write_file_durable(const std::string& path, const std::string& data) {
            std::string tmp = path + ".tmp";
            int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }
            FSResult r = write_all(fd, data.data(), data.size());
            if (r.ok && ::fsync(fd) != 0) {
                r = {false, errno};
            }
            int rc = ::close(fd);
            if (r.ok && rc != 0) {
                r = {false, errno};
            }
            if (!r.ok) {
                ::unlink(tmp.c_str());
                return r;
            }
            r = atomic_replace(tmp, path);
            if (!r.ok) {
                ::unlink(tmp.c_str());
            }
            return r;
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);
            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }

            std::string parent_dir = std::filesystem::path(dst).parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }
            return fsync_directory(parent_dir);
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        bool PlatformFS::exists(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0;
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec && !std::filesystem::is_directory(path)) {
                return {false, ec.value()};
            }
            return {true, 0};
        }

        FSResult PlatformFS::truncate(const std::string& path, size_t size) {
            if (::truncate(path.c_str(), off_t(size)) == 0) {
                return {true, 0};
            }
            return {false, errno};
        }

        FSResult PlatformFS::remove_file(const std::string& path) {
            if (::unlink(path.c_str()) == 0 || errno == ENOENT) {
                return {true, 0};
            }
            return {false, errno};
        }

        FSResult PlatformFS::remove_all(const std::string& path) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            return {!ec, ec.value()};
        }

        std::pair<FSResult, std::vector<std::string>> PlatformFS::list_directory(const std::string& path) {
            std::vector<std::string> names;
            std::error_code ec;
            for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
                names.push_back(it->path().filename().string());
            }
            if (ec) {
                return {{false, ec.value()}, {}};
            }
            return {{true, 0}, names};
        }

    } // namespace persist
} // namespace dfstate

#endif // DFSTATE_LINUX
