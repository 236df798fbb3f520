/**
 * @file FileSystem.cpp
 * @brief POSIX file access and inotify-based change notification
 */

#include "jpatch/FileSystem.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace jpatch {

namespace {

using Clock = std::chrono::steady_clock;

/**
 * @brief Write all of contents to fd, retrying short writes
 */
bool write_all(int fd, const std::string& contents) {
    const char* data = contents.data();
    std::size_t left = contents.size();
    while (left > 0) {
        const ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

/**
 * @brief Watches one file through an inotify watch on its directory
 */
class InotifyWatcher : public FileWatcher {
public:
    InotifyWatcher(const std::string& path, std::chrono::milliseconds debounce)
        : path_(path)
        , debounce_(debounce)
    {
        const fs::path p(path);
        name_ = p.filename().string();
        std::string dir = p.parent_path().string();
        if (dir.empty()) {
            dir = ".";
        }

        fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (fd_ < 0) {
            throw IoError(path, std::string("inotify_init1: ") + std::strerror(errno));
        }

        const uint32_t mask = IN_CLOSE_WRITE | IN_MODIFY | IN_CREATE | IN_MOVED_TO |
                              IN_DELETE | IN_MOVED_FROM;
        wd_ = ::inotify_add_watch(fd_, dir.c_str(), mask);
        if (wd_ < 0) {
            const int err = errno;
            ::close(fd_);
            throw IoError(dir, std::string("inotify_add_watch: ") + std::strerror(err));
        }
    }

    ~InotifyWatcher() override {
        ::inotify_rm_watch(fd_, wd_);
        ::close(fd_);
    }

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    WatchEvent wait(std::chrono::milliseconds timeout) override {
        const auto deadline = Clock::now() + timeout;

        // Block until an event for our file arrives
        while (true) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now());
            if (left.count() <= 0 || !poll_once(left)) {
                return WatchEvent::Timeout;
            }
            if (drain()) {
                break;
            }
        }

        // Coalesce the rest of the burst: wait until quiet for debounce_
        while (poll_once(debounce_)) {
            drain();
        }

        std::error_code ec;
        return fs::exists(path_, ec) ? WatchEvent::Changed : WatchEvent::Removed;
    }

private:
    std::string path_;
    std::string name_;
    std::chrono::milliseconds debounce_;
    int fd_ = -1;
    int wd_ = -1;

    /**
     * @brief Wait until the inotify descriptor is readable
     * @return false on timeout or signal interruption
     */
    bool poll_once(std::chrono::milliseconds timeout) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                return false;
            }
            throw IoError(path_, std::string("poll: ") + std::strerror(errno));
        }
        return rc > 0;
    }

    /**
     * @brief Read all pending events
     * @return true if any of them concerned the watched file
     */
    bool drain() {
        alignas(inotify_event) char buffer[4096];
        bool relevant = false;

        while (true) {
            const ssize_t n = ::read(fd_, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                if (errno == EINTR) continue;
                throw IoError(path_, std::string("read: ") + std::strerror(errno));
            }
            if (n == 0) break;

            for (ssize_t off = 0; off < n;) {
                const auto* event = reinterpret_cast<const inotify_event*>(buffer + off);
                if (event->mask & IN_Q_OVERFLOW) {
                    relevant = true;
                } else if (event->len > 0 && name_ == event->name) {
                    relevant = true;
                }
                if (event->mask & IN_IGNORED) {
                    throw IoError(path_, "watched directory was removed");
                }
                off += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
            }
        }
        return relevant;
    }
};

} // anonymous namespace

std::string PosixFileSystem::read_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IoError(path, "no such file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError(path, std::strerror(errno));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IoError(path, "read failed");
    }
    return ss.str();
}

void PosixFileSystem::write_atomic(const std::string& path, const std::string& contents) {
    const std::string tmp = path + ".tmp." + std::to_string(::getpid());

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw IoError(tmp, std::strerror(errno));
    }

    if (!write_all(fd, contents) || ::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw IoError(path, std::strerror(err));
    }
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw IoError(path, std::strerror(err));
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw IoError(path, std::strerror(err));
    }
}

bool PosixFileSystem::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::unique_ptr<FileWatcher> PosixFileSystem::watch(const std::string& path) {
    return std::make_unique<InotifyWatcher>(path, debounce_);
}

TempDirectory::TempDirectory(const std::string& prefix) {
    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        throw IoError("<temp>", ec.message());
    }

    std::string pattern = (base / (prefix + ".XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        throw IoError(pattern, std::strerror(errno));
    }
    path_ = pattern;
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string TempDirectory::file(const std::string& name) const {
    return (fs::path(path_) / name).string();
}

} // namespace jpatch
