// src/monitoring/log_tailer.cpp
#include "log_tailer.h"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/inotify.h>

namespace logwarden {
namespace monitoring {

namespace {

std::string DirName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

std::string BaseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

LogTailer::LogTailer(const std::vector<std::string>& paths, LineCallback callback,
                     int poll_interval_ms)
    : paths_(paths), callback_(std::move(callback)),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 2000) {
}

LogTailer::~LogTailer() {
    Stop();
}

bool LogTailer::Start() {
    if (running_) {
        return true;
    }

    SeekExistingToEnd();

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        std::cerr << "⚠️  inotify unavailable (" << strerror(errno)
                  << "), falling back to polling" << std::endl;
    }

    if (pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) != 0) {
        std::cerr << "Failed to create tailer wake pipe: " << strerror(errno) << std::endl;
        CloseNotifier();
        return false;
    }

    running_ = true;
    thread_ = std::thread(&LogTailer::TailLoop, this);

    std::cout << "✓ Log tailer started (" << GetPaths().size() << " files)" << std::endl;
    return true;
}

void LogTailer::Stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    if (wake_pipe_[1] >= 0) {
        char byte = 1;
        if (write(wake_pipe_[1], &byte, 1) < 0 && errno != EAGAIN) {
            std::cerr << "Failed to wake tailer thread: " << strerror(errno) << std::endl;
        }
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    CloseNotifier();
    std::cout << "✓ Log tailer stopped" << std::endl;
}

void LogTailer::CloseNotifier() {
    if (inotify_fd_ >= 0) {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
    for (int& fd : wake_pipe_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
    watches_.clear();
}

void LogTailer::SetPaths(const std::vector<std::string>& paths) {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_ = paths;

    for (auto it = states_.begin(); it != states_.end();) {
        if (std::find(paths_.begin(), paths_.end(), it->first) == paths_.end()) {
            it = states_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<std::string> LogTailer::GetPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_;
}

void LogTailer::SeekExistingToEnd() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& path : paths_) {
        FileState& state = states_[path];
        if (state.known) {
            continue;
        }

        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            continue;  // Read from the start once it appears
        }

        state.known = true;
        state.device = st.st_dev;
        state.inode = st.st_ino;
        state.offset = st.st_size;
        state.partial.clear();
    }
}

void LogTailer::ReconcileAll() {
    for (const auto& path : GetPaths()) {
        Reconcile(path);
    }
}

void LogTailer::Reconcile(const std::string& path) {
    std::vector<std::string> lines;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        FileState& state = states_[path];

        // Open first, then fstat, so identity and bytes come from the same file
        int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            if (errno == ENOENT) {
                if (!state.missing_logged) {
                    std::cerr << "⚠️  Log file not found (will retry): " << path << std::endl;
                    state.missing_logged = true;
                }
            } else if (!state.error_logged) {
                std::cerr << "⚠️  Cannot open log file " << path << ": "
                          << strerror(errno) << std::endl;
                state.error_logged = true;
            }
            return;
        }

        struct stat st;
        if (fstat(fd, &st) != 0) {
            std::cerr << "⚠️  Cannot stat log file " << path << ": " << strerror(errno) << std::endl;
            close(fd);
            return;
        }

        if (state.missing_logged) {
            std::cout << "✓ Log file available: " << path << std::endl;
            state.missing_logged = false;
        }
        state.error_logged = false;

        if (!state.known) {
            state.known = true;
            state.device = st.st_dev;
            state.inode = st.st_ino;
            state.offset = 0;
            state.partial.clear();
        } else if (st.st_dev != state.device || st.st_ino != state.inode) {
            std::cout << "Log rotated: " << path << std::endl;
            state.device = st.st_dev;
            state.inode = st.st_ino;
            state.offset = 0;
            state.partial.clear();
        } else if (st.st_size < state.offset) {
            std::cout << "Log truncated: " << path << std::endl;
            state.offset = 0;
            state.partial.clear();
        }

        std::vector<char> buffer(READ_CHUNK);
        while (state.offset < st.st_size) {
            size_t want = std::min<off_t>(READ_CHUNK, st.st_size - state.offset);
            ssize_t got = pread(fd, buffer.data(), want, state.offset);
            if (got < 0) {
                if (errno == EINTR) continue;
                std::cerr << "⚠️  Read error on " << path << ": " << strerror(errno) << std::endl;
                break;
            }
            if (got == 0) {
                break;
            }

            state.offset += got;
            state.partial.append(buffer.data(), static_cast<size_t>(got));

            size_t start = 0;
            size_t newline;
            while ((newline = state.partial.find('\n', start)) != std::string::npos) {
                std::string line = state.partial.substr(start, newline - start);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (!line.empty()) {
                    lines.push_back(std::move(line));
                }
                start = newline + 1;
            }
            state.partial.erase(0, start);

            if (state.partial.size() > MAX_PARTIAL) {
                std::cerr << "⚠️  Discarding oversized partial line in " << path << std::endl;
                state.partial.clear();
            }
        }

        close(fd);
    }

    for (const auto& line : lines) {
        lines_emitted_++;
        if (callback_) {
            callback_(path, line);
        }
    }
}

void LogTailer::RefreshWatches() {
    if (inotify_fd_ < 0) {
        return;
    }

    watches_.clear();

    for (const auto& path : GetPaths()) {
        // Directory watch notices a rotated-in replacement
        int dir_wd = inotify_add_watch(inotify_fd_, DirName(path).c_str(),
                                       IN_CREATE | IN_MOVED_TO | IN_ONLYDIR);
        if (dir_wd >= 0) {
            watches_[dir_wd].is_directory = true;
            watches_[dir_wd].paths.push_back(path);
        }

        int file_wd = inotify_add_watch(inotify_fd_, path.c_str(),
                                        IN_MODIFY | IN_ATTRIB | IN_CLOSE_WRITE |
                                        IN_MOVE_SELF | IN_DELETE_SELF);
        if (file_wd >= 0) {
            watches_[file_wd].paths.push_back(path);
        }
    }
}

void LogTailer::HandleNotifications(bool& refresh_needed) {
    alignas(struct inotify_event) char buffer[8192];
    std::vector<std::string> touched;

    while (true) {
        ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
        if (len <= 0) {
            break;  // EAGAIN: drained
        }

        for (char* ptr = buffer; ptr < buffer + len;) {
            auto* event = reinterpret_cast<struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            auto it = watches_.find(event->wd);
            if (it == watches_.end()) {
                continue;
            }

            if (it->second.is_directory) {
                if (event->len == 0) continue;
                std::string name(event->name);
                for (const auto& path : it->second.paths) {
                    if (BaseName(path) == name) {
                        touched.push_back(path);
                        refresh_needed = true;
                    }
                }
            } else {
                for (const auto& path : it->second.paths) {
                    touched.push_back(path);
                }
                if (event->mask & (IN_MOVE_SELF | IN_DELETE_SELF | IN_IGNORED)) {
                    refresh_needed = true;
                }
            }
        }
    }

    std::sort(touched.begin(), touched.end());
    touched.erase(std::unique(touched.begin(), touched.end()), touched.end());
    for (const auto& path : touched) {
        Reconcile(path);
    }
}

void LogTailer::TailLoop() {
    RefreshWatches();
    ReconcileAll();

    auto last_full_pass = std::chrono::steady_clock::now();
    const auto interval = std::chrono::milliseconds(poll_interval_ms_);

    while (running_) {
        struct pollfd fds[2];
        nfds_t count = 0;
        fds[count].fd = wake_pipe_[0];
        fds[count].events = POLLIN;
        count++;
        if (inotify_fd_ >= 0) {
            fds[count].fd = inotify_fd_;
            fds[count].events = POLLIN;
            count++;
        }

        int rc = poll(fds, count, poll_interval_ms_);
        if (!running_) {
            break;
        }

        if (rc < 0 && errno != EINTR) {
            std::cerr << "⚠️  Tailer poll error: " << strerror(errno) << std::endl;
        }

        bool refresh_needed = false;
        if (rc > 0 && count > 1 && (fds[1].revents & POLLIN)) {
            HandleNotifications(refresh_needed);
        }

        // Polling backstop, also covers files with no usable watch
        auto now = std::chrono::steady_clock::now();
        if (now - last_full_pass >= interval) {
            ReconcileAll();
            refresh_needed = true;
            last_full_pass = now;
        }

        if (refresh_needed) {
            RefreshWatches();
        }
    }
}

} // namespace monitoring
} // namespace logwarden
