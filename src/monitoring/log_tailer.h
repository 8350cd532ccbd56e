// src/monitoring/log_tailer.h
#ifndef LOGWARDEN_LOG_TAILER_H
#define LOGWARDEN_LOG_TAILER_H

#include <logwarden/types.h>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <sys/types.h>

namespace logwarden {
namespace monitoring {

/**
 * Multi-file access log tailer
 *
 * Follows every configured file by byte offset and survives
 * rotation (inode change) and truncation (size below offset).
 * Wakes on inotify events, with a fixed poll interval as backstop.
 * Complete lines are handed to the callback in file order.
 */
class LogTailer {
public:
    LogTailer(const std::vector<std::string>& paths, LineCallback callback,
              int poll_interval_ms = 2000);
    ~LogTailer();

    /**
     * Seek existing files to their end and start the tailer thread
     */
    bool Start();
    void Stop();
    bool IsRunning() const { return running_; }

    /**
     * Replace the followed files. Offsets of files that stay are kept.
     * Only valid while stopped.
     */
    void SetPaths(const std::vector<std::string>& paths);
    std::vector<std::string> GetPaths() const;

    /**
     * Record the current end of every existing file that has no state yet
     */
    void SeekExistingToEnd();

    /**
     * One idempotent pass over a file: detect rotation or truncation,
     * read any new bytes and emit complete lines.
     */
    void Reconcile(const std::string& path);
    void ReconcileAll();

    uint64_t LinesEmitted() const { return lines_emitted_.load(); }

private:
    struct FileState {
        bool known = false;         // identity recorded at least once
        dev_t device = 0;
        ino_t inode = 0;
        off_t offset = 0;
        std::string partial;        // trailing bytes without a newline yet
        bool missing_logged = false;
        bool error_logged = false;
    };

    static constexpr size_t READ_CHUNK = 64 * 1024;
    static constexpr size_t MAX_PARTIAL = 1024 * 1024;

    std::vector<std::string> paths_;
    LineCallback callback_;
    int poll_interval_ms_;

    mutable std::mutex mutex_;
    std::map<std::string, FileState> states_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::atomic<uint64_t> lines_emitted_{0};

    // inotify
    int inotify_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};
    struct Watch {
        bool is_directory = false;
        std::vector<std::string> paths;
    };
    std::map<int, Watch> watches_;  // wd -> followed files it covers

    void TailLoop();
    void RefreshWatches();
    void CloseNotifier();
    void HandleNotifications(bool& refresh_needed);
};

} // namespace monitoring
} // namespace logwarden

#endif // LOGWARDEN_LOG_TAILER_H
