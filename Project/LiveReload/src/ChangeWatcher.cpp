// ChangeWatcher.cpp
//
// Implementation of ChangeWatcher. A joinable watcher thread reads directory notifications
// (inotify on Linux, last-write-time polling elsewhere), debounces them per path and enqueues the
// results. Poll() drains the queue on the owning thread.

#include "LiveReload/ChangeWatcher.h"
#include "LiveReload/ReloadError.h"
#include "LiveReload/Logging.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <queue>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#if defined(__linux__)
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#endif

namespace fs = std::filesystem;

namespace LiveReload {

    const char* ToString(ChangeKind kind) {
        switch (kind) {
            case ChangeKind::Create:      return "Create";
            case ChangeKind::Write:       return "Write";
            case ChangeKind::NoticeWrite: return "NoticeWrite";
            case ChangeKind::Remove:      return "Remove";
            case ChangeKind::Manual:      return "Manual";
        }
        return "Unknown";
    }

    namespace {

        using Clock = std::chrono::steady_clock;

        std::string NormalizePath(const fs::path& p) {
            std::error_code ec;
            fs::path abs = fs::absolute(p, ec);
            if (ec) {
                abs = p;
            }
            return abs.lexically_normal().string();
        }

        // Per-path coalescing of raw notifications. Only touched by the watcher thread.
        class Debouncer {
        public:
            explicit Debouncer(std::chrono::milliseconds window = std::chrono::milliseconds(0))
                : m_window(window) {}

            template <typename Emit>
            void Observe(const std::string& path, ChangeKind kind, Clock::time_point now, Emit&& emit) {
                auto it = m_pending.find(path);
                if (it == m_pending.end()) {
                    if (kind == ChangeKind::Write) {
                        emit(ChangeEvent{ ChangeKind::NoticeWrite, path, std::string() });
                    }
                    m_pending.emplace(path, Pending{ kind, now });
                    return;
                }

                Pending& pending = it->second;
                if (kind == ChangeKind::Write) {
                    // A write after a create (or a re-create after a remove) is still a create.
                    if (pending.kind == ChangeKind::Remove) {
                        pending.kind = ChangeKind::Create;
                    }
                    else if (pending.kind != ChangeKind::Create) {
                        pending.kind = ChangeKind::Write;
                    }
                }
                else {
                    pending.kind = kind;
                }
                pending.last = now;
            }

            template <typename Emit>
            void Flush(Clock::time_point now, Emit&& emit) {
                for (auto it = m_pending.begin(); it != m_pending.end();) {
                    if (now - it->second.last >= m_window) {
                        emit(ChangeEvent{ it->second.kind, it->first, std::string() });
                        it = m_pending.erase(it);
                    }
                    else {
                        ++it;
                    }
                }
            }

            void Clear() { m_pending.clear(); }

        private:
            struct Pending {
                ChangeKind kind;
                Clock::time_point last;
            };

            std::chrono::milliseconds m_window;
            std::unordered_map<std::string, Pending> m_pending;
        };

#if !defined(__linux__)
        struct TargetStamp {
            bool exists = false;
            fs::file_time_type writeTime{};
        };

        TargetStamp QueryTarget(const std::string& path) {
            TargetStamp stamp;
            std::error_code ec;
            if (!fs::is_regular_file(path, ec)) {
                return stamp;
            }
            auto t = fs::last_write_time(path, ec);
            if (ec) {
                return stamp;
            }
            stamp.exists = true;
            stamp.writeTime = t;
            return stamp;
        }
#endif

    } // namespace

    struct ChangeWatcher::Impl {
        Impl() : running(false) {}
        ~Impl() { StopInternal(); }

        void StartInternal(const WatchConfig& cfg) {
            if (running.load()) {
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Warn, "[Watcher] Start called while already running");
                return;
            }

            config = cfg;
            targetPath = NormalizePath(cfg.targetPath);
            directory = fs::path(targetPath).parent_path().string();

            std::error_code ec;
            if (directory.empty() || !fs::is_directory(directory, ec)) {
                throw Fail("directory does not exist or is not accessible");
            }

            debouncer = Debouncer(std::chrono::milliseconds(config.debounceMs));

#if defined(__linux__)
            inotifyFd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
            if (inotifyFd < 0) {
                throw Fail(std::string("inotify_init1 failed: ") + std::strerror(errno));
            }
            if (!AddWatch()) {
                const int err = errno;
                ::close(inotifyFd);
                inotifyFd = -1;
                throw Fail(std::string("inotify_add_watch failed: ") + std::strerror(err));
            }
#else
            lastSeen = QueryTarget(targetPath);
#endif

            running.store(true);
            workerThread = std::thread(&Impl::ThreadMain, this);
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Watcher] Watching '", directory, "' for '",
                fs::path(targetPath).filename().string(), "' (debounce ", config.debounceMs, " ms)");
        }

        void StopInternal() {
            bool wasRunning = false;
            {
                std::lock_guard<std::mutex> lk(cvMutex);
                wasRunning = running.exchange(false);
            }
            cv.notify_all();

            if (workerThread.joinable()) {
                workerThread.join();
            }

#if defined(__linux__)
            if (inotifyFd >= 0) {
                if (watchDescriptor >= 0) {
                    ::inotify_rm_watch(inotifyFd, watchDescriptor);
                }
                ::close(inotifyFd);
            }
            inotifyFd = -1;
            watchDescriptor = -1;
#endif

            debouncer.Clear();
            {
                std::lock_guard<std::mutex> qlk(queueMutex);
                while (!eventQueue.empty()) eventQueue.pop();
            }

            if (wasRunning) {
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Watcher] Stopped watching '", directory, "'");
            }
        }

        void RequestReload(const std::string& reason) {
            ChangeEvent ev;
            ev.kind = ChangeKind::Manual;
            ev.path = targetPath;
            ev.reason = reason.empty() ? std::string("manual") : reason;
            Enqueue(std::move(ev));
        }

        std::vector<ChangeEvent> PollEvents() {
            std::vector<ChangeEvent> out;
            std::lock_guard<std::mutex> lk(queueMutex);
            while (!eventQueue.empty()) {
                out.push_back(std::move(eventQueue.front()));
                eventQueue.pop();
            }
            return out;
        }

        bool Poll() {
            bool changed = false;
            for (const auto& ev : PollEvents()) {
                if (ev.path == targetPath && ev.kind != ChangeKind::Remove) {
                    changed = true;
                }
                else {
                    LIVERELOAD_PRINT(ReloadLogging::LogLevel::Debug, "[Watcher] Ignoring ", ToString(ev.kind),
                        " '", ev.path, "'");
                }
            }
            return changed;
        }

        bool IsRunning() const { return running.load(); }

        std::string targetPath;

    private:
        WatchError Fail(const std::string& detail) const {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Watcher] Cannot watch '", directory, "': ", detail);
            return WatchError(directory, detail);
        }

        void Enqueue(ChangeEvent ev) {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Trace, "[Watcher] ", ToString(ev.kind), " '", ev.path, "'");
            std::lock_guard<std::mutex> lk(queueMutex);
            eventQueue.push(std::move(ev));
        }

        void Observe(const std::string& path, ChangeKind kind, Clock::time_point now) {
            debouncer.Observe(path, kind, now, [this](ChangeEvent ev) { Enqueue(std::move(ev)); });
        }

        void Flush(Clock::time_point now) {
            debouncer.Flush(now, [this](ChangeEvent ev) { Enqueue(std::move(ev)); });
        }

        void ThreadMain() {
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Debug, "[Watcher] Watcher thread started");

#if defined(__linux__)
            alignas(struct inotify_event) char buffer[16 * 1024];

            while (running.load()) {
                pollfd pfd{};
                pfd.fd = inotifyFd;
                pfd.events = POLLIN;

                const int rc = ::poll(&pfd, 1, 50);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    LIVERELOAD_PRINT(ReloadLogging::LogLevel::Error, "[Watcher] poll failed: ", std::strerror(errno));
                    break;
                }

                if (rc > 0 && (pfd.revents & POLLIN)) {
                    const Clock::time_point now = Clock::now();
                    for (;;) {
                        const ssize_t len = ::read(inotifyFd, buffer, sizeof(buffer));
                        if (len <= 0) {
                            break;
                        }
                        for (char* p = buffer; p < buffer + len;) {
                            const auto* raw = reinterpret_cast<const struct inotify_event*>(p);
                            HandleRaw(*raw, now);
                            p += sizeof(struct inotify_event) + raw->len;
                        }
                    }
                }

                if (watchDescriptor < 0) {
                    RestoreWatch(Clock::now());
                }

                Flush(Clock::now());
            }
#else
            while (running.load()) {
                const TargetStamp current = QueryTarget(targetPath);
                const Clock::time_point now = Clock::now();
                if (current.exists && !lastSeen.exists) {
                    Observe(targetPath, ChangeKind::Create, now);
                }
                else if (!current.exists && lastSeen.exists) {
                    Observe(targetPath, ChangeKind::Remove, now);
                }
                else if (current.exists && current.writeTime != lastSeen.writeTime) {
                    Observe(targetPath, ChangeKind::Write, now);
                }
                lastSeen = current;

                Flush(now);

                std::unique_lock<std::mutex> ul(cvMutex);
                cv.wait_for(ul, std::chrono::milliseconds(config.pollIntervalMs), [this]() { return !running.load(); });
            }
#endif

            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Debug, "[Watcher] Watcher thread exiting");
        }

#if defined(__linux__)
        bool AddWatch() {
            const uint32_t mask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM;
            watchDescriptor = ::inotify_add_watch(inotifyFd, directory.c_str(), mask);
            return watchDescriptor >= 0;
        }

        // The directory was deleted (e.g. a clean rebuild). Re-subscribe once it exists again and
        // report the target as created, since its creation may have happened before the new watch.
        void RestoreWatch(Clock::time_point now) {
            std::error_code ec;
            if (!fs::is_directory(directory, ec) || !AddWatch()) {
                return;
            }
            LIVERELOAD_PRINT(ReloadLogging::LogLevel::Info, "[Watcher] Watch on '", directory, "' restored");
            if (fs::exists(targetPath, ec)) {
                Observe(targetPath, ChangeKind::Create, now);
            }
        }

        void HandleRaw(const struct inotify_event& raw, Clock::time_point now) {
            if (raw.wd != watchDescriptor) {
                return;
            }
            if (raw.mask & IN_IGNORED) {
                LIVERELOAD_PRINT(ReloadLogging::LogLevel::Warn, "[Watcher] Watch on '", directory,
                    "' was removed, waiting for the directory to come back");
                watchDescriptor = -1;
                return;
            }
            if (raw.len == 0) {
                return;
            }

            const std::string path = (fs::path(directory) / raw.name).string();
            if (raw.mask & (IN_CREATE | IN_MOVED_TO)) {
                Observe(path, ChangeKind::Create, now);
            }
            else if (raw.mask & (IN_DELETE | IN_MOVED_FROM)) {
                Observe(path, ChangeKind::Remove, now);
            }
            else if (raw.mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
                Observe(path, ChangeKind::Write, now);
            }
        }

        int inotifyFd = -1;
        int watchDescriptor = -1;
#else
        TargetStamp lastSeen;
#endif

        WatchConfig config;
        std::string directory;
        Debouncer debouncer;

        std::thread workerThread;
        std::atomic<bool> running;
        std::condition_variable cv;
        std::mutex cvMutex;

        std::queue<ChangeEvent> eventQueue;
        std::mutex queueMutex;
    };

    ////////////////////////////////////////////////////////////////////////////////
    // ChangeWatcher public wrapper
    ////////////////////////////////////////////////////////////////////////////////

    ChangeWatcher::ChangeWatcher() : m_impl(new Impl()) {}
    ChangeWatcher::~ChangeWatcher() { Stop(); }

    void ChangeWatcher::Start(const WatchConfig& cfg) {
        m_impl->StartInternal(cfg);
    }

    void ChangeWatcher::Stop() {
        if (!m_impl) return;
        m_impl->StopInternal();
    }

    void ChangeWatcher::RequestReload(const std::string& reason) {
        m_impl->RequestReload(reason);
    }

    bool ChangeWatcher::Poll() {
        return m_impl->Poll();
    }

    std::vector<ChangeEvent> ChangeWatcher::PollEvents() {
        return m_impl->PollEvents();
    }

    bool ChangeWatcher::IsRunning() const {
        return m_impl->IsRunning();
    }

    const std::string& ChangeWatcher::TargetPath() const {
        return m_impl->targetPath;
    }

} // namespace LiveReload
