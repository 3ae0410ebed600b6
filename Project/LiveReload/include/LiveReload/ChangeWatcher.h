#pragma once
// ChangeWatcher.h
//
// Watches the directory containing a module file and tells the orchestrator when the file changed.
//
// Responsibilities:
//  - Subscribe (non-recursively) to the target's parent directory. Linux uses inotify; other
//    platforms poll the target's last-write time every pollIntervalMs.
//  - Debounce raw notifications per path: the first write to a quiet path is reported at once as
//    NoticeWrite, the settled Create/Write/Remove is reported after debounceMs without further
//    activity. A create followed by writes settles as one Create; a rename into the directory is
//    a Create. Overwriting the target in place is reported twice (NoticeWrite, then the
//    settled Write), and the orchestrator reloads on both. Build steps that rename the finished
//    file over the target (write elsewhere, then move) produce a single Create.
//  - If the watched directory is deleted, the watcher keeps running and re-subscribes once the
//    directory exists again, reporting the target as a Create if it is present.
//  - Does NOT reload anything. Events go into a queue that the owning thread drains with Poll().
//
// Threading notes:
//  - Start(), Stop() and Poll() belong to the owning thread.
//  - RequestReload() is thread-safe.
//  - The watcher thread only produces into the queue.

#include <memory>
#include <string>
#include <vector>

namespace LiveReload {

    enum class ChangeKind {
        Create,
        Write,
        NoticeWrite,
        Remove,
        Manual
    };

    const char* ToString(ChangeKind kind);

    struct ChangeEvent {
        ChangeKind kind = ChangeKind::Write;
        std::string path;
        std::string reason;     // only set for Manual
    };

    struct WatchConfig {
        std::string targetPath;
        unsigned int debounceMs = 1000;
        unsigned int pollIntervalMs = 250;
    };

    class ChangeWatcher {
    public:
        ChangeWatcher();
        ~ChangeWatcher();

        ChangeWatcher(const ChangeWatcher&) = delete;
        ChangeWatcher& operator=(const ChangeWatcher&) = delete;

        // Throws WatchError if the target's directory cannot be watched.
        void Start(const WatchConfig& cfg);

        // Joins the watcher thread, closes the subscription and clears the queue. Safe to call
        // multiple times.
        void Stop();

        // Queue a Manual event for the target (thread-safe).
        void RequestReload(const std::string& reason = std::string());

        // Drains the queue. True if any Create, Write, NoticeWrite or Manual event for the target
        // arrived since the last call. Never blocks.
        bool Poll();

        // Drains the queue and returns every event, whatever its path or kind.
        std::vector<ChangeEvent> PollEvents();

        bool IsRunning() const;
        const std::string& TargetPath() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace LiveReload
