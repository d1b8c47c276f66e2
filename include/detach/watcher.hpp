#pragma once

#include <map>
#include <string>
#include <vector>

namespace detach {

enum class WatchAction { Created, Deleted, Changed, AttributeChanged, Renamed, Other };

// wd is -1 when the kernel queue overflowed and events were dropped.
struct WatchEvent {
    int wd;
    WatchAction action;
    std::string path;
};

enum WatchFlags : unsigned {
    WatchDeletes = 1u << 0,
    WatchChanges = 1u << 1,
};

// One inotify instance holding a watch per directory. Events are read in
// batches by whoever owns the loop; nothing here runs on its own thread.
class Watcher {
public:
    Watcher();
    ~Watcher();

    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;

    bool init();
    int fd() const;

    // Idempotent. A second call for the same directory adds the new flags.
    bool watch(const std::string& directory, unsigned flags);
    bool unwatch(const std::string& directory);
    bool isWatched(const std::string& directory) const;
    size_t count() const;

    // Waits up to timeoutMs for events. Returns false on timeout or interrupt.
    bool wait(int timeoutMs);
    std::vector<WatchEvent> readEvents();

private:
    int inotify_fd_;
    std::map<std::string, int> watches_;
    std::map<int, std::string> paths_;
};

} // namespace detach
