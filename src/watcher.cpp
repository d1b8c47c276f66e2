#include "detach/watcher.hpp"
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace detach {

namespace {

uint32_t toMask(unsigned flags) {
    uint32_t mask = 0;
    if (flags & WatchDeletes) mask |= IN_DELETE | IN_MOVED_FROM;
    if (flags & WatchChanges) mask |= IN_MODIFY | IN_ATTRIB | IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE;
    return mask;
}

WatchAction toAction(uint32_t mask) {
    if (mask & IN_DELETE) return WatchAction::Deleted;
    if (mask & IN_CREATE) return WatchAction::Created;
    if (mask & (IN_MODIFY | IN_CLOSE_WRITE)) return WatchAction::Changed;
    if (mask & IN_ATTRIB) return WatchAction::AttributeChanged;
    if (mask & (IN_MOVED_FROM | IN_MOVED_TO)) return WatchAction::Renamed;
    return WatchAction::Other;
}

// Without a trailing separator, so keys match parent_path() of event paths.
std::string normalize(const std::string& directory) {
    fs::path p = fs::path(directory).lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p.string();
}

} // namespace

Watcher::Watcher() : inotify_fd_(-1) {}

Watcher::~Watcher() {
    if (inotify_fd_ >= 0) {
        close(inotify_fd_);
    }
}

bool Watcher::init() {
    if (inotify_fd_ >= 0) return true;

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        perror("inotify_init1");
        return false;
    }
    return true;
}

int Watcher::fd() const {
    return inotify_fd_;
}

bool Watcher::watch(const std::string& directory, unsigned flags) {
    if (inotify_fd_ < 0) return false;

    std::string path = normalize(directory);
    uint32_t mask = toMask(flags) | IN_ONLYDIR;
    if (watches_.count(path)) {
        mask |= IN_MASK_ADD;
    }

    int wd = inotify_add_watch(inotify_fd_, path.c_str(), mask);
    if (wd < 0) {
        perror(("inotify_add_watch " + path).c_str());
        return false;
    }

    watches_[path] = wd;
    paths_[wd] = path;
    return true;
}

bool Watcher::unwatch(const std::string& directory) {
    auto it = watches_.find(normalize(directory));
    if (it == watches_.end()) return false;

    // The kernel drops the watch by itself when the directory is deleted.
    if (inotify_rm_watch(inotify_fd_, it->second) < 0 && errno != EINVAL) {
        perror("inotify_rm_watch");
    }
    paths_.erase(it->second);
    watches_.erase(it);
    return true;
}

bool Watcher::isWatched(const std::string& directory) const {
    return watches_.count(normalize(directory)) > 0;
}

size_t Watcher::count() const {
    return watches_.size();
}

bool Watcher::wait(int timeoutMs) {
    if (inotify_fd_ < 0) return false;

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(inotify_fd_, &fds);

    struct timeval timeout;
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;

    int ret = select(inotify_fd_ + 1, &fds, NULL, NULL, &timeout);
    if (ret < 0) {
        if (errno != EINTR) perror("select");
        return false;
    }
    return ret > 0;
}

std::vector<WatchEvent> Watcher::readEvents() {
    std::vector<WatchEvent> events;
    if (inotify_fd_ < 0) return events;

    char buffer[4096] __attribute__((aligned(__alignof__(struct inotify_event))));

    while (true) {
        ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN) perror("read");
            break;
        }
        if (len == 0) break;

        const struct inotify_event* event;
        for (char* ptr = buffer; ptr < buffer + len;
             ptr += sizeof(struct inotify_event) + event->len) {

            event = reinterpret_cast<const struct inotify_event*>(ptr);

            if (event->mask & IN_IGNORED) {
                // Directory removed or watch dropped by the kernel.
                auto it = paths_.find(event->wd);
                if (it != paths_.end()) {
                    watches_.erase(it->second);
                    paths_.erase(it);
                }
                continue;
            }
            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "inotify queue overflow, events were lost" << std::endl;
                events.push_back({-1, WatchAction::Other, ""});
                continue;
            }

            auto it = paths_.find(event->wd);
            if (it == paths_.end() || event->len == 0) continue;

            fs::path fullPath = fs::path(it->second) / event->name;
            events.push_back({event->wd, toAction(event->mask), fullPath.string()});
        }
    }

    return events;
}

} // namespace detach
