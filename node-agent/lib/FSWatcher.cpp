/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for FSWatcher class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#if defined(HAVE_SYS_INOTIFY_H) && defined(HAVE_SYS_EVENTFD_H)
#define USE_INOTIFY
#endif

#include <stdexcept>
#include <cstring>
#include <unordered_map>

#ifdef USE_INOTIFY
#include <sys/inotify.h>
#include <sys/eventfd.h>
#endif
#include <poll.h>
#include <errno.h>
#include <unistd.h>

#include <sdnagent/FSWatcher.h>
#include <sdnagent/logging.h>

namespace sdnagent {

using std::string;
using std::runtime_error;
namespace fs = boost::filesystem;

FSWatcher::FSWatcher() : stopFd(-1), initialScan(true) {

}

FSWatcher::~FSWatcher() {
    stop();
}

void FSWatcher::addWatch(const std::string& watchDir, Watcher& watcher) {
    watchDirs[fs::path(watchDir)].push_back(&watcher);
}

void FSWatcher::setInitialScan(bool scan) {
    initialScan = scan;
}

void FSWatcher::start() {
    for (const dir_map_t::value_type& w : watchDirs) {
        boost::system::error_code ec;
        if (!fs::is_directory(w.first, ec)) {
            throw runtime_error("Filesystem watch directory " +
                                w.first.string() +
                                " does not exist or is not a directory");
        }
    }

#ifdef USE_INOTIFY
    if (pollThread) return;

    stopFd = eventfd(0, 0);
    if (stopFd < 0) {
        throw runtime_error(string("Could not allocate eventfd descriptor: ")
                            + strerror(errno));
    }
    pollThread.reset(new std::thread([this]() { run(); }));
#else
    LOG(WARNING) << "inotify is not available; changes under watched "
                 << "directories will not be detected";
#endif /* USE_INOTIFY */
}

void FSWatcher::stop() {
#ifdef USE_INOTIFY
    if (!pollThread) return;

    uint64_t u = 1;
    if (write(stopFd, &u, sizeof(u)) != sizeof(u)) {
        LOG(ERROR) << "Could not signal filesystem polling thread: "
                   << strerror(errno);
    }
    pollThread->join();
    pollThread.reset();

    close(stopFd);
    stopFd = -1;
#endif /* USE_INOTIFY */
}

void FSWatcher::notify(const watchers_t& watchers,
                       const fs::path& filePath, bool removed) {
    for (Watcher* watcher : watchers) {
        try {
            if (removed)
                watcher->deleted(filePath);
            else
                watcher->updated(filePath);
        } catch (const std::exception& ex) {
            LOG(ERROR) << "Error while handling change to " << filePath
                       << ": " << ex.what();
        }
    }
}

void FSWatcher::scanDir(const fs::path& dir, const watchers_t& watchers) {
    boost::system::error_code ec;
    fs::directory_iterator end;
    for (fs::directory_iterator it(dir, ec); !ec && it != end;
         it.increment(ec)) {
        if (fs::is_regular_file(it->status()))
            notify(watchers, it->path(), false);
    }
    if (ec) {
        LOG(ERROR) << "Could not scan " << dir << ": " << ec.message();
    }
}

void FSWatcher::run() {
#ifdef USE_INOTIFY
    static const uint32_t WATCH_MASK =
        IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_TO | IN_MOVED_FROM;
    static const size_t BUF_LEN = 1024 * (sizeof(struct inotify_event) + 16);
    char buf[BUF_LEN]
        __attribute__ ((aligned(__alignof__(struct inotify_event))));

    int inotifyFd = inotify_init1(IN_NONBLOCK);
    if (inotifyFd < 0) {
        LOG(ERROR) << "Could not initialize inotify: " << strerror(errno);
        return;
    }

    std::unordered_map<int, dir_map_t::const_iterator> active;
    for (dir_map_t::const_iterator it = watchDirs.begin();
         it != watchDirs.end(); ++it) {
        int wd = inotify_add_watch(inotifyFd, it->first.c_str(), WATCH_MASK);
        if (wd < 0) {
            LOG(ERROR) << "Could not watch " << it->first << ": "
                       << strerror(errno);
            close(inotifyFd);
            return;
        }
        active[wd] = it;
        if (initialScan)
            scanDir(it->first, it->second);
    }

    struct pollfd fds[2];
    fds[0].fd = stopFd;
    fds[0].events = POLLIN;
    fds[1].fd = inotifyFd;
    fds[1].events = POLLIN;

    bool running = true;
    while (running) {
        int n = poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG(ERROR) << "Error while polling for filesystem events: "
                       << strerror(errno);
            break;
        }
        if (fds[0].revents & POLLIN)
            break;
        if (!(fds[1].revents & POLLIN))
            continue;

        ssize_t len;
        while ((len = read(inotifyFd, buf, sizeof(buf))) > 0) {
            const struct inotify_event* event;
            for (char* ptr = buf; ptr < buf + len;
                 ptr += sizeof(struct inotify_event) + event->len) {
                event = (const struct inotify_event*)ptr;

                if (event->mask & IN_Q_OVERFLOW) {
                    // events were dropped; report current state again
                    LOG(WARNING) << "Filesystem event queue overflowed; "
                                 << "rescanning watched directories";
                    for (const dir_map_t::value_type& w : watchDirs)
                        scanDir(w.first, w.second);
                    continue;
                }
                if (!event->len) continue;

                auto ait = active.find(event->wd);
                if (ait == active.end()) continue;
                const fs::path& dir = ait->second->first;
                const watchers_t& watchers = ait->second->second;

                if (event->mask & (IN_CLOSE_WRITE | IN_MOVED_TO))
                    notify(watchers, dir / event->name, false);
                else if (event->mask & (IN_DELETE | IN_MOVED_FROM))
                    notify(watchers, dir / event->name, true);
            }
        }
        if (len < 0 && errno != EAGAIN) {
            LOG(ERROR) << "Error while reading filesystem events: "
                       << strerror(errno);
            running = false;
        }
    }

    close(inotifyFd);
#endif /* USE_INOTIFY */
}

} /* namespace sdnagent */
