/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for FSWatcher
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_FSWATCHER_H
#define SDNAGENT_FSWATCHER_H

#include <boost/filesystem.hpp>
#include <boost/noncopyable.hpp>

#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace sdnagent {

/**
 * Watch a set of directories for files being written, moved or
 * removed, and deliver the changes from a single polling thread.
 * Uses inotify where the platform provides it.
 */
class FSWatcher : private boost::noncopyable {
public:
    FSWatcher();
    ~FSWatcher();

    /**
     * Receives changes to regular files in a watched directory
     */
    class Watcher {
    public:
        virtual ~Watcher() {}

        /**
         * A file was written or moved into the directory
         */
        virtual void updated(const boost::filesystem::path& filePath) = 0;

        /**
         * A file was removed or moved out of the directory
         */
        virtual void deleted(const boost::filesystem::path& filePath) = 0;
    };

    /**
     * Register a watcher for a directory.  Must be called before
     * start.
     */
    void addWatch(const std::string& watchDir, Watcher& watcher);

    /**
     * Whether to report every existing file as updated when the
     * watch is established.  Default true.
     */
    void setInitialScan(bool scan);

    /**
     * Establish the watches and start the polling thread
     *
     * @throws std::runtime_error if a watched directory does not
     * exist or the thread cannot be signalled
     */
    void start();

    /**
     * Stop the polling thread.  No callbacks are in progress when
     * this returns.
     */
    void stop();

private:
    typedef std::vector<Watcher*> watchers_t;
    typedef std::map<boost::filesystem::path, watchers_t> dir_map_t;

    dir_map_t watchDirs;
    std::unique_ptr<std::thread> pollThread;
    int stopFd;
    bool initialScan;

    void run();
    void scanDir(const boost::filesystem::path& dir,
                 const watchers_t& watchers);
    void notify(const watchers_t& watchers,
                const boost::filesystem::path& filePath, bool removed);
};

} /* namespace sdnagent */

#endif /* SDNAGENT_FSWATCHER_H */
