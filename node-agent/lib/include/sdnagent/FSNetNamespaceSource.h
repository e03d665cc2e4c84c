/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for filesystem network namespace source
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_FSNETNAMESPACESOURCE_H
#define SDNAGENT_FSNETNAMESPACESOURCE_H

#include <sdnagent/NetNamespaceSource.h>
#include <sdnagent/FSWatcher.h>

#include <boost/filesystem.hpp>

#include <unordered_map>
#include <string>
#include <mutex>

namespace sdnagent {

/**
 * A namespace binding source that reads bindings from JSON files
 * with a ".netns" extension in a directory.  If supported, it will
 * set an inotify watch on the directory.
 */
class FSNetNamespaceSource
    : public NetNamespaceSource, public FSWatcher::Watcher {
public:
    /**
     * Instantiate a new binding source.  It will set a watch on the
     * given path.
     */
    FSNetNamespaceSource(FSWatcher& listener,
                         const std::string& netnsDir);

    /**
     * Destroy the binding source and clean up all state
     */
    virtual ~FSNetNamespaceSource() {}

    /**
     * Parse the binding stored in the given file
     *
     * @param filePath the path to the JSON file
     * @return the binding
     * @throws std::runtime_error if the file cannot be parsed or does
     * not name a namespace
     */
    static NetNamespace readNetNamespace(const boost::filesystem::path& filePath);

    // See NetNamespaceSource
    virtual void listNetNamespaces(std::vector<NetNamespace>& netnss);
    // See NetNamespaceSource
    virtual boost::optional<NetNamespace>
    getNetNamespace(const std::string& netName);
    // See NetNamespaceSource
    virtual void watch(NetNamespaceHandler& handler);
    // See NetNamespaceSource
    virtual void unwatch();

    // See Watcher
    virtual void updated(const boost::filesystem::path& filePath);
    // See Watcher
    virtual void deleted(const boost::filesystem::path& filePath);

private:
    typedef std::unordered_map<std::string, NetNamespace> netns_map_t;

    boost::filesystem::path netnsDir;

    /**
     * Bindings that are known to the filesystem watcher, by path
     */
    netns_map_t knownNetns;

    std::mutex handler_mutex;
    NetNamespaceHandler* handler;

    void scanDir(std::vector<NetNamespace>& netnss);
};

} /* namespace sdnagent */

#endif /* SDNAGENT_FSNETNAMESPACESOURCE_H */
