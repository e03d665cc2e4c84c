/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for FSNetNamespaceSource class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <sdnagent/FSNetNamespaceSource.h>
#include <sdnagent/logging.h>

namespace sdnagent {

using boost::optional;
namespace fs = boost::filesystem;
using std::string;
using std::vector;
using std::runtime_error;
using std::lock_guard;
using std::mutex;

FSNetNamespaceSource::FSNetNamespaceSource(FSWatcher& listener,
                                           const std::string& netnsDir_)
    : netnsDir(netnsDir_), handler(NULL) {
    LOG(INFO) << "Watching " << netnsDir << " for network namespace data";
    listener.addWatch(netnsDir_, *this);
}

static bool isnetns(const fs::path& filePath) {
    string fstr = filePath.filename().string();
    return (boost::algorithm::ends_with(fstr, ".netns") &&
            !boost::algorithm::starts_with(fstr, "."));
}

NetNamespace
FSNetNamespaceSource::readNetNamespace(const fs::path& filePath) {
    static const std::string NAME("name");
    static const std::string NET_NAME("netname");
    static const std::string NET_ID("netid");
    static const std::string ANNOTATIONS("annotations");

    using boost::property_tree::ptree;
    ptree properties;
    read_json(filePath.string(), properties);

    optional<string> name = properties.get_optional<string>(NAME);
    optional<string> netName = properties.get_optional<string>(NET_NAME);
    if (!netName) netName = name;
    if (!netName || netName.get().empty())
        throw runtime_error("No namespace name in " + filePath.string());

    NetNamespace netns(netName.get(), properties.get<uint32_t>(NET_ID));
    if (name)
        netns.setName(name.get());

    optional<ptree&> annotations =
        properties.get_child_optional(ANNOTATIONS);
    if (annotations) {
        for (const ptree::value_type &v : annotations.get()) {
            netns.addAnnotation(v.first, v.second.data());
        }
    }
    return netns;
}

void FSNetNamespaceSource::scanDir(vector<NetNamespace>& netnss) {
    boost::system::error_code ec;
    if (!fs::is_directory(netnsDir, ec)) {
        throw runtime_error("Network namespace directory " +
                            netnsDir.string() + " is not readable");
    }

    fs::directory_iterator end;
    fs::directory_iterator it(netnsDir, ec);
    for (; !ec && it != end; it.increment(ec)) {
        if (!fs::is_regular_file(it->status()) || !isnetns(it->path()))
            continue;
        try {
            netnss.push_back(readNetNamespace(it->path()));
        } catch (const std::exception& ex) {
            LOG(ERROR) << "Skipping network namespace file "
                       << it->path() << ": " << ex.what();
        }
    }
    if (ec) {
        throw runtime_error("Could not list " + netnsDir.string() +
                            ": " + ec.message());
    }
}

void FSNetNamespaceSource::listNetNamespaces(vector<NetNamespace>& netnss) {
    scanDir(netnss);
    LOG(DEBUG) << "Listed " << netnss.size()
               << " network namespaces from " << netnsDir;
}

optional<NetNamespace>
FSNetNamespaceSource::getNetNamespace(const std::string& netName) {
    vector<NetNamespace> netnss;
    scanDir(netnss);
    for (const NetNamespace& netns : netnss) {
        if (netns.getNetName() == netName)
            return netns;
    }
    return boost::none;
}

void FSNetNamespaceSource::watch(NetNamespaceHandler& handler_) {
    lock_guard<mutex> guard(handler_mutex);
    handler = &handler_;
}

void FSNetNamespaceSource::unwatch() {
    lock_guard<mutex> guard(handler_mutex);
    handler = NULL;
}

void FSNetNamespaceSource::updated(const fs::path& filePath) {
    if (!isnetns(filePath)) return;

    NetNamespace netns;
    try {
        netns = readNetNamespace(filePath);
    } catch (const std::exception& ex) {
        LOG(ERROR) << "Could not load network namespace from: "
                   << filePath << ": " << ex.what();
        return;
    }

    lock_guard<mutex> guard(handler_mutex);
    string pathstr = filePath.string();
    netns_map_t::iterator it = knownNetns.find(pathstr);
    bool known = it != knownNetns.end();
    if (known && it->second.getNetName() != netns.getNetName()) {
        LOG(INFO) << "Network namespace file " << filePath
                  << " renamed " << it->second.getNetName()
                  << " to " << netns.getNetName();
        if (handler)
            handler->netNamespaceDeleted(it->second);
        known = false;
    }
    knownNetns[pathstr] = netns;

    LOG(DEBUG) << "Updated " << netns << " from " << filePath;
    if (!handler) return;
    if (known)
        handler->netNamespaceUpdated(netns);
    else
        handler->netNamespaceAdded(netns);
}

void FSNetNamespaceSource::deleted(const fs::path& filePath) {
    lock_guard<mutex> guard(handler_mutex);
    netns_map_t::iterator it = knownNetns.find(filePath.string());
    if (it == knownNetns.end()) return;

    NetNamespace netns = it->second;
    knownNetns.erase(it);
    LOG(DEBUG) << "Removed " << netns << " at " << filePath;
    if (handler)
        handler->netNamespaceDeleted(netns);
}

} /* namespace sdnagent */
