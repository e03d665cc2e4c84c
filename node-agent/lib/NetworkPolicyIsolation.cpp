/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for NetworkPolicyIsolation class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/NetworkPolicyIsolation.h>
#include <sdnagent/logging.h>

namespace sdnagent {

using std::lock_guard;
using std::mutex;
using std::string;
using std::unordered_set;

void NetworkPolicyIsolation::removeNamespace(const string& name,
                                             uint32_t vnid) {
    vnid_ns_map_t::iterator it = policyNamespaces.find(vnid);
    if (it != policyNamespaces.end()) {
        it->second.erase(name);
        if (it->second.size() == 0)
            policyNamespaces.erase(it);
    }
}

void NetworkPolicyIsolation::addNetNamespace(const NetNamespace& netns) {
    {
        lock_guard<mutex> guard(np_mutex);
        policyNamespaces[netns.getNetID()].insert(netns.getNetName());
    }
    notifyListeners(netns.getNetID());
}

void NetworkPolicyIsolation::updateNetNamespace(const NetNamespace& netns,
                                                uint32_t oldNetID) {
    if (oldNetID != netns.getNetID()) {
        LOG(WARNING) << "Got VNID change for namespace "
                     << netns.getNetName() << " from " << oldNetID
                     << " to " << netns.getNetID()
                     << " while using network policy isolation";
        {
            lock_guard<mutex> guard(np_mutex);
            removeNamespace(netns.getNetName(), oldNetID);
            policyNamespaces[netns.getNetID()].insert(netns.getNetName());
        }
        notifyListeners(oldNetID);
    }
    notifyListeners(netns.getNetID());
}

void NetworkPolicyIsolation::deleteNetNamespace(const NetNamespace& netns) {
    {
        lock_guard<mutex> guard(np_mutex);
        removeNamespace(netns.getNetName(), netns.getNetID());
    }
    notifyListeners(netns.getNetID());
}

void NetworkPolicyIsolation::
syncNetNamespaces(const std::vector<NetNamespace>& netnss) {
    vnid_ns_map_t synced;
    for (const NetNamespace& netns : netnss)
        synced[netns.getNetID()].insert(netns.getNetName());

    unordered_set<uint32_t> changed;
    {
        lock_guard<mutex> guard(np_mutex);
        for (const vnid_ns_map_t::value_type& v : policyNamespaces)
            changed.insert(v.first);
        for (const vnid_ns_map_t::value_type& v : synced)
            changed.insert(v.first);
        policyNamespaces.swap(synced);
    }
    for (uint32_t vnid : changed)
        notifyListeners(vnid);
}

void NetworkPolicyIsolation::
getPolicyNamespaces(uint32_t vnid, /* out */ unordered_set<string>& names) {
    lock_guard<mutex> guard(np_mutex);
    vnid_ns_map_t::const_iterator it = policyNamespaces.find(vnid);
    if (it != policyNamespaces.end())
        names.insert(it->second.begin(), it->second.end());
}

} /* namespace sdnagent */
