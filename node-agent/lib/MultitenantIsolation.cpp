/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for MultitenantIsolation class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/MultitenantIsolation.h>
#include <sdnagent/logging.h>

namespace sdnagent {

using std::lock_guard;
using std::mutex;

void MultitenantIsolation::addVnidRef(uint32_t vnid) {
    lock_guard<mutex> guard(vnid_mutex);
    vnidRefs[vnid] += 1;
}

void MultitenantIsolation::removeVnidRef(uint32_t vnid) {
    lock_guard<mutex> guard(vnid_mutex);
    auto it = vnidRefs.find(vnid);
    if (it == vnidRefs.end()) {
        LOG(WARNING) << "Releasing VNID " << vnid << " that is not in use";
        return;
    }
    if (--it->second == 0) {
        LOG(DEBUG) << "VNID " << vnid << " is no longer in use";
        vnidRefs.erase(it);
    }
}

void MultitenantIsolation::addNetNamespace(const NetNamespace& netns) {
    addVnidRef(netns.getNetID());
    notifyListeners(netns.getNetID());
}

void MultitenantIsolation::updateNetNamespace(const NetNamespace& netns,
                                              uint32_t oldNetID) {
    if (oldNetID != netns.getNetID()) {
        LOG(INFO) << "Moving namespace " << netns.getNetName()
                  << " from VNID " << oldNetID
                  << " to VNID " << netns.getNetID();
        addVnidRef(netns.getNetID());
        removeVnidRef(oldNetID);
        notifyListeners(oldNetID);
    }
    notifyListeners(netns.getNetID());
}

void MultitenantIsolation::deleteNetNamespace(const NetNamespace& netns) {
    removeVnidRef(netns.getNetID());
    notifyListeners(netns.getNetID());
}

void MultitenantIsolation::
syncNetNamespaces(const std::vector<NetNamespace>& netnss) {
    std::unordered_map<uint32_t, size_t> refs;
    for (const NetNamespace& netns : netnss)
        refs[netns.getNetID()] += 1;
    size_t vnidCount = refs.size();

    // Listeners see both the VNIDs that were released and the VNIDs
    // now held
    std::unordered_set<uint32_t> changed;
    {
        lock_guard<mutex> guard(vnid_mutex);
        for (const auto& r : vnidRefs)
            changed.insert(r.first);
        vnidRefs.swap(refs);
    }
    for (const NetNamespace& netns : netnss)
        changed.insert(netns.getNetID());
    LOG(DEBUG) << "Synchronized " << netnss.size()
               << " namespaces onto " << vnidCount << " VNIDs";

    for (uint32_t vnid : changed)
        notifyListeners(vnid);
}

bool MultitenantIsolation::isVnidInUse(uint32_t vnid) {
    lock_guard<mutex> guard(vnid_mutex);
    return vnidRefs.find(vnid) != vnidRefs.end();
}

size_t MultitenantIsolation::getVnidRefCount(uint32_t vnid) {
    lock_guard<mutex> guard(vnid_mutex);
    auto it = vnidRefs.find(vnid);
    if (it == vnidRefs.end())
        return 0;
    return it->second;
}

} /* namespace sdnagent */
