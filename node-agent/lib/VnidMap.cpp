/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for VnidMap class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/VnidMap.h>
#include <sdnagent/logging.h>
#ifdef HAVE_PROMETHEUS_SUPPORT
#include <sdnagent/PrometheusManager.h>
#endif

#include <vector>

namespace sdnagent {

using std::string;
using std::vector;
using std::unordered_set;
using std::unique_lock;
using std::mutex;
using boost::optional;

VnidNotFoundException::VnidNotFoundException(const string& netName_,
                                             const string& cause)
    : std::runtime_error("failed to find netid for namespace: " +
                         netName_ + ", " + cause),
      netName(netName_) {}

VnidMap::VnidMap(IsolationPolicy& policy_, NetNamespaceSource& source_)
    : policy(policy_), source(source_),
      lookupBackoff(Backoff::defaultLookup()),
      vnidNotFoundErrors(0), conflictCount(0), started(false)
#ifdef HAVE_PROMETHEUS_SUPPORT
      , prometheusManager(NULL)
#endif
{
}

VnidMap::~VnidMap() {
    stop();
}

void VnidMap::setLookupBackoff(const Backoff& backoff) {
    lookupBackoff = backoff;
}

#ifdef HAVE_PROMETHEUS_SUPPORT
void VnidMap::setPrometheusManager(PrometheusManager* prometheusManager_) {
    prometheusManager = prometheusManager_;
    if (prometheusManager_)
        updateCountMetric(getNetNamespaceCount());
}
#endif

void VnidMap::updateCountMetric(size_t count) {
#ifdef HAVE_PROMETHEUS_SUPPORT
    PrometheusManager* pm = prometheusManager;
    if (pm)
        pm->setNetNamespaceCount(count);
#endif
}

void VnidMap::addNamespaceToSet(const string& name, uint32_t vnid) {
    namespaces[vnid].insert(name);
}

void VnidMap::removeNamespaceFromSet(const string& name, uint32_t vnid) {
    vnid_ns_map_t::iterator it = namespaces.find(vnid);
    if (it != namespaces.end()) {
        it->second.erase(name);
        if (it->second.size() == 0)
            namespaces.erase(it);
    }
}

void VnidMap::getNamespaces(uint32_t vnid,
                            /* out */ unordered_set<string>& names) {
    unique_lock<mutex> guard(vnid_mutex);
    vnid_ns_map_t::const_iterator it = namespaces.find(vnid);
    if (it != namespaces.end())
        names.insert(it->second.begin(), it->second.end());
}

bool VnidMap::getMulticastEnabled(uint32_t vnid) {
    unique_lock<mutex> guard(vnid_mutex);
    vnid_ns_map_t::const_iterator it = namespaces.find(vnid);
    if (it == namespaces.end() || it->second.empty())
        return false;
    for (const string& name : it->second) {
        ns_mc_map_t::const_iterator mit = mcEnabled.find(name);
        if (mit == mcEnabled.end() || !mit->second)
            return false;
    }
    return true;
}

optional<uint32_t> VnidMap::getVnid(const string& netName) {
    unique_lock<mutex> guard(vnid_mutex);
    ns_vnid_map_t::const_iterator it = ids.find(netName);
    if (it != ids.end())
        return it->second;
    return boost::none;
}

size_t VnidMap::getNetNamespaceCount() {
    unique_lock<mutex> guard(vnid_mutex);
    return ids.size();
}

VnidSnapshot VnidMap::getSnapshot(const NetNamespace& netns) {
    VnidSnapshot snapshot;
    unique_lock<mutex> guard(vnid_mutex);
    ns_vnid_map_t::const_iterator it = ids.find(netns.getNetName());
    if (it != ids.end()) {
        snapshot.vnid = it->second;
        snapshot.multicastEnabled = mcEnabled[netns.getNetName()];
    }
    vnid_ns_map_t::const_iterator nit = namespaces.find(netns.getNetID());
    if (nit != namespaces.end()) {
        for (const string& name : nit->second) {
            if (name != netns.getNetName()) {
                snapshot.duplicateOwner = name;
                break;
            }
        }
    }
    return snapshot;
}

void VnidMap::setVnid(const string& name, uint32_t vnid, bool mc) {
    size_t count;
    {
        unique_lock<mutex> guard(vnid_mutex);
        ns_vnid_map_t::const_iterator it = ids.find(name);
        if (it != ids.end())
            removeNamespaceFromSet(name, it->second);
        ids[name] = vnid;
        mcEnabled[name] = mc;
        addNamespaceToSet(name, vnid);
        count = ids.size();
    }
    updateCountMetric(count);

    LOG(DEBUG) << "Associate netid " << vnid << " to namespace \""
               << name << "\" with mcEnabled " << mc;
}

optional<uint32_t> VnidMap::unsetVnid(const string& name) {
    uint32_t vnid;
    size_t count;
    {
        unique_lock<mutex> guard(vnid_mutex);
        ns_vnid_map_t::iterator it = ids.find(name);
        if (it == ids.end())
            return boost::none;
        vnid = it->second;
        removeNamespaceFromSet(name, vnid);
        ids.erase(it);
        mcEnabled.erase(name);
        count = ids.size();
    }
    updateCountMetric(count);

    LOG(DEBUG) << "Dissociate netid " << vnid << " from namespace \""
               << name << "\"";
    return vnid;
}

void VnidMap::start() {
    if (started) return;

    // Populate synchronously so that readers see existing bindings
    // as soon as start returns
    unique_lock<mutex> guard(reconcile_mutex);
    vector<NetNamespace> netnss;
    source.listNetNamespaces(netnss);
    for (const NetNamespace& netns : netnss) {
        setVnid(netns.getNetName(), netns.getNetID(),
                netns.isMulticastEnabled());
    }
    LOG(INFO) << "Populated VNID map with " << netnss.size()
              << " network namespaces";

    // The watch replays these bindings as unchanged, so this is the
    // only time the policy learns about them
    policy.syncNetNamespaces(netnss);

    guard.unlock();
    source.watch(*this);
    started = true;
}

void VnidMap::stop() {
    if (!started) return;
    source.unwatch();
    started = false;
}

void VnidMap::applyAddOrUpdate(const NetNamespace& netns,
                               const char* event) {
    VnidSnapshot current = getSnapshot(netns);
    ReconcileAction action =
        reconcileAddOrUpdate(current, netns, policy.allowDuplicateNetID());
    LOG(DEBUG) << event << " event for " << netns << ": " << action;

    switch (action) {
    case ReconcileAction::SKIP_DUPLICATE:
        conflictCount += 1;
#ifdef HAVE_PROMETHEUS_SUPPORT
        {
            PrometheusManager* pm = prometheusManager;
            if (pm) pm->incVnidConflicts();
        }
#endif
        LOG(WARNING) << "Netid " << netns.getNetID() << " for namespace "
                     << netns.getNetName()
                     << " already exists under different namespace "
                     << current.duplicateOwner.get();
        return;
    case ReconcileAction::SKIP_UNCHANGED:
        return;
    default:
        break;
    }

    setVnid(netns.getNetName(), netns.getNetID(),
            netns.isMulticastEnabled());
    if (action == ReconcileAction::ADD)
        policy.addNetNamespace(netns);
    else
        policy.updateNetNamespace(netns, current.vnid.get());
}

void VnidMap::applyDelete(const NetNamespace& netns, const char* event) {
    LOG(DEBUG) << event << " event for " << netns;

    // Unset first so readers never see a VNID the policy is already
    // tearing down
    VnidSnapshot removed;
    removed.vnid = unsetVnid(netns.getNetName());
    if (reconcileDelete(removed) == ReconcileAction::SKIP_UNKNOWN) {
        LOG(WARNING) << "Failed to delete namespace " << netns.getNetName()
                     << ": not found in vnid map";
        return;
    }
    if (removed.vnid.get() != netns.getNetID()) {
        // The event carries a binding that was never applied, such as
        // an update dropped as a duplicate
        LOG(DEBUG) << "Namespace " << netns.getNetName()
                   << " was bound to VNID " << removed.vnid.get()
                   << " rather than " << netns.getNetID();
        NetNamespace bound(netns);
        bound.setNetID(removed.vnid.get());
        policy.deleteNetNamespace(bound);
        return;
    }
    policy.deleteNetNamespace(netns);
}

void VnidMap::handleAddOrUpdate(const NetNamespace& netns,
                                const char* event) {
    unique_lock<mutex> guard(reconcile_mutex);
    try {
        applyAddOrUpdate(netns, event);
    } catch (const std::exception& ex) {
        LOG(ERROR) << "Error while reconciling " << event << " event for "
                   << netns << ": " << ex.what();
    }
}

void VnidMap::handleDelete(const NetNamespace& netns, const char* event) {
    unique_lock<mutex> guard(reconcile_mutex);
    try {
        applyDelete(netns, event);
    } catch (const std::exception& ex) {
        LOG(ERROR) << "Error while reconciling " << event << " event for "
                   << netns << ": " << ex.what();
    }
}

void VnidMap::netNamespaceAdded(const NetNamespace& netns) {
    handleAddOrUpdate(netns, "Added");
}

void VnidMap::netNamespaceUpdated(const NetNamespace& netns) {
    handleAddOrUpdate(netns, "Modified");
}

void VnidMap::netNamespaceDeleted(const NetNamespace& netns) {
    handleDelete(netns, "Deleted");
}

uint32_t VnidMap::waitAndGetVnid(const string& netName) {
    uint32_t vnid = 0;
    bool found = exponentialBackoff(lookupBackoff, [&]() -> bool {
            optional<uint32_t> id = getVnid(netName);
            if (id) vnid = id.get();
            return (bool)id;
        });
    if (found)
        return vnid;

    // The binding may still exist in the source, but count the miss
    // so that a lookup budget that is too short shows up
    vnidNotFoundErrors += 1;
#ifdef HAVE_PROMETHEUS_SUPPORT
    {
        PrometheusManager* pm = prometheusManager;
        if (pm) pm->incVnidNotFoundErrors();
    }
#endif

    optional<NetNamespace> netns;
    try {
        netns = source.getNetNamespace(netName);
    } catch (const std::exception& ex) {
        throw VnidNotFoundException(netName, ex.what());
    }
    if (!netns) {
        throw VnidNotFoundException(netName,
                                    "no network namespace in source");
    }

    LOG(WARNING) << "Netid for namespace: " << netName
                 << " exists but not found in vnid map";
    handleAddOrUpdate(netns.get(), "Added");
    return netns.get().getNetID();
}

void VnidMap::resync() {
    unique_lock<mutex> guard(reconcile_mutex);

    vector<NetNamespace> netnss;
    source.listNetNamespaces(netnss);

    unordered_set<string> listed;
    for (const NetNamespace& netns : netnss)
        listed.insert(netns.getNetName());

    // Remove stale bindings first so that a namespace dropped as a
    // duplicate of one of them is bound in the same pass
    vector<NetNamespace> stale;
    {
        unique_lock<mutex> vguard(vnid_mutex);
        for (const ns_vnid_map_t::value_type& v : ids) {
            if (listed.find(v.first) != listed.end())
                continue;
            NetNamespace netns(v.first, v.second);
            netns.setMulticastEnabled(mcEnabled[v.first]);
            stale.push_back(netns);
        }
    }
    for (const NetNamespace& netns : stale) {
        try {
            applyDelete(netns, "Resync");
        } catch (const std::exception& ex) {
            LOG(ERROR) << "Error while resynchronizing stale binding "
                       << netns << ": " << ex.what();
        }
    }

    for (const NetNamespace& netns : netnss) {
        try {
            applyAddOrUpdate(netns, "Resync");
        } catch (const std::exception& ex) {
            LOG(ERROR) << "Error while resynchronizing binding "
                       << netns << ": " << ex.what();
        }
    }

    LOG(DEBUG) << "Resynchronized VNID map: " << netnss.size()
               << " listed, " << stale.size() << " removed";
}

} /* namespace sdnagent */
