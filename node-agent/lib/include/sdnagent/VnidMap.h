/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for VNID map
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_VNIDMAP_H
#define SDNAGENT_VNIDMAP_H

#include <sdnagent/Backoff.h>
#include <sdnagent/IsolationPolicy.h>
#include <sdnagent/NetNamespaceSource.h>
#include <sdnagent/VnidReconcile.h>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace sdnagent {

#ifdef HAVE_PROMETHEUS_SUPPORT
class PrometheusManager;
#endif

/**
 * Thrown when no VNID can be found for a namespace, either locally or
 * from the binding source
 */
class VnidNotFoundException : public std::runtime_error {
public:
    /**
     * Create a new exception
     *
     * @param netName the namespace that could not be resolved
     * @param cause a description of the underlying failure
     */
    VnidNotFoundException(const std::string& netName,
                          const std::string& cause);

    /**
     * Get the namespace that could not be resolved
     */
    const std::string& getNetName() const { return netName; }

private:
    std::string netName;
};

/**
 * Node-local cache of namespace to VNID bindings.  The map is
 * populated from a binding source at startup and then kept up to date
 * from the source's watch events, which are reconciled against the
 * cached state before the isolation policy is told about them.
 */
class VnidMap : public NetNamespaceHandler, private boost::noncopyable {
public:
    /**
     * Instantiate a new VNID map
     *
     * @param policy the isolation policy to notify of binding changes
     * @param source the authoritative source of bindings
     */
    VnidMap(IsolationPolicy& policy, NetNamespaceSource& source);

    /**
     * Destroy the VNID map
     */
    virtual ~VnidMap();

    /**
     * Set the backoff schedule for waitAndGetVnid.  Must be called
     * before the map is shared with other threads.
     *
     * @param backoff the schedule
     */
    void setLookupBackoff(const Backoff& backoff);

    /**
     * Get the backoff schedule used by waitAndGetVnid
     */
    const Backoff& getLookupBackoff() const { return lookupBackoff; }

#ifdef HAVE_PROMETHEUS_SUPPORT
    /**
     * Export the map's counters through the given manager
     *
     * @param prometheusManager the manager, or NULL to stop exporting
     */
    void setPrometheusManager(PrometheusManager* prometheusManager);
#endif

    /**
     * Populate the map with a full list from the binding source, then
     * subscribe to the source's events.  Bindings from the list are
     * installed without consulting the isolation policy or raising
     * add events; the policy is instead handed the whole list once
     * through IsolationPolicy::syncNetNamespaces.
     *
     * @throws std::runtime_error if the source cannot be listed.  The
     * map is not subscribed in that case.
     */
    void start();

    /**
     * Unsubscribe from the binding source
     */
    void stop();

    /**
     * Get the namespaces bound to a VNID
     *
     * @param vnid the VNID
     * @param names a set that will be filled with the namespace names
     */
    void getNamespaces(uint32_t vnid,
                       /* out */ std::unordered_set<std::string>& names);

    /**
     * Check whether multicast is enabled for a VNID.  This is true
     * only if at least one namespace is bound to the VNID and every
     * namespace bound to it enables multicast.
     *
     * @param vnid the VNID
     */
    bool getMulticastEnabled(uint32_t vnid);

    /**
     * Get the VNID bound to a namespace from the local cache only
     *
     * @param netName the namespace name
     * @return the VNID or boost::none if the namespace is not bound
     */
    boost::optional<uint32_t> getVnid(const std::string& netName);

    /**
     * Get the number of namespaces that have a binding
     */
    size_t getNetNamespaceCount();

    /**
     * Get the VNID for a namespace whose binding may not have reached
     * the local cache yet.  The local cache is polled with the lookup
     * backoff schedule; if that fails the binding is read directly
     * from the source and reconciled into the map.  This can block
     * for the full backoff schedule plus one source read.
     *
     * @param netName the namespace name
     * @return the VNID
     * @throws VnidNotFoundException if the namespace has no binding
     * or the source could not be read
     */
    uint32_t waitAndGetVnid(const std::string& netName);

    /**
     * Number of times waitAndGetVnid exhausted its backoff schedule
     * and fell back to reading the source
     */
    uint64_t getVnidNotFoundErrors() const { return vnidNotFoundErrors; }

    /**
     * Number of add or update events dropped because another
     * namespace already held the VNID
     */
    uint64_t getConflictCount() const { return conflictCount; }

    /**
     * Reconcile the map against a full list from the binding source.
     * Locally bound namespaces missing from the list are deleted
     * first, then listed bindings are applied as add or update events.
     * A failure applying one binding is logged and does not stop the
     * others.
     *
     * @throws std::runtime_error if the source cannot be listed
     */
    void resync();

    // See NetNamespaceHandler
    virtual void netNamespaceAdded(const NetNamespace& netns);
    // See NetNamespaceHandler
    virtual void netNamespaceUpdated(const NetNamespace& netns);
    // See NetNamespaceHandler
    virtual void netNamespaceDeleted(const NetNamespace& netns);

private:
    IsolationPolicy& policy;
    NetNamespaceSource& source;
    Backoff lookupBackoff;

    typedef std::unordered_map<std::string, uint32_t> ns_vnid_map_t;
    typedef std::unordered_map<std::string, bool> ns_mc_map_t;
    typedef std::unordered_map<uint32_t,
                               std::unordered_set<std::string> > vnid_ns_map_t;

    /**
     * Guards ids, mcEnabled and namespaces, which are always updated
     * together
     */
    std::mutex vnid_mutex;
    ns_vnid_map_t ids;
    ns_mc_map_t mcEnabled;
    vnid_ns_map_t namespaces;

    /**
     * Serializes reconciliation from the watch stream, lookups and
     * resync.  Never held by readers.
     */
    std::mutex reconcile_mutex;

    std::atomic<uint64_t> vnidNotFoundErrors;
    std::atomic<uint64_t> conflictCount;
    bool started;

#ifdef HAVE_PROMETHEUS_SUPPORT
    std::atomic<PrometheusManager*> prometheusManager;
#endif

    void addNamespaceToSet(const std::string& name, uint32_t vnid);
    void removeNamespaceFromSet(const std::string& name, uint32_t vnid);
    VnidSnapshot getSnapshot(const NetNamespace& netns);
    void setVnid(const std::string& name, uint32_t vnid, bool mcEnabled);
    boost::optional<uint32_t> unsetVnid(const std::string& name);
    void updateCountMetric(size_t count);

    // must hold reconcile_mutex
    void applyAddOrUpdate(const NetNamespace& netns, const char* event);
    void applyDelete(const NetNamespace& netns, const char* event);

    void handleAddOrUpdate(const NetNamespace& netns, const char* event);
    void handleDelete(const NetNamespace& netns, const char* event);
};

} /* namespace sdnagent */

#endif /* SDNAGENT_VNIDMAP_H */
