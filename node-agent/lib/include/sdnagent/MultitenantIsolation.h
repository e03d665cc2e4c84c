/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for multitenant isolation policy
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_MULTITENANTISOLATION_H
#define SDNAGENT_MULTITENANTISOLATION_H

#include <sdnagent/IsolationPolicy.h>

#include <unordered_map>
#include <unordered_set>
#include <mutex>

namespace sdnagent {

/**
 * Isolation policy where every tenant namespace owns its own VNID.
 * Only the global VNID may be shared.
 */
class MultitenantIsolation : public IsolationPolicy {
public:
    MultitenantIsolation() {}
    virtual ~MultitenantIsolation() {}

    // See IsolationPolicy
    virtual bool allowDuplicateNetID() const { return false; }
    // See IsolationPolicy
    virtual void addNetNamespace(const NetNamespace& netns);
    // See IsolationPolicy
    virtual void updateNetNamespace(const NetNamespace& netns,
                                    uint32_t oldNetID);
    // See IsolationPolicy
    virtual void deleteNetNamespace(const NetNamespace& netns);
    // See IsolationPolicy
    virtual void syncNetNamespaces(const std::vector<NetNamespace>& netnss);

    /**
     * Check whether any namespace currently uses the given VNID
     */
    bool isVnidInUse(uint32_t vnid);

    /**
     * Get the number of namespaces using the given VNID
     */
    size_t getVnidRefCount(uint32_t vnid);

private:
    void addVnidRef(uint32_t vnid);
    void removeVnidRef(uint32_t vnid);

    std::mutex vnid_mutex;
    std::unordered_map<uint32_t, size_t> vnidRefs;
};

} /* namespace sdnagent */

#endif /* SDNAGENT_MULTITENANTISOLATION_H */
