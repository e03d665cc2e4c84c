/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for network policy isolation
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_NETWORKPOLICYISOLATION_H
#define SDNAGENT_NETWORKPOLICYISOLATION_H

#include <sdnagent/IsolationPolicy.h>

#include <unordered_map>
#include <unordered_set>
#include <string>
#include <mutex>

namespace sdnagent {

/**
 * Isolation policy where namespaces may share VNIDs and isolation is
 * enforced by separate fine-grained network policy rules.
 */
class NetworkPolicyIsolation : public IsolationPolicy {
public:
    NetworkPolicyIsolation() {}
    virtual ~NetworkPolicyIsolation() {}

    // See IsolationPolicy
    virtual bool allowDuplicateNetID() const { return true; }
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
     * Get the namespaces that network policies are applied to for
     * the given VNID
     *
     * @param vnid the VNID
     * @param names a set that will be filled with the namespace names
     */
    void getPolicyNamespaces(uint32_t vnid,
                             /* out */ std::unordered_set<std::string>& names);

private:
    void removeNamespace(const std::string& name, uint32_t vnid);

    typedef std::unordered_map<uint32_t,
                               std::unordered_set<std::string> > vnid_ns_map_t;

    std::mutex np_mutex;
    vnid_ns_map_t policyNamespaces;
};

} /* namespace sdnagent */

#endif /* SDNAGENT_NETWORKPOLICYISOLATION_H */
