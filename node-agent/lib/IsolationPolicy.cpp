/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for IsolationPolicy class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/IsolationPolicy.h>
#include <sdnagent/MultitenantIsolation.h>
#include <sdnagent/NetworkPolicyIsolation.h>
#include <sdnagent/logging.h>

#include <stdexcept>

namespace sdnagent {

using std::unique_lock;
using std::mutex;

void IsolationPolicy::registerListener(VnidListener* listener) {
    unique_lock<mutex> guard(listener_mutex);
    vnidListeners.push_back(listener);
}

void IsolationPolicy::unregisterListener(VnidListener* listener) {
    unique_lock<mutex> guard(listener_mutex);
    vnidListeners.remove(listener);
}

void IsolationPolicy::notifyListeners(uint32_t vnid) {
    unique_lock<mutex> guard(listener_mutex);
    for (VnidListener* listener : vnidListeners) {
        listener->vnidUpdated(vnid);
    }
}

std::unique_ptr<IsolationPolicy>
createIsolationPolicy(const std::string& mode) {
    if (mode == "multitenant") {
        LOG(INFO) << "Using multitenant isolation";
        return std::unique_ptr<IsolationPolicy>(new MultitenantIsolation());
    } else if (mode == "networkpolicy") {
        LOG(INFO) << "Using network policy isolation";
        return std::unique_ptr<IsolationPolicy>(new NetworkPolicyIsolation());
    }
    throw std::runtime_error("Unknown isolation mode: " + mode);
}

} /* namespace sdnagent */
