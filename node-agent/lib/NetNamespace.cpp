/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for NetNamespace class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/NetNamespace.h>

namespace sdnagent {

const std::string MULTICAST_ENABLED_ANNOTATION =
    "netnamespace.network.openshift.io/multicast-enabled";

bool NetNamespace::isMulticastEnabled() const {
    auto it = annotations.find(MULTICAST_ENABLED_ANNOTATION);
    return it != annotations.end() && it->second == "true";
}

void NetNamespace::setMulticastEnabled(bool enabled) {
    if (enabled)
        annotations[MULTICAST_ENABLED_ANNOTATION] = "true";
    else
        annotations.erase(MULTICAST_ENABLED_ANNOTATION);
}

std::ostream& operator<<(std::ostream &os, const NetNamespace& netns) {
    os << "NetNamespace["
       << "name=" << netns.getName()
       << ",netname=" << netns.getNetName()
       << ",netid=" << netns.getNetID()
       << ",multicast=" << (netns.isMulticastEnabled() ? "true" : "false")
       << "]";
    return os;
}

} /* namespace sdnagent */
