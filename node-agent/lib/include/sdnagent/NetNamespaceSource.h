/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for network namespace source
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_NETNAMESPACESOURCE_H
#define SDNAGENT_NETNAMESPACESOURCE_H

#include <sdnagent/NetNamespace.h>

#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>

#include <string>
#include <vector>

namespace sdnagent {

/**
 * Receives watch events for namespace bindings.  Events for a given
 * source are delivered sequentially.
 */
class NetNamespaceHandler {
public:
    virtual ~NetNamespaceHandler() {}

    /**
     * A binding was observed for the first time
     */
    virtual void netNamespaceAdded(const NetNamespace& netns) = 0;

    /**
     * A previously observed binding was modified
     */
    virtual void netNamespaceUpdated(const NetNamespace& netns) = 0;

    /**
     * A binding was removed
     *
     * @param netns the last known state of the binding
     */
    virtual void netNamespaceDeleted(const NetNamespace& netns) = 0;
};

/**
 * An abstract base class for the authoritative source of namespace to
 * VNID bindings.  It supports a full list, a point read and a watch
 * subscription.
 */
class NetNamespaceSource : private boost::noncopyable {
public:
    virtual ~NetNamespaceSource() {}

    /**
     * List every binding currently known to the source
     *
     * @param netnss a vector that will be filled with the bindings
     * @throws std::runtime_error if the source cannot be listed
     */
    virtual void
    listNetNamespaces(/* out */ std::vector<NetNamespace>& netnss) = 0;

    /**
     * Read the binding for a single namespace
     *
     * @param netName the namespace name
     * @return the binding, or boost::none if the namespace has no
     * binding
     * @throws std::runtime_error if the source cannot be read
     */
    virtual boost::optional<NetNamespace>
    getNetNamespace(const std::string& netName) = 0;

    /**
     * Subscribe to binding events.  Only one handler is supported;
     * subscribing again replaces it.
     *
     * @param handler the handler to deliver events to.  It must
     * outlive the subscription.
     */
    virtual void watch(NetNamespaceHandler& handler) = 0;

    /**
     * Cancel the current subscription
     */
    virtual void unwatch() = 0;
};

} /* namespace sdnagent */

#endif /* SDNAGENT_NETNAMESPACESOURCE_H */
