/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for isolation policy
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_ISOLATIONPOLICY_H
#define SDNAGENT_ISOLATIONPOLICY_H

#include <sdnagent/NetNamespace.h>
#include <sdnagent/VnidListener.h>

#include <boost/noncopyable.hpp>

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sdnagent {

/**
 * An isolation policy is told about the lifecycle of namespace to
 * VNID bindings and decides whether namespaces may share a VNID.  The
 * VNID map calls these methods synchronously while reconciling; an
 * implementation may read from the VNID map but must not feed
 * bindings back into it.
 */
class IsolationPolicy : private boost::noncopyable {
public:
    virtual ~IsolationPolicy() {}

    /**
     * Whether more than one namespace may be bound to the same VNID
     */
    virtual bool allowDuplicateNetID() const = 0;

    /**
     * A namespace was bound to a VNID for the first time
     *
     * @param netns the new binding
     */
    virtual void addNetNamespace(const NetNamespace& netns) = 0;

    /**
     * The binding or multicast setting of a namespace changed
     *
     * @param netns the new binding
     * @param oldNetID the VNID the namespace was bound to before
     */
    virtual void updateNetNamespace(const NetNamespace& netns,
                                    uint32_t oldNetID) = 0;

    /**
     * The binding for a namespace was removed
     *
     * @param netns the binding that was removed
     */
    virtual void deleteNetNamespace(const NetNamespace& netns) = 0;

    /**
     * Replace any state held by the policy with the given set of
     * bindings.  Called once with the bindings installed when the
     * VNID map is first populated, before any add, update or delete
     * event is delivered.
     *
     * @param netnss the bindings currently held in the VNID map
     */
    virtual void
    syncNetNamespaces(const std::vector<NetNamespace>& netnss) = 0;

    /**
     * Register a listener for VNID change events
     *
     * @param listener the listener that should be called when the
     * namespaces on a VNID change.  This memory is owned by the
     * caller and should be freed only after it has been
     * unregistered.
     * @see VnidListener
     */
    void registerListener(VnidListener* listener);

    /**
     * Unregister the specified listener
     *
     * @param listener the listener to unregister
     */
    void unregisterListener(VnidListener* listener);

protected:
    /**
     * Notify the registered listeners that a VNID changed
     *
     * @param vnid the VNID
     */
    void notifyListeners(uint32_t vnid);

private:
    std::list<VnidListener*> vnidListeners;
    std::mutex listener_mutex;
};

/**
 * Allocate the isolation policy for the named cluster mode
 *
 * @param mode either "multitenant" or "networkpolicy"
 * @return the new policy
 * @throws std::runtime_error if the mode is not known
 */
std::unique_ptr<IsolationPolicy>
createIsolationPolicy(const std::string& mode);

} /* namespace sdnagent */

#endif /* SDNAGENT_ISOLATIONPOLICY_H */
