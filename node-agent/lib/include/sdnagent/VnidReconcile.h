/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Reconciliation decisions for namespace binding events
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_VNIDRECONCILE_H
#define SDNAGENT_VNIDRECONCILE_H

#include <sdnagent/NetNamespace.h>

#include <boost/optional.hpp>

#include <ostream>
#include <string>

namespace sdnagent {

/**
 * The effect a binding event should have on the VNID map
 */
enum class ReconcileAction {
    /** Another namespace already holds the VNID */
    SKIP_DUPLICATE,
    /** The binding and multicast setting are unchanged */
    SKIP_UNCHANGED,
    /** Delete for a namespace with no binding */
    SKIP_UNKNOWN,
    /** Bind a namespace seen for the first time */
    ADD,
    /** Replace an existing binding */
    UPDATE,
    /** Remove an existing binding */
    DELETE
};

/**
 * The VNID map state relevant to a single event, captured under the
 * map lock
 */
struct VnidSnapshot {
    /**
     * The VNID currently bound to the event's namespace, if any
     */
    boost::optional<uint32_t> vnid;

    /**
     * The multicast flag currently recorded for the namespace
     */
    bool multicastEnabled = false;

    /**
     * A namespace other than the event's that is bound to the
     * event's VNID, if any
     */
    boost::optional<std::string> duplicateOwner;
};

/**
 * Decide how to apply an add or update event
 *
 * @param current the current state for the event's namespace and VNID
 * @param netns the binding carried by the event
 * @param allowDuplicates whether the isolation policy permits
 * namespaces to share a VNID
 * @return SKIP_DUPLICATE, SKIP_UNCHANGED, ADD or UPDATE
 */
ReconcileAction reconcileAddOrUpdate(const VnidSnapshot& current,
                                     const NetNamespace& netns,
                                     bool allowDuplicates);

/**
 * Decide how to apply a delete event
 *
 * @param current the current state for the event's namespace
 * @return SKIP_UNKNOWN or DELETE
 */
ReconcileAction reconcileDelete(const VnidSnapshot& current);

/**
 * Print a reconcile action to an ostream
 */
std::ostream& operator<<(std::ostream& os, ReconcileAction action);

} /* namespace sdnagent */

#endif /* SDNAGENT_VNIDRECONCILE_H */
