/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of binding event reconciliation decisions
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/VnidReconcile.h>

namespace sdnagent {

ReconcileAction reconcileAddOrUpdate(const VnidSnapshot& current,
                                     const NetNamespace& netns,
                                     bool allowDuplicates) {
    // first writer wins: a later claim on a taken VNID is ignored
    // until the earlier owner goes away
    if (!allowDuplicates && netns.getNetID() != GLOBAL_VNID &&
        current.duplicateOwner &&
        current.duplicateOwner.get() != netns.getNetName())
        return ReconcileAction::SKIP_DUPLICATE;

    if (!current.vnid)
        return ReconcileAction::ADD;

    if (current.vnid.get() == netns.getNetID() &&
        current.multicastEnabled == netns.isMulticastEnabled())
        return ReconcileAction::SKIP_UNCHANGED;

    return ReconcileAction::UPDATE;
}

ReconcileAction reconcileDelete(const VnidSnapshot& current) {
    if (!current.vnid)
        return ReconcileAction::SKIP_UNKNOWN;
    return ReconcileAction::DELETE;
}

std::ostream& operator<<(std::ostream& os, ReconcileAction action) {
    switch (action) {
    case ReconcileAction::SKIP_DUPLICATE: os << "skip-duplicate"; break;
    case ReconcileAction::SKIP_UNCHANGED: os << "skip-unchanged"; break;
    case ReconcileAction::SKIP_UNKNOWN:   os << "skip-unknown"; break;
    case ReconcileAction::ADD:            os << "add"; break;
    case ReconcileAction::UPDATE:         os << "update"; break;
    case ReconcileAction::DELETE:         os << "delete"; break;
    }
    return os;
}

} /* namespace sdnagent */
