/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for VNID listener
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_VNIDLISTENER_H
#define SDNAGENT_VNIDLISTENER_H

#include <cstdint>

namespace sdnagent {

/**
 * An abstract interface for classes interested in updates related to
 * the namespaces bound to a virtual network ID, such as a renderer
 * that programs isolation rules.
 */
class VnidListener {
public:
    /**
     * Instantiate a new VNID listener
     */
    VnidListener() {};

    /**
     * Destroy the VNID listener and clean up all state
     */
    virtual ~VnidListener() {};

    /**
     * Called when the set of namespaces bound to a VNID changes.  The
     * VNID map already reflects the change when this is called.
     *
     * @param vnid the virtual network ID that changed
     */
    virtual void vnidUpdated(uint32_t vnid) = 0;
};

} /* namespace sdnagent */

#endif /* SDNAGENT_VNIDLISTENER_H */
