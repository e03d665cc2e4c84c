/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for a network namespace binding
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <string>
#include <unordered_map>
#include <ostream>
#include <cstdint>

#pragma once
#ifndef SDNAGENT_NETNAMESPACE_H
#define SDNAGENT_NETNAMESPACE_H

namespace sdnagent {

/**
 * The VNID shared by all global namespaces
 */
const uint32_t GLOBAL_VNID = 0;

/**
 * Annotation that enables multicast for a namespace when set to
 * "true"
 */
extern const std::string MULTICAST_ENABLED_ANNOTATION;

/**
 * The binding of a tenant namespace to a virtual network ID, as
 * observed from the cluster at a point in time.
 */
class NetNamespace {
public:
    /**
     * Default constructor
     */
    NetNamespace() : netID(GLOBAL_VNID) {}

    /**
     * Construct a binding of the given namespace to the given VNID.
     * The object name is set to the namespace name.
     *
     * @param netName_ the namespace name
     * @param netID_ the virtual network ID
     */
    NetNamespace(const std::string& netName_, uint32_t netID_)
        : name(netName_), netName(netName_), netID(netID_) {}

    /**
     * Get the name of the object carrying this binding
     */
    const std::string& getName() const {
        return name;
    }

    /**
     * Set the name of the object carrying this binding
     *
     * @param name the object name
     */
    void setName(const std::string& name) {
        this->name = name;
    }

    /**
     * Get the name of the namespace that is bound.  This is the key
     * used by the VNID map.
     */
    const std::string& getNetName() const {
        return netName;
    }

    /**
     * Set the name of the bound namespace
     *
     * @param netName the namespace name
     */
    void setNetName(const std::string& netName) {
        this->netName = netName;
    }

    /**
     * Get the virtual network ID
     */
    uint32_t getNetID() const {
        return netID;
    }

    /**
     * Set the virtual network ID
     *
     * @param netID the VNID
     */
    void setNetID(uint32_t netID) {
        this->netID = netID;
    }

    /**
     * Get the annotations on the source object
     */
    const std::unordered_map<std::string, std::string>&
    getAnnotations() const {
        return annotations;
    }

    /**
     * Add or replace an annotation
     *
     * @param key the annotation key
     * @param value the annotation value
     */
    void addAnnotation(const std::string& key, const std::string& value) {
        annotations[key] = value;
    }

    /**
     * Clear all annotations
     */
    void clearAnnotations() {
        annotations.clear();
    }

    /**
     * Whether multicast is enabled for this namespace.  Only an
     * annotation value of exactly "true" enables it.
     */
    bool isMulticastEnabled() const;

    /**
     * Set or clear the multicast annotation
     *
     * @param enabled true to enable multicast
     */
    void setMulticastEnabled(bool enabled);

private:
    std::string name;
    std::string netName;
    uint32_t netID;
    std::unordered_map<std::string, std::string> annotations;
};

/**
 * Print a binding to an ostream
 */
std::ostream& operator<<(std::ostream &os, const NetNamespace& netns);

} /* namespace sdnagent */

#endif /* SDNAGENT_NETNAMESPACE_H */
