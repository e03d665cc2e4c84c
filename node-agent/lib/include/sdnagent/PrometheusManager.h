/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for PrometheusManager class.
 *
 * Copyright (c) 2019-2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_PROMETHEUS_MANAGER_H
#define SDNAGENT_PROMETHEUS_MANAGER_H

#include <memory>
#include <string>
#include <mutex>

#include <prometheus/gauge.h>
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>

namespace sdnagent {

/**
 * Prometheus manager is responsible for maintaining state of all
 * the metrics exposed from the node agent to prometheus. It is also
 * responsible for opening a http server to accept get requests for
 * exporting available metrics to prometheus.
 */
class PrometheusManager {
public:
    /**
     * Instantiate a new prometheus manager
     */
    PrometheusManager();

    /**
     * Destroy the prometheus manager and clean up all state
     */
    ~PrometheusManager() { stop(); }

    /**
     * Start the prometheus manager
     *
     * @param exposeLocalHostOnly flag to indicate if the the exposer
     * should be bound with local host only.
     * @param port the port to serve metrics on
     */
    void start(bool exposeLocalHostOnly, const std::string& port);

    /**
     * Stop the prometheus manager
     */
    void stop();

    /**
     * Count a VNID lookup that fell back to reading the binding
     * source
     */
    void incVnidNotFoundErrors();

    /**
     * Count a binding event dropped because of a duplicate VNID
     */
    void incVnidConflicts();

    /**
     * Set the number of namespaces with a binding
     */
    void setNetNamespaceCount(size_t count);

private:
    std::mutex prom_mutex;
    bool disabled;

    std::unique_ptr<prometheus::Exposer> exposer_ptr;
    std::shared_ptr<prometheus::Registry> registry_ptr;

    prometheus::Counter *vnid_not_found_ptr;
    prometheus::Counter *vnid_conflict_ptr;
    prometheus::Gauge *netns_count_ptr;
};

} /* namespace sdnagent */

#endif /* SDNAGENT_PROMETHEUS_MANAGER_H */
