/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for PrometheusManager class.
 *
 * Copyright (c) 2019-2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/PrometheusManager.h>
#include <sdnagent/logging.h>

namespace sdnagent {

using std::lock_guard;
using std::mutex;
using std::string;
using namespace prometheus;

#define RETURN_IF_DISABLED  if (disabled) {return;}

PrometheusManager::PrometheusManager()
    : disabled(true), vnid_not_found_ptr(nullptr),
      vnid_conflict_ptr(nullptr), netns_count_ptr(nullptr) {
}

void PrometheusManager::start(bool exposeLocalHostOnly, const string& port)
{
    lock_guard<mutex> lock(prom_mutex);
    if (!disabled) return;
    disabled = false;
    LOG(DEBUG) << "starting prometheus manager,"
               << " exposeLHOnly: " << exposeLocalHostOnly
               << " port: " << port;

    // 1 worker thread services the scrape requests
    string bindAddress = exposeLocalHostOnly ? "127.0.0.1:" + port : port;
    exposer_ptr = std::unique_ptr<Exposer>(new Exposer{bindAddress, "/metrics", 1});
    registry_ptr = std::make_shared<Registry>();

    // families are owned by the registry
    auto& not_found_family = BuildCounter()
                         .Name("sdn_node_vnid_not_found_errors_total")
                         .Help("Total number of VNID lookups that exhausted "
                               "the backoff before the binding was found")
                         .Labels({})
                         .Register(*registry_ptr);
    vnid_not_found_ptr = &not_found_family.Add({});

    auto& conflict_family = BuildCounter()
                         .Name("sdn_node_vnid_conflicts_total")
                         .Help("Total number of namespace bindings ignored "
                               "because the VNID belongs to another namespace")
                         .Labels({})
                         .Register(*registry_ptr);
    vnid_conflict_ptr = &conflict_family.Add({});

    auto& netns_family = BuildGauge()
                         .Name("sdn_node_netnamespaces")
                         .Help("Number of namespaces with a VNID binding")
                         .Labels({})
                         .Register(*registry_ptr);
    netns_count_ptr = &netns_family.Add({});

    // ask the exposer to scrape the registry on incoming scrapes
    exposer_ptr->RegisterCollectable(registry_ptr);
}

void PrometheusManager::stop()
{
    lock_guard<mutex> lock(prom_mutex);
    RETURN_IF_DISABLED
    disabled = true;
    LOG(DEBUG) << "stopping prometheus manager";

    vnid_not_found_ptr = nullptr;
    vnid_conflict_ptr = nullptr;
    netns_count_ptr = nullptr;

    exposer_ptr.reset();
    registry_ptr.reset();
}

void PrometheusManager::incVnidNotFoundErrors()
{
    lock_guard<mutex> lock(prom_mutex);
    RETURN_IF_DISABLED
    vnid_not_found_ptr->Increment();
}

void PrometheusManager::incVnidConflicts()
{
    lock_guard<mutex> lock(prom_mutex);
    RETURN_IF_DISABLED
    vnid_conflict_ptr->Increment();
}

void PrometheusManager::setNetNamespaceCount(size_t count)
{
    lock_guard<mutex> lock(prom_mutex);
    RETURN_IF_DISABLED
    netns_count_ptr->Set(static_cast<double>(count));
}

} /* namespace sdnagent */
