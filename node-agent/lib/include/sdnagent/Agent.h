/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for Agent
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_AGENT_H
#define SDNAGENT_AGENT_H

#include <sdnagent/Backoff.h>
#include <sdnagent/FSWatcher.h>
#include <sdnagent/IsolationPolicy.h>
#include <sdnagent/NetNamespaceSource.h>
#include <sdnagent/VnidMap.h>
#ifdef HAVE_PROMETHEUS_SUPPORT
#include <sdnagent/PrometheusManager.h>
#endif

#include <boost/property_tree/ptree.hpp>
#include <boost/optional.hpp>
#include <boost/asio/io_service.hpp>
#include <boost/asio/deadline_timer.hpp>
#include <boost/noncopyable.hpp>

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>

namespace sdnagent {

/**
 * Master object for the SDN node agent.  This class holds the state
 * for the agent and handles initialization, configuration and
 * cleanup.
 */
class Agent : private boost::noncopyable {
public:
    /**
     * Instantiate a new agent
     */
    Agent();

    /**
     * Destroy the agent and clean up all state
     */
    ~Agent();

    /**
     * Configure the agent with the property tree specified.  Can be
     * called several times; later values override earlier ones.
     *
     * @param properties the configuration properties to set for the
     * agent
     */
    void setProperties(const boost::property_tree::ptree& properties);

    /**
     * Apply the properties set with setProperties to the agent
     * configuration and create the agent's components
     *
     * @throws std::runtime_error if the configuration is invalid
     */
    void applyProperties();

    /**
     * Start the agent.  The VNID map is fully populated from the
     * binding source when this returns.
     *
     * @throws std::runtime_error if the bindings cannot be listed or
     * the source directory cannot be watched
     */
    void start();

    /**
     * Stop the agent
     */
    void stop();

    /**
     * Get the VNID map.  Only valid after applyProperties.
     */
    VnidMap& getVnidMap() { return *vnidMap; }

    /**
     * Get the isolation policy.  Only valid after applyProperties.
     */
    IsolationPolicy& getIsolationPolicy() { return *policy; }

    /**
     * Get the configured isolation mode
     */
    const std::string& getIsolationMode() const { return isolationMode; }

    /**
     * Get the configured lookup backoff schedule
     */
    const Backoff& getLookupBackoff() const { return lookupBackoff; }

    /**
     * Get the interval between full resyncs in seconds, or 0 if
     * periodic resync is disabled
     */
    long getResyncInterval() const { return resyncInterval; }

    /**
     * Get the ASIO service for the agent for scheduling asynchronous
     * tasks in the io service thread.
     *
     * @return the asio io service
     */
    boost::asio::io_service& getAgentIOService() { return agent_io; }

private:
    boost::asio::io_service agent_io;
    std::unique_ptr<boost::asio::io_service::work> io_work;
    std::unique_ptr<std::thread> io_service_thread;

    FSWatcher fsWatcher;

    std::string isolationMode;
    std::set<std::string> netnsSourcePaths;
    Backoff lookupBackoff;
    long resyncInterval;

    std::unique_ptr<IsolationPolicy> policy;
    std::unique_ptr<NetNamespaceSource> netnsSource;
    std::unique_ptr<VnidMap> vnidMap;

    std::unique_ptr<boost::asio::deadline_timer> resyncTimer;

#ifdef HAVE_PROMETHEUS_SUPPORT
    PrometheusManager prometheusManager;
    bool prometheusEnabled;
    bool prometheusExposeLocalHostOnly;
    std::string prometheusPort;
#endif

    bool started;
    std::atomic<bool> stopping;

    void startResyncTimer();
    void onResyncTimer(const boost::system::error_code& ec);
};

} /* namespace sdnagent */

#endif /* SDNAGENT_AGENT_H */
