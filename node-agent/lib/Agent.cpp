/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for Agent class
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/Agent.h>
#include <sdnagent/FSNetNamespaceSource.h>
#include <sdnagent/logging.h>

#include <stdexcept>

namespace sdnagent {

using std::thread;
using std::string;
using std::runtime_error;
using boost::property_tree::ptree;
using boost::optional;
using boost::asio::io_service;
using boost::asio::deadline_timer;
using boost::posix_time::seconds;

// Lookups block the caller for the whole schedule
static const uint32_t MAX_LOOKUP_STEPS = 100;

Agent::Agent()
    : isolationMode("multitenant"),
      lookupBackoff(Backoff::defaultLookup()),
      resyncInterval(0),
#ifdef HAVE_PROMETHEUS_SUPPORT
      prometheusEnabled(true),
      prometheusExposeLocalHostOnly(false),
      prometheusPort("9615"),
#endif
      started(false), stopping(false) {
}

Agent::~Agent() {
    stop();
}

void Agent::setProperties(const ptree& properties) {
    static const std::string LOG_LEVEL("log.level");
    static const std::string ISOLATION_MODE("isolation.mode");
    static const std::string NETNS_SOURCE_PATH("netnamespace-sources.filesystem");
    static const std::string BACKOFF_DELAY("vnid.lookup-backoff.initial-delay");
    static const std::string BACKOFF_FACTOR("vnid.lookup-backoff.factor");
    static const std::string BACKOFF_STEPS("vnid.lookup-backoff.steps");
    static const std::string RESYNC_INTERVAL("vnid.resync-interval");
#ifdef HAVE_PROMETHEUS_SUPPORT
    static const std::string PROMETHEUS_ENABLED("prometheus.enabled");
    static const std::string PROMETHEUS_LOCALHOST_ONLY("prometheus.localhost-only");
    static const std::string PROMETHEUS_PORT("prometheus.port");
#endif

    optional<std::string> logLvl =
        properties.get_optional<std::string>(LOG_LEVEL);
    if (logLvl) {
        setLoggingLevel(logLvl.get());
    }

    optional<std::string> mode =
        properties.get_optional<std::string>(ISOLATION_MODE);
    if (mode) isolationMode = mode.get();

    optional<const ptree&> netnsSource =
        properties.get_child_optional(NETNS_SOURCE_PATH);
    if (netnsSource) {
        if (netnsSource.get().empty()) {
            netnsSourcePaths.insert(netnsSource.get().data());
        } else {
            for (const ptree::value_type &v : netnsSource.get())
                netnsSourcePaths.insert(v.second.data());
        }
    }

    optional<long> delay = properties.get_optional<long>(BACKOFF_DELAY);
    optional<double> factor = properties.get_optional<double>(BACKOFF_FACTOR);
    optional<uint32_t> steps = properties.get_optional<uint32_t>(BACKOFF_STEPS);
    if (delay || factor || steps) {
        lookupBackoff =
            Backoff(delay ? std::chrono::milliseconds(delay.get())
                          : lookupBackoff.getDuration(),
                    factor ? factor.get() : lookupBackoff.getFactor(),
                    steps ? steps.get() : lookupBackoff.getSteps());
    }

    optional<long> resync = properties.get_optional<long>(RESYNC_INTERVAL);
    if (resync) resyncInterval = resync.get();

#ifdef HAVE_PROMETHEUS_SUPPORT
    optional<bool> promEnabled =
        properties.get_optional<bool>(PROMETHEUS_ENABLED);
    if (promEnabled) prometheusEnabled = promEnabled.get();

    optional<bool> promLocalHostOnly =
        properties.get_optional<bool>(PROMETHEUS_LOCALHOST_ONLY);
    if (promLocalHostOnly)
        prometheusExposeLocalHostOnly = promLocalHostOnly.get();

    optional<std::string> promPort =
        properties.get_optional<std::string>(PROMETHEUS_PORT);
    if (promPort) prometheusPort = promPort.get();
#endif
}

void Agent::applyProperties() {
    // the filesystem watcher keeps a reference to the source
    if (vnidMap)
        throw runtime_error("Agent properties have already been applied");

    if (netnsSourcePaths.empty()) {
        LOG(ERROR) << "No network namespace source found in configuration";
        throw runtime_error("No network namespace source configured");
    }
    if (netnsSourcePaths.size() > 1) {
        LOG(ERROR) << "Only one network namespace source is supported";
        throw runtime_error("Multiple network namespace sources configured");
    }
    if (lookupBackoff.getSteps() == 0 ||
        lookupBackoff.getSteps() > MAX_LOOKUP_STEPS ||
        lookupBackoff.getFactor() < 1.0 ||
        lookupBackoff.getDuration().count() < 0 ||
        lookupBackoff.getDuration() > Backoff::MAX_DURATION) {
        throw runtime_error("Invalid VNID lookup backoff");
    }
    if (resyncInterval < 0) {
        throw runtime_error("Invalid VNID resync interval");
    }

    policy = createIsolationPolicy(isolationMode);
    netnsSource.reset(new FSNetNamespaceSource(fsWatcher,
                                               *netnsSourcePaths.begin()));
    vnidMap.reset(new VnidMap(*policy, *netnsSource));
    vnidMap->setLookupBackoff(lookupBackoff);

    LOG(INFO) << "VNID lookup backoff: "
              << lookupBackoff.getDuration().count() << "ms, factor "
              << lookupBackoff.getFactor() << ", "
              << lookupBackoff.getSteps() << " steps";
    if (resyncInterval > 0)
        LOG(INFO) << "VNID resync interval set to " << resyncInterval
                  << " secs";
}

void Agent::start() {
    if (started) return;
    if (!vnidMap)
        throw runtime_error("Agent properties have not been applied");

    LOG(INFO) << "Starting SDN node agent";
    stopping = false;

#ifdef HAVE_PROMETHEUS_SUPPORT
    if (prometheusEnabled) {
        prometheusManager.start(prometheusExposeLocalHostOnly,
                                prometheusPort);
        vnidMap->setPrometheusManager(&prometheusManager);
    } else {
        LOG(DEBUG) << "prometheus not enabled";
    }
#endif

    try {
        vnidMap->start();
        fsWatcher.start();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Could not start VNID map: " << e.what();
        vnidMap->stop();
#ifdef HAVE_PROMETHEUS_SUPPORT
        vnidMap->setPrometheusManager(NULL);
        prometheusManager.stop();
#endif
        throw;
    }

    io_work.reset(new io_service::work(agent_io));
    io_service_thread.reset(new thread([this]() { agent_io.run(); }));
    if (resyncInterval > 0) {
        agent_io.post([this]() { startResyncTimer(); });
    }

    started = true;
}

void Agent::startResyncTimer() {
    resyncTimer.reset(new deadline_timer(agent_io, seconds(resyncInterval)));
    resyncTimer->async_wait([this](const boost::system::error_code& ec) {
            onResyncTimer(ec);
        });
}

void Agent::onResyncTimer(const boost::system::error_code& ec) {
    if (ec || stopping) {
        // shut down the timer when we get a cancellation
        return;
    }

    try {
        vnidMap->resync();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Could not resync VNID map: " << e.what();
    }

    if (!stopping) {
        resyncTimer->expires_at(resyncTimer->expires_at() +
                                seconds(resyncInterval));
        resyncTimer->async_wait([this](const boost::system::error_code& ec) {
                onResyncTimer(ec);
            });
    }
}

void Agent::stop() {
    if (!started) return;
    LOG(INFO) << "Stopping SDN node agent";
    stopping = true;

    agent_io.post([this]() {
            if (resyncTimer) resyncTimer->cancel();
        });
    if (io_work) {
        io_work.reset();
    }
    if (io_service_thread) {
        io_service_thread->join();
        io_service_thread.reset();
        LOG(DEBUG) << "IO service thread stopped";
    }
    resyncTimer.reset();
    agent_io.reset();

    fsWatcher.stop();
    vnidMap->stop();

#ifdef HAVE_PROMETHEUS_SUPPORT
    vnidMap->setPrometheusManager(NULL);
    prometheusManager.stop();
    LOG(DEBUG) << "Prometheus Manager stopped";
#endif

    started = false;
    LOG(INFO) << "Agent stopped";
}

} /* namespace sdnagent */
