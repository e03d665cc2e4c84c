/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Main implementation for the SDN node agent
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/Agent.h>
#include <sdnagent/VnidListener.h>
#include <sdnagent/logging.h>
#include <sdnagent/cmd.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <boost/iostreams/filter/line.hpp>

#include <string>
#include <iostream>
#include <fstream>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <set>

#include <csignal>
#include <cstring>

using std::string;
using std::vector;
namespace po = boost::program_options;
namespace fs = boost::filesystem;
namespace pt = boost::property_tree;
using namespace sdnagent;

#ifndef DEFAULT_CONF
#define DEFAULT_CONF "/etc/sdn-node-agent/sdn-node-agent.conf"
#endif

namespace {

/**
 * Drops lines that start with # or //
 */
class CommentFilter : public boost::iostreams::line_filter {
private:
    virtual std::string do_filter(const std::string& line) {
        string trimmed = boost::trim_copy(line);
        if (boost::starts_with(trimmed, "#") ||
            boost::starts_with(trimmed, "//"))
            return string();
        return line;
    }
};

bool isConfigFile(const fs::path& file) {
    const string name = file.filename().string();
    return boost::ends_with(name, ".conf") && !boost::starts_with(name, ".");
}

void loadConfigFile(Agent& agent, const string& configFile) {
    LOG(INFO) << "Reading configuration from " << configFile;

    std::ifstream file(configFile.c_str(),
                       std::ios_base::in | std::ios_base::binary);
    if (!file)
        throw std::runtime_error("Could not open config file " + configFile);

    boost::iostreams::filtering_streambuf<boost::iostreams::input> inbuf;
    inbuf.push(CommentFilter());
    inbuf.push(file);
    std::istream instream(&inbuf);

    pt::ptree properties;
    try {
        pt::read_json(instream, properties);
    } catch (const pt::json_parser_error& e) {
        LOG(ERROR) << "Error parsing config file: " << configFile << "("
                   << e.line() << "): " << e.message();
        throw;
    }
    agent.setProperties(properties);
}

/**
 * Load each configuration path in order.  Directories contribute
 * their *.conf files sorted by name.
 */
void loadConfig(Agent& agent, const vector<string>& configPaths) {
    for (const string& configPath : configPaths) {
        if (!fs::is_directory(configPath)) {
            loadConfigFile(agent, configPath);
            continue;
        }

        std::set<string> files;
        for (fs::directory_iterator it(configPath), end; it != end; ++it) {
            if (isConfigFile(it->path()))
                files.insert(it->path().string());
        }
        for (const string& file : files)
            loadConfigFile(agent, file);
    }
}

/**
 * Logs the namespaces sharing a VNID whenever the isolation policy
 * reports a change to it
 */
class VnidChangeLogger : public VnidListener {
public:
    VnidChangeLogger(VnidMap& vnidMap_) : vnidMap(vnidMap_) {}

    virtual void vnidUpdated(uint32_t vnid) {
        std::unordered_set<string> names;
        vnidMap.getNamespaces(vnid, names);
        std::set<string> sorted(names.begin(), names.end());
        LOG(INFO) << "VNID " << vnid << " now used by ["
                  << boost::algorithm::join(sorted, ",")
                  << "], multicast "
                  << (vnidMap.getMulticastEnabled(vnid) ? "on" : "off");
    }

private:
    VnidMap& vnidMap;
};

/**
 * Runs an agent built from the configuration, and rebuilds it when a
 * watched configuration directory changes
 */
class AgentSupervisor : public FSWatcher::Watcher {
public:
    AgentSupervisor(const vector<string>& configPaths_, bool watchConfig_)
        : configPaths(configPaths_), watchConfig(watchConfig_),
          stopped(false), reload(false) {}

    /**
     * Run until stop is called
     *
     * @return the process exit code
     */
    int run() {
        try {
            FSWatcher configWatcher;
            if (watchConfig) {
                for (const string& path : configPaths) {
                    if (!fs::is_directory(path)) continue;
                    LOG(INFO) << "Watching configuration directory "
                              << path << " for changes";
                    configWatcher.addWatch(path, *this);
                }
            }
            configWatcher.setInitialScan(false);
            configWatcher.start();

            while (runOnce()) {
                LOG(INFO) << "Reloading agent because of "
                          << "configuration update";
            }
            configWatcher.stop();
            return 0;
        } catch (const pt::json_parser_error& e) {
            return 4;
        } catch (const std::exception& e) {
            LOG(ERROR) << "Fatal error: " << e.what();
            return 2;
        }
    }

    /**
     * Ask run to return
     */
    void stop() {
        {
            std::lock_guard<std::mutex> guard(mutex);
            stopped = true;
        }
        cond.notify_all();
    }

    virtual void updated(const fs::path& filePath) {
        if (!isConfigFile(filePath)) return;
        {
            std::lock_guard<std::mutex> guard(mutex);
            reload = true;
        }
        cond.notify_all();
    }

    virtual void deleted(const fs::path& filePath) {
        updated(filePath);
    }

private:
    const vector<string> configPaths;
    const bool watchConfig;

    bool stopped;
    bool reload;
    std::mutex mutex;
    std::condition_variable cond;

    // Returns true if the agent should be rebuilt
    bool runOnce() {
        Agent agent;
        loadConfig(agent, configPaths);
        agent.applyProperties();

        VnidChangeLogger changeLogger(agent.getVnidMap());
        IsolationPolicy& policy = agent.getIsolationPolicy();
        policy.registerListener(&changeLogger);
        try {
            agent.start();
        } catch (const std::exception&) {
            policy.unregisterListener(&changeLogger);
            throw;
        }

        bool again;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cond.wait(lock, [this]() { return stopped || reload; });
            again = !stopped;
            reload = false;
        }

        agent.stop();
        policy.unregisterListener(&changeLogger);
        return again;
    }
};

} /* anonymous namespace */

int main(int argc, char** argv) {
    signal(SIGPIPE, SIG_IGN);

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Print this help message")
        ("config,c", po::value<vector<string> >(),
         "Read configuration from the specified files or directories")
        ("watch,w", "Watch configuration directories for changes")
        ("log", po::value<string>()->default_value(""),
         "Log to the specified file (default standard out)")
        ("level", po::value<string>()->default_value("info"),
         "Use the specified log level (default info). "
         "Overridden by log level in configuration file")
        ("syslog", "Log to syslog instead of file or standard out")
        ("daemon", "Run the agent as a daemon")
        ("pid-file", po::value<string>(),
         "Write the process ID of the agent to the specified file")
        ;

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (vm.count("help")) {
        std::cout << "Usage: " << argv[0] << " [options]\n" << desc;
        return 0;
    }

    if (vm.count("daemon"))
        daemonize();

    initLogging(vm["level"].as<string>(), vm.count("syslog") > 0,
                vm["log"].as<string>());

    if (vm.count("pid-file")) {
        try {
            writePidFile(vm["pid-file"].as<string>());
        } catch (const std::exception& e) {
            LOG(ERROR) << e.what();
            return 1;
        }
    }

    vector<string> configPaths;
    if (vm.count("config"))
        configPaths = vm["config"].as<vector<string> >();
    else
        configPaths.push_back(DEFAULT_CONF);

    sigset_t waitset;
    sigemptyset(&waitset);
    sigaddset(&waitset, SIGINT);
    sigaddset(&waitset, SIGTERM);
    sigaddset(&waitset, SIGHUP);
    sigprocmask(SIG_BLOCK, &waitset, NULL);

    AgentSupervisor supervisor(configPaths, vm.count("watch") > 0);
    std::thread signalThread([&supervisor, &waitset]() {
            while (true) {
                int sig;
                int result = sigwait(&waitset, &sig);
                if (result != 0) {
                    LOG(ERROR) << "Failed to wait for signals: "
                               << strerror(result);
                    break;
                }
                if (sig == SIGHUP) {
                    LOG(INFO) << "Reopening log on " << strsignal(sig);
                    getLogSink()->reopen();
                    continue;
                }
                LOG(INFO) << "Got " << strsignal(sig) << " signal";
                break;
            }
            supervisor.stop();
        });

    int rc = supervisor.run();
    if (rc) exit(rc);
    signalThread.join();
    return 0;
}
