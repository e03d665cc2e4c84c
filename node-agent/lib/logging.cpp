/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of log destinations for the node agent
 *
 * Copyright (c) 2015 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/logging.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <fstream>
#include <memory>
#include <mutex>

#include <syslog.h>

namespace sdnagent {

LogLevel logLevel = INFO;

namespace {

struct LevelInfo {
    LogLevel level;
    const char* name;
    int syslogPriority;
};

const LevelInfo LEVELS[] = {
    {FATAL,   "fatal",   LOG_CRIT},
    {ERROR,   "error",   LOG_ERR},
    {WARNING, "warning", LOG_WARNING},
    {INFO,    "info",    LOG_INFO},
    {DEBUG,   "debug",   LOG_DEBUG},
};

const LevelInfo& levelInfo(LogLevel level) {
    for (const LevelInfo& li : LEVELS) {
        if (li.level == level) return li;
    }
    return LEVELS[INFO];
}

/**
 * Writes timestamped records to a stream, either standard output or
 * a file opened in append mode
 */
class StreamLogSink : public LogSink {
public:
    StreamLogSink() : out(&std::cout) {}

    StreamLogSink(const std::string& path_) : path(path_), out(&std::cout) {
        open();
    }

    virtual void write(LogLevel level, const char* file, int line,
                       const char* function, const std::string& message) {
        using namespace boost::posix_time;
        std::lock_guard<std::mutex> guard(sink_mutex);
        (*out) << "[" << to_simple_string(microsec_clock::local_time())
               << "] [" << levelInfo(level).name << "] ["
               << file << ":" << line << ":" << function << "] "
               << message << std::endl;
    }

    virtual void reopen() {
        if (path.empty()) return;
        std::lock_guard<std::mutex> guard(sink_mutex);
        fileStream.close();
        fileStream.clear();
        open();
    }

private:
    std::string path;
    std::ofstream fileStream;
    std::ostream* out;
    std::mutex sink_mutex;

    void open() {
        fileStream.open(path.c_str(), std::ios_base::out | std::ios_base::app);
        if (fileStream) {
            out = &fileStream;
        } else {
            out = &std::cout;
            std::cerr << "Unable to open log file " << path
                      << "; logging to standard output" << std::endl;
        }
    }
};

/**
 * Hands records to the system logger
 */
class SyslogLogSink : public LogSink {
public:
    SyslogLogSink(const std::string& ident_) : ident(ident_) {
        // openlog keeps the pointer, so ident must outlive the sink
        openlog(ident.c_str(), LOG_CONS | LOG_PID, LOG_DAEMON);
    }

    virtual ~SyslogLogSink() {
        closelog();
    }

    virtual void write(LogLevel level, const char* file, int line,
                       const char* function, const std::string& message) {
        syslog(levelInfo(level).syslogPriority, "[%s:%d:%s] %s",
               file, line, function, message.c_str());
    }

private:
    std::string ident;
};

StreamLogSink consoleSink;
std::unique_ptr<LogSink> configuredSink;
LogSink* currentSink = &consoleSink;

} /* anonymous namespace */

LogSink* getLogSink() {
    return currentSink;
}

void initLogging(const std::string& level, bool toSyslog,
                 const std::string& logFile,
                 const std::string& syslogIdent) {
    std::unique_ptr<LogSink> sink;
    if (toSyslog)
        sink.reset(new SyslogLogSink(syslogIdent));
    else if (!logFile.empty())
        sink.reset(new StreamLogSink(logFile));
    currentSink = sink ? sink.get() : &consoleSink;
    configuredSink = std::move(sink);

    setLoggingLevel(level);
}

void setLoggingLevel(const std::string& level) {
    std::string name = boost::algorithm::to_lower_copy(level);
    if (name == "trace") name = "debug";

    logLevel = INFO;
    for (const LevelInfo& li : LEVELS) {
        if (name == li.name) {
            logLevel = li.level;
            break;
        }
    }
}

std::string getLogLevelString() {
    return levelInfo(logLevel).name;
}

} /* namespace sdnagent */
