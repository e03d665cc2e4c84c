/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Logging macros and log destinations for the node agent
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_LOGGING_H
#define SDNAGENT_LOGGING_H

#include <string>
#include <iostream>
#include <sstream>

namespace sdnagent {

/**
 * Log severities, most severe first
 */
enum LogLevel { FATAL, ERROR, WARNING, INFO, DEBUG };

/**
 * Messages less severe than this level are discarded
 */
extern LogLevel logLevel;

/**
 * A destination for formatted log records
 */
class LogSink {
public:
    virtual ~LogSink() {}

    /**
     * Emit a single log record
     *
     * @param level severity of the record
     * @param file source file that produced the record
     * @param line line number in the source file
     * @param function enclosing function
     * @param message the message text
     */
    virtual void write(LogLevel level, const char* file, int line,
                       const char* function,
                       const std::string& message) = 0;

    /**
     * Reopen the underlying destination, for example after the log
     * file was rotated.  The default does nothing.
     */
    virtual void reopen() {}
};

/**
 * Select the log destination and level.  Syslog takes precedence
 * over a log file; with neither, records go to standard output.
 *
 * @param level name of the log level
 * @param toSyslog send records to syslog
 * @param logFile file to append records to, or empty
 * @param syslogIdent identity to use for syslog records
 */
void initLogging(const std::string& level, bool toSyslog,
                 const std::string& logFile,
                 const std::string& syslogIdent = "sdn-node-agent");

/**
 * Set the log level by name.  Unknown names select info.
 */
void setLoggingLevel(const std::string& level);

/**
 * Get the name of the current log level
 */
std::string getLogLevelString();

/**
 * Get the current log destination.  Never NULL.
 */
LogSink* getLogSink();

/**
 * Accumulates one log record and writes it to the current sink when
 * destroyed
 */
class Logger {
public:
    Logger(LogLevel level_, const char* file_, int line_,
           const char* function_)
        : level(level_), file(file_), line(line_), function(function_) {}

    ~Logger() {
        getLogSink()->write(level, file, line, function, record.str());
    }

    /**
     * Get the stream for the message text
     */
    std::ostream& stream() { return record; }

private:
    std::ostringstream record;
    LogLevel level;
    const char* file;
    int line;
    const char* function;
};

#define LOG(lvl)                                                        \
    if (lvl <= sdnagent::logLevel)                                      \
        sdnagent::Logger(lvl, __FILE__, __LINE__, __FUNCTION__).stream()

} /* namespace sdnagent */

#endif /* SDNAGENT_LOGGING_H */
