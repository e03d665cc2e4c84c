/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Utility functions for command-line programs
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_CMD_H
#define SDNAGENT_CMD_H

#include <string>

namespace sdnagent {

/**
 * Detach the process from its controlling terminal and continue
 * running in the background.  The parent process exits.
 */
void daemonize();

/**
 * Write the current process ID to the given file
 *
 * @param pidFile the path of the file to write
 * @throws std::runtime_error if the file cannot be written
 */
void writePidFile(const std::string& pidFile);

} /* namespace sdnagent */

#endif /* SDNAGENT_CMD_H */
