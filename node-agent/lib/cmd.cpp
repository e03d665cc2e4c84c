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

#include <sdnagent/cmd.h>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdlib.h>

#include <fstream>
#include <stdexcept>

namespace sdnagent {

static void redirectStdio() {
    int fd = open("/dev/null", O_RDWR, 0);
    if (fd == -1) return;

    dup2(fd, STDIN_FILENO);
    dup2(fd, STDOUT_FILENO);
    dup2(fd, STDERR_FILENO);
    if (fd > STDERR_FILENO)
        close(fd);
}

void daemonize() {
    // already a daemon
    if (getppid() == 1) return;

    pid_t pid = fork();
    if (pid < 0)
        exit(EXIT_FAILURE);
    if (pid > 0)
        exit(EXIT_SUCCESS);

    if (setsid() < 0)
        exit(EXIT_FAILURE);
    if (chdir("/") < 0)
        exit(EXIT_FAILURE);

    redirectStdio();
    umask(027);
}

void writePidFile(const std::string& pidFile) {
    std::ofstream out(pidFile.c_str(), std::ios_base::trunc);
    if (!out)
        throw std::runtime_error("Could not open pid file " + pidFile);
    out << getpid() << std::endl;
    if (!out)
        throw std::runtime_error("Could not write pid file " + pidFile);
}

} /* namespace sdnagent */
