/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for bounded exponential backoff
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/Backoff.h>

#include <thread>

namespace sdnagent {

using std::chrono::milliseconds;

const milliseconds Backoff::MAX_DURATION(60 * 1000);

milliseconds Backoff::step() {
    milliseconds current = duration;
    if (steps > 0)
        steps -= 1;
    double next = duration.count() * factor;
    if (next >= static_cast<double>(MAX_DURATION.count()))
        duration = MAX_DURATION;
    else
        duration = milliseconds(static_cast<milliseconds::rep>(next));
    return current;
}

Backoff Backoff::defaultLookup() {
    return Backoff(milliseconds(400), 1.5, 6);
}

bool exponentialBackoff(Backoff backoff,
                        const std::function<bool ()>& condition) {
    while (backoff.getSteps() > 0) {
        if (condition())
            return true;
        if (backoff.getSteps() == 1)
            break;
        std::this_thread::sleep_for(backoff.step());
    }
    return false;
}

} /* namespace sdnagent */
