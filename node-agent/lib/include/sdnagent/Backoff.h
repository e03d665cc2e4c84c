/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for bounded exponential backoff
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef SDNAGENT_BACKOFF_H
#define SDNAGENT_BACKOFF_H

#include <chrono>
#include <functional>
#include <cstdint>

namespace sdnagent {

/**
 * A bounded exponential backoff schedule.  Each call to step()
 * consumes one step and returns the delay to wait before the next
 * attempt.
 */
class Backoff {
public:
    /**
     * Create a new backoff schedule
     *
     * @param duration the initial delay
     * @param factor the multiplier applied to the delay after each
     * step.  The delay stops growing at MAX_DURATION.
     * @param steps the maximum number of attempts
     */
    Backoff(std::chrono::milliseconds duration, double factor,
            uint32_t steps)
        : duration(duration), factor(factor), steps(steps) {}

    /**
     * Get the current delay
     */
    std::chrono::milliseconds getDuration() const { return duration; }

    /**
     * Get the multiplier applied after each step
     */
    double getFactor() const { return factor; }

    /**
     * Get the number of remaining steps
     */
    uint32_t getSteps() const { return steps; }

    /**
     * Consume a step and get the delay to wait before the next
     * attempt.
     *
     * @return the delay for this step
     */
    std::chrono::milliseconds step();

    /**
     * The schedule used for VNID lookups that may race ahead of the
     * watch stream: 400ms, factor 1.5, 6 attempts.
     */
    static Backoff defaultLookup();

    /**
     * The longest delay a schedule will grow to
     */
    static const std::chrono::milliseconds MAX_DURATION;

private:
    std::chrono::milliseconds duration;
    double factor;
    uint32_t steps;
};

/**
 * Evaluate condition until it returns true, waiting according to the
 * backoff schedule between attempts.  There is no wait after the
 * final attempt.  Exceptions thrown by the condition are propagated.
 *
 * @param backoff the backoff schedule
 * @param condition the condition to evaluate
 * @return true if the condition succeeded, or false if the schedule
 * was exhausted
 */
bool exponentialBackoff(Backoff backoff,
                        const std::function<bool ()>& condition);

} /* namespace sdnagent */

#endif /* SDNAGENT_BACKOFF_H */
