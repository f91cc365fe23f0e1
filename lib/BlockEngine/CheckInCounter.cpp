/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/CheckInCounter.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "CheckInCounter.h"

CheckInCounter::CheckInCounter(uint32_t threshold)
    : _count(0),
      _threshold(threshold == 0 ? 1 : threshold)
{
}

bool CheckInCounter::allowsAutoContinuation() const {
    return _count < _threshold;
}

void CheckInCounter::recordAutoContinuation() {
    _count++;
}

void CheckInCounter::reset() {
    _count = 0;
}

void CheckInCounter::setThreshold(uint32_t threshold) {
    _threshold = (threshold == 0) ? 1 : threshold;
}
