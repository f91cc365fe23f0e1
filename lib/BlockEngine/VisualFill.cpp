/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/VisualFill.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "VisualFill.h"

static double clampUnit(double v) {
    if (v < 0.0) return 0.0;
    if (v > 1.0) return 1.0;
    return v;
}

VisualFillTracker::VisualFillTracker()
    : _previous(0.0),
      _scale(BASELINE_SCALE_FACTOR)
{
}

double VisualFillTracker::baselineProportion(const SegmentList& segments) {
    double total = 0.0;
    for (size_t i = 0; i < segments.size(); i++) {
        total += (double)segments[i].seconds / (double)SLOT_SECONDS;
    }
    return clampUnit(total);
}

void VisualFillTracker::begin(double previousProportion, double remainingRealSeconds) {
    _previous = clampUnit(previousProportion);

    double remainingVisual = 1.0 - _previous;
    if (remainingVisual < 0.0) remainingVisual = 0.0;

    // Without real time left there is nothing to scale; fall back to the baseline
    _scale = (remainingRealSeconds > 0.0) ? remainingVisual / remainingRealSeconds : BASELINE_SCALE_FACTOR;
}

void VisualFillTracker::restore(double previousProportion, double scaleFactor) {
    _previous = clampUnit(previousProportion);
    _scale = scaleFactor;
}

void VisualFillTracker::reset() {
    _previous = 0.0;
    _scale = BASELINE_SCALE_FACTOR;
}

double VisualFillTracker::rawFill(uint32_t liveSeconds) const {
    return _previous + (double)liveSeconds * _scale;
}

double VisualFillTracker::currentFill(uint32_t liveSeconds) const {
    return clampUnit(rawFill(liveSeconds));
}
