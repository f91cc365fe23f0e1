/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/VisualFill.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Converts real elapsed seconds into the 0..1 fill a slot's progress bar shows.
 * The scale factor is (remaining visual space) / (remaining real time), so the
 * bar reaches 1.0 exactly at the slot boundary no matter when the leg began.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class VisualFillTracker {
public:
    VisualFillTracker();

    // Fill already used by stored segments at the fixed 1/1200 per second rate.
    static double baselineProportion(const SegmentList& segments);

    /**
     * Starts a leg.
     * @param previousProportion  Fill carried in from earlier legs/sessions (clamped to 0..1).
     * @param remainingRealSeconds Sub-second precise time until the slot boundary.
     */
    void begin(double previousProportion, double remainingRealSeconds);

    // Loads persisted values verbatim.
    void restore(double previousProportion, double scaleFactor);

    void reset();

    // previousProportion + liveSeconds * scaleFactor, clamped to [0, 1].
    double currentFill(uint32_t liveSeconds) const;

    // Unclamped value, used for invariant checks.
    double rawFill(uint32_t liveSeconds) const;

    double previousProportion() const { return _previous; }
    double scaleFactor() const { return _scale; }
    double remainingVisual() const { return 1.0 - _previous; }
    bool hasRoom() const { return _previous < 1.0; }

private:
    double _previous;
    double _scale;
};
