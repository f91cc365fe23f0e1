/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/SegmentLedger.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Append-only record of the typed segments of one session leg.
 * Offsets are leg-elapsed seconds. The open (in-progress) segment is never
 * stored; it is derived from currentSegmentStart and the caller's elapsed
 * value whenever it is needed.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class SegmentLedger {
public:
    SegmentLedger();

    // Drops everything and opens a segment of the given kind at offset 0.
    void reset(SegmentKind openKind, const std::string& category, const std::string& label);

    // Rebuilds the ledger from persisted state.
    void restore(const SegmentList& finalized, uint32_t currentSegmentStart, SegmentKind openKind,
                 const std::string& category, const std::string& label);

    // Adds a finalized segment as-is.
    void append(SegmentKind kind, uint32_t seconds, const std::string& category,
                const std::string& label, uint32_t startOffset);

    /**
     * Finalizes the open segment (if it has a positive duration) and opens a
     * new one of newKind at elapsed.
     * @return true if a segment was finalized.
     */
    bool splitAt(uint32_t elapsed, SegmentKind newKind, const std::string& category, const std::string& label);

    // Finalizes the open segment without changing its kind or tags.
    bool finalize(uint32_t elapsed);

    /**
     * Applies a category/label edit to the open work segment.
     * A boundary is created only for a positive duration, and for label-only
     * edits only once the open segment has lasted minLabelSeconds.
     * @return true if a segment was finalized.
     */
    bool retag(uint32_t elapsed, const std::string& category, const std::string& label, uint32_t minLabelSeconds);

    // Finalized segments plus the synthesized open tail. Does not mutate.
    SegmentList liveView(uint32_t elapsed) const;

    // Fills 'out' with the open tail; false if it has zero duration.
    bool openSegment(uint32_t elapsed, Segment& out) const;

    // Hands the finalized segments to the caller and empties the ledger.
    SegmentList release();

    uint32_t finalizedSeconds() const;
    uint32_t totalSeconds(uint32_t elapsed) const { return finalizedSeconds() + openDuration(elapsed); }
    uint32_t openDuration(uint32_t elapsed) const;

    const SegmentList& segments() const { return _segments; }
    uint32_t currentSegmentStart() const { return _currentStart; }
    SegmentKind currentKind() const { return _currentKind; }
    const std::string& openCategory() const { return _openCategory; }
    const std::string& openLabel() const { return _openLabel; }

private:
    SegmentList _segments;
    uint32_t _currentStart;
    SegmentKind _currentKind;
    std::string _openCategory;
    std::string _openLabel;

    void setOpenTags(const std::string& category, const std::string& label);
};
