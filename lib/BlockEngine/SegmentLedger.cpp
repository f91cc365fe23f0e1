/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockEngine/SegmentLedger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <assert.h>

#include "SegmentLedger.h"

SegmentLedger::SegmentLedger()
    : _currentStart(0),
      _currentKind(SEG_WORK)
{
}

void SegmentLedger::setOpenTags(const std::string& category, const std::string& label) {
    // Break segments are never tagged
    if (_currentKind == SEG_BREAK) {
        _openCategory.clear();
        _openLabel.clear();
    } else {
        _openCategory = category;
        _openLabel = label;
    }
}

void SegmentLedger::reset(SegmentKind openKind, const std::string& category, const std::string& label) {
    _segments.clear();
    _currentStart = 0;
    _currentKind = openKind;
    setOpenTags(category, label);
}

void SegmentLedger::restore(const SegmentList& finalized, uint32_t currentSegmentStart, SegmentKind openKind,
                            const std::string& category, const std::string& label) {
    _segments = finalized;
    _currentStart = currentSegmentStart;
    _currentKind = openKind;
    setOpenTags(category, label);
}

void SegmentLedger::append(SegmentKind kind, uint32_t seconds, const std::string& category,
                           const std::string& label, uint32_t startOffset) {
    Segment seg;
    seg.kind = kind;
    seg.seconds = seconds;
    seg.category = (kind == SEG_WORK) ? category : std::string();
    seg.label = (kind == SEG_WORK) ? label : std::string();
    seg.startOffset = startOffset;
    _segments.push_back(seg);
}

uint32_t SegmentLedger::openDuration(uint32_t elapsed) const {
    // A negative duration means the caller's clock went backwards relative
    // to a committed boundary. That is an accounting bug, not a runtime case.
    assert(elapsed >= _currentStart);
    if (elapsed < _currentStart) return 0;
    return elapsed - _currentStart;
}

bool SegmentLedger::finalize(uint32_t elapsed) {
    uint32_t duration = openDuration(elapsed);
    if (duration == 0) return false;

    append(_currentKind, duration, _openCategory, _openLabel, _currentStart);
    _currentStart = elapsed;
    return true;
}

bool SegmentLedger::splitAt(uint32_t elapsed, SegmentKind newKind, const std::string& category, const std::string& label) {
    bool finalized = finalize(elapsed);

    _currentStart = elapsed;
    _currentKind = newKind;
    setOpenTags(category, label);
    return finalized;
}

bool SegmentLedger::retag(uint32_t elapsed, const std::string& category, const std::string& label, uint32_t minLabelSeconds) {
    bool categoryChanged = (category != _openCategory);
    bool labelChanged = (label != _openLabel);

    if (!categoryChanged && !labelChanged) return false;

    bool boundary = false;
    if (_currentKind == SEG_WORK) {
        uint32_t duration = openDuration(elapsed);
        bool labelOnly = labelChanged && !categoryChanged;

        if (duration > 0 && (!labelOnly || duration >= minLabelSeconds)) {
            boundary = finalize(elapsed);
        }
    }

    // The open segment always carries the latest tags
    setOpenTags(category, label);
    return boundary;
}

SegmentList SegmentLedger::liveView(uint32_t elapsed) const {
    SegmentList view = _segments;
    Segment tail;
    if (openSegment(elapsed, tail)) view.push_back(tail);
    return view;
}

bool SegmentLedger::openSegment(uint32_t elapsed, Segment& out) const {
    uint32_t duration = openDuration(elapsed);
    if (duration == 0) return false;

    out.kind = _currentKind;
    out.seconds = duration;
    out.category = _openCategory;
    out.label = _openLabel;
    out.startOffset = _currentStart;
    return true;
}

SegmentList SegmentLedger::release() {
    SegmentList out;
    out.swap(_segments);
    _currentStart = 0;
    return out;
}

uint32_t SegmentLedger::finalizedSeconds() const {
    return sumSeconds(_segments);
}
