/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockCodec/BlockCodec.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <string.h>

#include "BlockCodec.h"

// =================================================================================
// SECTION: HELPERS
// =================================================================================

static void putOptional(JsonObject out, const char* key, const std::string& value) {
    if (!value.empty()) out[key] = value;
}

static bool isDateString(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
    for (size_t i = 0; i < date.size(); i++) {
        if (i == 4 || i == 7) continue;
        if (date[i] < '0' || date[i] > '9') return false;
    }
    return true;
}

bool BlockCodec::parseKind(const char* text, SegmentKind& out) {
    if (text == nullptr) return false;
    if (strcmp(text, "work") == 0) out = SEG_WORK;
    else if (strcmp(text, "break") == 0) out = SEG_BREAK;
    else return false;
    return true;
}

bool BlockCodec::parseBlockStatus(const char* text, BlockStatus& out) {
    if (text == nullptr) return false;
    if (strcmp(text, "idle") == 0) out = BLOCK_IDLE;
    else if (strcmp(text, "planned") == 0) out = BLOCK_PLANNED;
    else if (strcmp(text, "done") == 0) out = BLOCK_DONE;
    else if (strcmp(text, "skipped") == 0) out = BLOCK_SKIPPED;
    else return false;
    return true;
}

// =================================================================================
// SECTION: SEGMENTS
// =================================================================================

void BlockCodec::encodeSegment(const Segment& segment, JsonObject out) {
    out["type"] = kindToString(segment.kind);
    out["seconds"] = segment.seconds;
    out["startOffset"] = segment.startOffset;
    putOptional(out, "category", segment.category);
    putOptional(out, "label", segment.label);
}

bool BlockCodec::decodeSegment(JsonVariantConst json, Segment& out, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Segment must be an object.";
        return false;
    }

    std::string typeStr = json["type"] | "";
    if (!parseKind(typeStr.c_str(), out.kind)) {
        errorMsg = "Invalid segment type: " + typeStr;
        return false;
    }

    if (!json["seconds"].is<uint32_t>()) {
        errorMsg = "Segment seconds must be a non-negative integer.";
        return false;
    }
    out.seconds = json["seconds"].as<uint32_t>();
    out.startOffset = json["startOffset"] | 0u;

    // Break segments never carry tags
    if (out.kind == SEG_WORK) {
        out.category = json["category"] | "";
        out.label = json["label"] | "";
    } else {
        out.category.clear();
        out.label.clear();
    }
    return true;
}

void BlockCodec::encodeSegments(const SegmentList& segments, JsonArray out) {
    for (size_t i = 0; i < segments.size(); i++) {
        encodeSegment(segments[i], out.add<JsonObject>());
    }
}

bool BlockCodec::decodeSegments(JsonVariantConst json, SegmentList& out, std::string& errorMsg) {
    out.clear();

    // Missing list means "no segments"
    if (json.isNull()) return true;

    if (!json.is<JsonArrayConst>()) {
        errorMsg = "Segments must be an array.";
        return false;
    }

    JsonArrayConst list = json.as<JsonArrayConst>();
    for (JsonVariantConst v : list) {
        Segment segment;
        if (!decodeSegment(v, segment, errorMsg)) return false;
        out.push_back(segment);
    }
    return true;
}

// =================================================================================
// SECTION: RUN SNAPSHOT
// =================================================================================

void BlockCodec::encodeSnapshot(const RunSnapshot& snapshot, JsonObject out) {
    out["runId"] = snapshot.runId;
    out["blockIndex"] = snapshot.blockIndex;
    out["date"] = snapshot.date;
    out["startedAt"] = snapshot.startedAt;
    out["endAt"] = snapshot.endAt;
    out["initialDurationSeconds"] = snapshot.initialDurationSeconds;
    out["sessionDurationSeconds"] = snapshot.sessionDurationSeconds;
    out["carriedSeconds"] = snapshot.carriedSeconds;
    out["scaleFactor"] = snapshot.scaleFactor;
    out["previousVisualProportion"] = snapshot.previousVisualProportion;
    encodeSegments(snapshot.previousSegments, out["previousSegments"].to<JsonArray>());
    encodeSegments(snapshot.segments, out["segments"].to<JsonArray>());
    out["currentSegmentStart"] = snapshot.currentSegmentStart;
    out["currentMode"] = kindToString(snapshot.currentMode);
    putOptional(out, "currentCategory", snapshot.currentCategory);
    putOptional(out, "currentLabel", snapshot.currentLabel);
    putOptional(out, "lastWorkCategory", snapshot.lastWorkCategory);
    putOptional(out, "lastWorkLabel", snapshot.lastWorkLabel);
    out["paused"] = snapshot.paused;
    out["pausedSecondsUsed"] = snapshot.pausedSecondsUsed;
    if (snapshot.breakNotifyAt != 0) out["breakNotifyAt"] = snapshot.breakNotifyAt;
}

bool BlockCodec::decodeSnapshot(JsonVariantConst json, RunSnapshot& out, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Snapshot must be an object.";
        return false;
    }

    // 1. Identity
    out.runId = json["runId"] | "";
    if (!json["blockIndex"].is<int>()) {
        errorMsg = "Missing required field: blockIndex.";
        return false;
    }
    out.blockIndex = json["blockIndex"].as<int>();
    if (out.blockIndex < 0 || out.blockIndex >= SLOTS_PER_DAY) {
        errorMsg = "blockIndex out of range: " + std::to_string(out.blockIndex);
        return false;
    }

    out.date = json["date"] | "";
    if (!isDateString(out.date)) {
        errorMsg = "Invalid date: " + out.date;
        return false;
    }

    // 2. Timing (absolute instants)
    if (!json["startedAt"].is<int64_t>() || !json["endAt"].is<int64_t>()) {
        errorMsg = "Missing required fields: startedAt/endAt.";
        return false;
    }
    out.startedAt = json["startedAt"].as<int64_t>();
    out.endAt = json["endAt"].as<int64_t>();
    out.initialDurationSeconds = json["initialDurationSeconds"] | 0u;
    out.sessionDurationSeconds = json["sessionDurationSeconds"] | out.initialDurationSeconds;
    out.carriedSeconds = json["carriedSeconds"] | 0u;

    // 3. Fill
    out.scaleFactor = json["scaleFactor"] | BASELINE_SCALE_FACTOR;
    out.previousVisualProportion = json["previousVisualProportion"] | 0.0;

    // 4. Segments
    if (!decodeSegments(json["previousSegments"], out.previousSegments, errorMsg)) return false;
    if (!decodeSegments(json["segments"], out.segments, errorMsg)) return false;
    out.currentSegmentStart = json["currentSegmentStart"] | 0u;

    // 5. Mode & context
    std::string modeStr = json["currentMode"] | "work";
    if (!parseKind(modeStr.c_str(), out.currentMode)) {
        errorMsg = "Invalid currentMode: " + modeStr;
        return false;
    }
    out.currentCategory = json["currentCategory"] | "";
    out.currentLabel = json["currentLabel"] | "";
    out.lastWorkCategory = json["lastWorkCategory"] | "";
    out.lastWorkLabel = json["lastWorkLabel"] | "";

    // 6. Pause & reminder
    out.paused = json["paused"] | false;
    out.pausedSecondsUsed = json["pausedSecondsUsed"] | 0u;
    out.breakNotifyAt = json["breakNotifyAt"] | (int64_t)0;

    return true;
}

// =================================================================================
// SECTION: BLOCKS
// =================================================================================

void BlockCodec::encodeBlock(const Block& block, JsonObject out) {
    out["date"] = block.date;
    out["blockIndex"] = block.blockIndex;
    putOptional(out, "category", block.category);
    putOptional(out, "label", block.label);
    out["status"] = blockStatusToString(block.status);
    encodeSegments(block.segments, out["segments"].to<JsonArray>());
    out["usedSeconds"] = block.usedSeconds;
    out["progress"] = block.progress;
    out["breakProgress"] = block.breakProgress;
    out["isMuted"] = block.isMuted;
    out["hasActiveRun"] = block.hasActiveRun;
}

bool BlockCodec::decodeBlock(JsonVariantConst json, Block& out, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Block must be an object.";
        return false;
    }

    out.date = json["date"] | "";
    if (!isDateString(out.date)) {
        errorMsg = "Invalid date: " + out.date;
        return false;
    }

    out.blockIndex = json["blockIndex"] | -1;
    if (out.blockIndex < 0 || out.blockIndex >= SLOTS_PER_DAY) {
        errorMsg = "blockIndex out of range: " + std::to_string(out.blockIndex);
        return false;
    }

    std::string statusStr = json["status"] | "idle";
    if (!parseBlockStatus(statusStr.c_str(), out.status)) {
        errorMsg = "Invalid status: " + statusStr;
        return false;
    }

    out.category = json["category"] | "";
    out.label = json["label"] | "";
    if (!decodeSegments(json["segments"], out.segments, errorMsg)) return false;
    out.usedSeconds = json["usedSeconds"] | 0u;
    out.progress = json["progress"] | 0.0;
    out.breakProgress = json["breakProgress"] | 0.0;
    out.isMuted = json["isMuted"] | false;
    out.hasActiveRun = json["hasActiveRun"] | false;
    return true;
}

// =================================================================================
// SECTION: VIEWS
// =================================================================================

void BlockCodec::encodeStatus(const EngineStatus& status, JsonObject out) {
    out["state"] = stateToString(status.state);
    out["autoContinuations"] = status.autoContinuations;
    if (status.state == IDLE) return;

    out["blockIndex"] = status.blockIndex;
    out["date"] = status.date;
    out["mode"] = kindToString(status.mode);
    out["timeLeft"] = status.timeLeft;
    out["secondsUsed"] = status.secondsUsed;
    out["initialDuration"] = status.initialDuration;
    out["progressPercent"] = status.progressPercent;
    out["visualFill"] = status.visualFill;
    out["scaleFactor"] = status.scaleFactor;
    putOptional(out, "category", status.category);
    putOptional(out, "label", status.label);
    out["endAt"] = status.endAt;
}

void BlockCodec::encodeReport(const CompletionReport& report, JsonObject out) {
    out["blockIndex"] = report.blockIndex;
    out["date"] = report.date;
    out["isBreak"] = report.isBreak;
    out["natural"] = report.natural;
    out["markComplete"] = report.markComplete;
    out["secondsUsed"] = report.secondsUsed;
    out["initialDuration"] = report.initialDuration;
    out["visualFill"] = report.visualFill;
    out["completedAt"] = report.completedAt;
    putOptional(out, "category", report.category);
    putOptional(out, "label", report.label);
    encodeSegments(report.segments, out["segments"].to<JsonArray>());
}

// =================================================================================
// SECTION: COMMAND BODIES
// =================================================================================

bool BlockCodec::parseStartRequest(JsonVariantConst json, StartRequest& out, std::string& errorMsg) {
    // 1. Slot identity
    if (!json["blockIndex"].is<int>()) {
        errorMsg = "Missing required field: blockIndex.";
        return false;
    }
    out.blockIndex = json["blockIndex"].as<int>();
    if (out.blockIndex < 0 || out.blockIndex >= SLOTS_PER_DAY) {
        errorMsg = "blockIndex out of range: " + std::to_string(out.blockIndex);
        return false;
    }

    out.date = json["date"] | "";
    if (!isDateString(out.date)) {
        errorMsg = "Invalid date (expected YYYY-MM-DD): " + out.date;
        return false;
    }

    // 2. Mode
    std::string modeStr = json["mode"] | "work";
    if (!parseKind(modeStr.c_str(), out.mode)) {
        errorMsg = "Invalid mode: " + modeStr;
        return false;
    }

    // 3. Context
    out.category = json["category"] | "";
    out.label = json["label"] | "";

    // 4. Prior use of the slot
    if (!decodeSegments(json["segments"], out.existingSegments, errorMsg)) return false;

    out.hasVisualFill = json["visualFill"].is<double>();
    out.existingVisualFill = out.hasVisualFill ? json["visualFill"].as<double>() : 0.0;
    if (out.hasVisualFill && (out.existingVisualFill < 0.0 || out.existingVisualFill > 1.0)) {
        errorMsg = "visualFill must be within 0..1.";
        return false;
    }

    return true;
}
