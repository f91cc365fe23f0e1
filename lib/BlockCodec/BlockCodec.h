/*
 * =================================================================================
 * Project:   SeventyTwo - Block Timer Engine
 * File:      lib/BlockCodec/BlockCodec.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON shapes for segments, run snapshots, blocks, status and start requests.
 * Decoders validate as they go and explain the first problem in errorMsg.
 * Unset category/label are omitted rather than written as "".
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>

#include "Types.h"

class BlockCodec {
public:
    // --- Enums ---
    static bool parseKind(const char* text, SegmentKind& out);
    static bool parseBlockStatus(const char* text, BlockStatus& out);

    // --- Segments ---
    static void encodeSegment(const Segment& segment, JsonObject out);
    static bool decodeSegment(JsonVariantConst json, Segment& out, std::string& errorMsg);
    static void encodeSegments(const SegmentList& segments, JsonArray out);
    static bool decodeSegments(JsonVariantConst json, SegmentList& out, std::string& errorMsg);

    // --- Run Snapshot (active_run.json) ---
    static void encodeSnapshot(const RunSnapshot& snapshot, JsonObject out);
    static bool decodeSnapshot(JsonVariantConst json, RunSnapshot& out, std::string& errorMsg);

    // --- Blocks ---
    static void encodeBlock(const Block& block, JsonObject out);
    static bool decodeBlock(JsonVariantConst json, Block& out, std::string& errorMsg);

    // --- Read-only views ---
    static void encodeStatus(const EngineStatus& status, JsonObject out);
    static void encodeReport(const CompletionReport& report, JsonObject out);

    /**
     * Parses a start/continue command body.
     * Required: "blockIndex" (0..71), "date" (YYYY-MM-DD).
     * Optional: "mode" ("work"), "category", "label", "segments", "visualFill".
     */
    static bool parseStartRequest(JsonVariantConst json, StartRequest& out, std::string& errorMsg);
};
