/*
 * xferd - Storage Transfer Job Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "xferd/log_parser.hpp"
#include "xferd/util.hpp"

#include <cmath>

namespace xferd {

namespace {

std::int64_t asInt64(const Json::Value& v) {
    if (v.isInt64()) return v.asInt64();
    if (v.isNumeric()) return static_cast<std::int64_t>(v.asDouble());
    return 0;
}

double asDouble(const Json::Value& v) {
    return v.isNumeric() ? v.asDouble() : 0.0;
}

} // namespace

ParsedLine parseEngineLine(const std::string& line) {
    ParsedLine out;
    auto doc = parseJson(line);
    if (!doc || !doc->isObject()) {
        return out;
    }

    const auto& msg = (*doc)["msg"];
    const auto& object = (*doc)["object"];
    out.rendered = msg.isString() ? trim(msg.asString()) : std::string();
    if (object.isString() && !object.asString().empty()) {
        const std::string obj = object.asString();
        if (out.rendered.empty()) {
            out.rendered = obj;
        } else if (!contains(out.rendered, obj)) {
            out.rendered += " " + obj;
        }
    }

    const auto& stats = (*doc)["stats"];
    if (stats.isObject()) {
        EngineStats s;
        s.bytes = asInt64(stats["bytes"]);
        s.totalBytes = asInt64(stats["totalBytes"]);
        s.transfers = asInt64(stats["transfers"]);
        s.totalTransfers = asInt64(stats["totalTransfers"]);
        s.speed = asDouble(stats["speed"]);
        if (stats["eta"].isNumeric()) {
            s.eta = stats["eta"].asDouble();
        }
        s.deletes = asInt64(stats["deletes"]);
        out.stats = s;
    }
    return out;
}

StatsUpdate progressFromStats(const EngineStats& stats, ProgressMode mode) {
    StatsUpdate update;
    update.bytesDone = stats.bytes;
    if (stats.totalBytes > 0) {
        update.bytesTotal = stats.totalBytes;
    }

    if (mode == ProgressMode::Deletes) {
        update.objectsDone = stats.deletes;
    } else {
        update.objectsDone = stats.transfers;
        if (stats.totalTransfers > 0) {
            update.objectsTotal = stats.totalTransfers;
        }
    }

    if (stats.speed > 0) {
        update.speedBps = static_cast<std::int64_t>(stats.speed);
    }
    if (stats.eta && *stats.eta > 0) {
        update.etaSeconds = static_cast<std::int64_t>(std::llround(*stats.eta));
    }
    return update;
}

} // namespace xferd
