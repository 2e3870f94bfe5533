#pragma once

#include "schedule/errors.hpp"
#include "schedule/layer.hpp"
#include "time_utils.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

// ---------------------------------------------------------------------------
// Schedule configuration loader (JSON or YAML)
//
// {
//   "schedule": {
//     "name": "...", "description": "...",
//     "start_date": "YYYY-MM-DD", "duration_months": 3,
//     "layers": {
//       "<id>": {
//         "name": "...", "dummy": false,
//         "rotation_team": ["Alice", "Bob"],
//         "time_windows": { "monday": {"start": "08:00", "end": "10:30", "dummy": false} }
//       }
//     }
//   }
// }
//
// A layer may instead use the older shape: "days": [...] plus a single
// "time_window": {"start", "end"} shared by every listed day.
// Layers keep declaration order (ordered_json).
//
// Files ending in .yaml/.yml hold the same tree in YAML. Plain scalars are
// typed the way YAML 1.1 reads them (null, integer, float, bool); anything
// else, and every quoted scalar, is a string.
// ---------------------------------------------------------------------------
namespace schedule_config {

using json = nlohmann::ordered_json;

// Wider than any span inside years 1..9999.
constexpr std::int64_t MAX_DURATION_MONTHS = 12 * 10000;

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string require_string(const json& node, const std::string& key,
                                  const std::string& where) {
    if (!node.contains(key)) {
        throw InvalidConfiguration(where + ": missing '" + key + "'");
    }
    const auto& v = node.at(key);
    if (!v.is_string()) {
        throw InvalidConfiguration(where + ": '" + key + "' must be a string");
    }
    return v.get<std::string>();
}

inline bool optional_bool(const json& node, const std::string& key, const std::string& where) {
    if (!node.contains(key)) return false;
    const auto& v = node.at(key);
    if (!v.is_boolean()) {
        throw InvalidConfiguration(where + ": '" + key + "' must be true or false");
    }
    return v.get<bool>();
}

inline TimeWindow parse_window(const json& node, const std::string& where) {
    if (!node.is_object()) {
        throw InvalidConfiguration(where + " must be an object");
    }
    TimeWindow w;
    w.start = require_string(node, "start", where);
    w.end = require_string(node, "end", where);
    w.dummy = optional_bool(node, "dummy", where);

    auto start = time_utils::parse_clock_minutes(w.start);
    auto end = time_utils::parse_clock_minutes(w.end);
    if (!start) throw InvalidConfiguration(where + ": start '" + w.start + "' is not HH:MM");
    if (!end) throw InvalidConfiguration(where + ": end '" + w.end + "' is not HH:MM");
    if (*end <= *start) {
        throw InvalidConfiguration(where + ": end " + w.end + " must be after start " + w.start);
    }
    return w;
}

inline std::string weekday_or_throw(const std::string& raw, const std::string& where) {
    std::string key = lower(raw);
    if (!time_utils::is_weekday_key(key)) {
        throw InvalidConfiguration(where + ": unknown weekday '" + raw + "'");
    }
    return key;
}

inline LayerDefinition parse_layer(const std::string& id, const json& node) {
    const std::string where = "layer '" + id + "'";
    if (!node.is_object()) {
        throw InvalidConfiguration(where + " must be an object");
    }

    LayerDefinition layer;
    layer.id = id;
    layer.name = node.contains("name") ? require_string(node, "name", where) : id;
    layer.dummy = optional_bool(node, "dummy", where);

    if (node.contains("rotation_team")) {
        const auto& team = node.at("rotation_team");
        if (!team.is_array()) {
            throw InvalidConfiguration(where + ": 'rotation_team' must be a list");
        }
        for (const auto& member : team) {
            if (!member.is_string()) {
                throw InvalidConfiguration(where + ": rotation_team entries must be strings");
            }
            layer.rotation_team.push_back(member.get<std::string>());
        }
    }

    if (node.contains("time_windows")) {
        const auto& windows = node.at("time_windows");
        if (!windows.is_object()) {
            throw InvalidConfiguration(where + ": 'time_windows' must be a mapping");
        }
        for (const auto& [day, window] : windows.items()) {
            std::string key = weekday_or_throw(day, where);
            layer.time_windows[key] = parse_window(window, where + " window '" + day + "'");
        }
    } else if (node.contains("days")) {
        const auto& days = node.at("days");
        if (!days.is_array()) {
            throw InvalidConfiguration(where + ": 'days' must be a list");
        }
        if (!node.contains("time_window")) {
            throw InvalidConfiguration(where + ": 'days' requires a 'time_window'");
        }
        TimeWindow shared = parse_window(node.at("time_window"), where + " time_window");
        for (const auto& day : days) {
            if (!day.is_string()) {
                throw InvalidConfiguration(where + ": 'days' entries must be strings");
            }
            layer.time_windows[weekday_or_throw(day.get<std::string>(), where)] = shared;
        }
    } else {
        throw InvalidConfiguration(where + ": missing 'time_windows'");
    }

    return layer;
}

inline ScheduleConfig parse(const json& root) {
    if (!root.is_object() || !root.contains("schedule")) {
        throw InvalidConfiguration("missing 'schedule' key");
    }
    const auto& sched = root.at("schedule");
    if (!sched.is_object()) {
        throw InvalidConfiguration("'schedule' must be a mapping");
    }

    ScheduleConfig cfg;
    if (sched.contains("name")) cfg.name = require_string(sched, "name", "schedule");
    if (sched.contains("description")) {
        cfg.description = require_string(sched, "description", "schedule");
    }

    if (sched.contains("start_date") && !sched.at("start_date").is_null()) {
        std::string start = require_string(sched, "start_date", "schedule");
        if (!time_utils::parse_iso_date(start)) {
            throw InvalidConfiguration("start_date '" + start + "' is not YYYY-MM-DD");
        }
        cfg.start_date = start;
    }

    if (sched.contains("duration_months")) {
        const auto& d = sched.at("duration_months");
        if (!d.is_number_integer()) {
            throw InvalidConfiguration("'duration_months' must be an integer");
        }
        bool in_range = d.is_number_unsigned()
            ? d.get<std::uint64_t>() <= static_cast<std::uint64_t>(MAX_DURATION_MONTHS)
            : d.get<std::int64_t>() >= -MAX_DURATION_MONTHS &&
                  d.get<std::int64_t>() <= MAX_DURATION_MONTHS;
        if (!in_range) {
            throw InvalidConfiguration("'duration_months' " + d.dump() + " is out of range");
        }
        cfg.duration_months = d.get<int>();
    }

    if (!sched.contains("layers") || !sched.at("layers").is_object() ||
        sched.at("layers").empty()) {
        throw InvalidConfiguration("No layers defined in configuration file");
    }
    for (const auto& [id, layer] : sched.at("layers").items()) {
        cfg.layers.push_back(parse_layer(id, layer));
    }
    return cfg;
}

inline ScheduleConfig parse_string(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw InvalidConfiguration(std::string("cannot parse JSON: ") + e.what());
    }
    return parse(root);
}

// YAML node -> the JSON tree parse() expects. Mappings keep document order.
inline json from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Sequence: {
            json items = json::array();
            for (const auto& item : node) items.push_back(from_yaml(item));
            return items;
        }
        case YAML::NodeType::Map: {
            json fields = json::object();
            for (const auto& kv : node) fields[kv.first.as<std::string>()] = from_yaml(kv.second);
            return fields;
        }
        case YAML::NodeType::Scalar:
            break;
    }

    if (node.Tag() == "!") return node.Scalar();  // quoted

    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) return integer;
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) return number;
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) return flag;
    return node.Scalar();
}

inline ScheduleConfig parse_yaml_string(const std::string& text) {
    json root;
    try {
        root = from_yaml(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw InvalidConfiguration(std::string("cannot parse YAML: ") + e.what());
    }
    return parse(root);
}

inline bool is_yaml_path(const std::string& path) {
    std::string ext = lower(std::filesystem::path(path).extension().string());
    return ext == ".yaml" || ext == ".yml";
}

inline ScheduleConfig load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationNotFound(path);
    }
    std::ifstream input(path);
    if (!input) {
        throw ConfigurationNotFound(path);
    }
    std::string text((std::istreambuf_iterator<char>(input)),
                     std::istreambuf_iterator<char>());
    return is_yaml_path(path) ? parse_yaml_string(text) : parse_string(text);
}

}  // namespace schedule_config
