#pragma once
// Profile loading: agent JSON → tagged semantic fragments
//
// One fragment per populated field, tagged with the field name:
//   scalar  name role occupation bio
//   list    skills interests                      (items joined with ", ")
//   scene   can_teach want_to_learn looking_for experience
//           ideal_match values quirks work_style  (string or list)
// Other keys are ignored. Empty values produce no fragment.
//
// A profiles file is either an array of profile objects or an object keyed by
// agent id. Ids come from "id", then "agent_id", then the object key.

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace resonance {

struct Profile {
    EntityId id;
    std::vector<SemanticFragment> fragments;
};

namespace detail {

inline std::string scalar_text(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number() || v.is_boolean()) return v.dump();
    return "";
}

inline std::string field_text(const nlohmann::json& v) {
    if (!v.is_array()) return scalar_text(v);
    std::string joined;
    for (const auto& item : v) {
        std::string s = scalar_text(item);
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        if (!joined.empty()) joined += ", ";
        joined += s;
    }
    return joined;
}

} // namespace detail

inline const std::vector<std::string>& profile_fields() {
    static const std::vector<std::string> fields = {
        "name", "role", "occupation", "bio",
        "skills", "interests",
        "can_teach", "want_to_learn", "looking_for", "experience",
        "ideal_match", "values", "quirks", "work_style",
    };
    return fields;
}

inline std::vector<SemanticFragment> profile_fragments(const nlohmann::json& profile) {
    if (!profile.is_object()) {
        throw ConfigError("profile must be a JSON object");
    }
    std::vector<SemanticFragment> fragments;
    for (const auto& field : profile_fields()) {
        auto it = profile.find(field);
        if (it == profile.end() || it->is_null()) continue;
        std::string text = detail::field_text(*it);
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        fragments.emplace_back(field, std::move(text));
    }
    return fragments;
}

inline std::string profile_id(const nlohmann::json& profile, const std::string& fallback) {
    for (const char* key : {"id", "agent_id"}) {
        auto it = profile.find(key);
        if (it != profile.end() && !it->is_null()) {
            std::string id = detail::scalar_text(*it);
            if (!id.empty()) return id;
        }
    }
    return fallback;
}

// Profiles without any usable field are skipped with a warning
inline std::vector<Profile> parse_profiles(const nlohmann::json& doc) {
    std::vector<Profile> out;

    auto add = [&out](const nlohmann::json& entry, const std::string& fallback_id) {
        Profile p;
        p.id = profile_id(entry, fallback_id);
        if (p.id.empty()) {
            throw ConfigError("profile without id (need \"id\" or \"agent_id\")");
        }
        p.fragments = profile_fragments(entry);
        if (p.fragments.empty()) {
            log::warn("profile", "skipping '%s': no text fields", p.id.c_str());
            return;
        }
        out.push_back(std::move(p));
    };

    if (doc.is_array()) {
        for (const auto& entry : doc) add(entry, "");
    } else if (doc.is_object()) {
        for (auto it = doc.begin(); it != doc.end(); ++it) add(it.value(), it.key());
    } else {
        throw ConfigError("profiles must be a JSON array or object");
    }
    return out;
}

inline std::vector<Profile> load_profiles(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open profiles " + path);

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    auto profiles = parse_profiles(doc);
    log::debug("profile", "loaded %zu profiles from %s", profiles.size(), path.c_str());
    return profiles;
}

} // namespace resonance
