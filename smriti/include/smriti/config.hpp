#pragma once
// Config: where the federation lives and how the front-ends behave
//
// Loaded from an optional JSON file; command-line flags override it.
// Env file names are relative to base_dir.

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

namespace smriti {

using json = nlohmann::json;

inline std::string default_base_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.smriti";
}

// "~/x" -> "$HOME/x"
inline std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + path.substr(1);
}

struct Config {
    std::string base_dir = default_base_dir();
    std::string meta_file = "meta.env";
    std::string lang_file = "lang.env";
    std::string history_file = "history.env";
    std::string impl_file = "impl.env";
    std::string working_file = "working.env";
    bool save_on_exit = true;
    bool verbose = false;
    bool color = false;
    std::set<std::string> serialize_blacklist;

    std::string path_of(const std::string& file) const {
        if (!file.empty() && file[0] == '/') return file;
        return base_dir + "/" + file;
    }

    json to_json() const {
        return json{
            {"base_dir", base_dir},
            {"meta_file", meta_file},
            {"lang_file", lang_file},
            {"history_file", history_file},
            {"impl_file", impl_file},
            {"working_file", working_file},
            {"save_on_exit", save_on_exit},
            {"verbose", verbose},
            {"color", color},
            {"serialize_blacklist", serialize_blacklist},
        };
    }

    // Unknown keys are ignored; missing keys keep their defaults
    static Config from_json(const json& j) {
        Config c;
        c.base_dir = expand_home(j.value("base_dir", c.base_dir));
        c.meta_file = j.value("meta_file", c.meta_file);
        c.lang_file = j.value("lang_file", c.lang_file);
        c.history_file = j.value("history_file", c.history_file);
        c.impl_file = j.value("impl_file", c.impl_file);
        c.working_file = j.value("working_file", c.working_file);
        c.save_on_exit = j.value("save_on_exit", c.save_on_exit);
        c.verbose = j.value("verbose", c.verbose);
        c.color = j.value("color", c.color);
        if (j.contains("serialize_blacklist") && j["serialize_blacklist"].is_array()) {
            for (const auto& f : j["serialize_blacklist"]) {
                if (f.is_string()) c.serialize_blacklist.insert(f.get<std::string>());
            }
        }
        return c;
    }

    // Missing file: defaults. Malformed file: reported, defaults.
    static Config load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            log_debug("Config", "no config at %s, using defaults", path.c_str());
            return Config();
        }
        std::stringstream buf;
        buf << in.rdbuf();
        try {
            return from_json(json::parse(buf.str()));
        } catch (const json::exception& e) {
            log_warn("Config", "Ignoring %s: %s", path.c_str(), e.what());
            return Config();
        }
    }
};

} // namespace smriti
