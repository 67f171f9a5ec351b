/*
 * dash - Configuration Implementation
 */
#include <dash/core/config.hpp>
#include <dash/core/logger.hpp>
#include <dash/core/utils.hpp>
#include <fstream>
#include <sstream>
#include <vector>

namespace dash {

Config::Config() : root_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    source_ = path;
    last_error_.clear();

    if (!path_exists(path)) {
        LOG_DEBUG("No config file at %s, using defaults", path.c_str());
        root_ = Json::object();
        return true;
    }

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "cannot open " + path;
        LOG_ERROR("Failed to open config file %s", path.c_str());
        return false;
    }

    std::ostringstream buf;
    buf << file.rdbuf();
    if (!load_string(buf.str())) {
        last_error_ = path + ": " + last_error_;
        return false;
    }

    LOG_DEBUG("Loaded config from %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        LOG_ERROR("Config parse error: %s", e.what());
        return false;
    }

    if (!parsed.is_object()) {
        last_error_ = "top-level value must be an object";
        LOG_ERROR("Config parse error: %s", last_error_.c_str());
        return false;
    }

    root_ = parsed;
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_string()) return default_val;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_number_integer()) return default_val;
    return node->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_boolean()) return default_val;
    return node->get<bool>();
}

bool Config::has(const std::string& key) const {
    return lookup(key) != nullptr;
}

void Config::set_string(const std::string& key, const std::string& value) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    if (parts.empty()) return;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = Json::object();
        }
        node = &child;
    }
    (*node)[parts.back()] = value;
}

} // namespace dash
