/*
 * dash - Configuration
 *
 * Thin wrapper over a JSON document. Keys are addressed with dotted paths
 * ("log_level", "store.data_dir"); every getter takes a default that is
 * returned when the key is missing or has the wrong type.
 */
#ifndef DASH_CORE_CONFIG_HPP
#define DASH_CORE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace dash {

typedef nlohmann::json Json;

class Config {
public:
    Config();

    // Parse `path`. A missing file leaves the config empty and succeeds;
    // an unreadable or malformed file fails with last_error() set.
    bool load_file(const std::string& path);

    // Parse JSON text (must be an object)
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;
    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);

    const std::string& source() const { return source_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* lookup(const std::string& key) const;

    Json root_;
    std::string source_;
    std::string last_error_;
};

} // namespace dash

#endif // DASH_CORE_CONFIG_HPP
