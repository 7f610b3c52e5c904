// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __PRINTWATCH_CONFIG_H__
#define __PRINTWATCH_CONFIG_H__

#include "gcode_parser.h"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace printwatch {

namespace gcode {
class GeometryBuilder;
}

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/printwatch.json");
 *
 * // Get with default fallback
 * double offset = cfg->get<double>("/parser/hotend_offset_mm", 18.0);
 *
 * // Set and save
 * cfg->set<int>("/geometry/worker_threads", 4);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance. Starts out holding
     * the built-in defaults.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * A missing file leaves the defaults in memory (nothing is written until
     * save()). A file that fails to parse is renamed to "<path>.corrupt" and
     * replaced by defaults. Keys missing from a valid file are filled in from
     * the defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * Throws nlohmann::json::exception if path doesn't exist.
     * Use the overload with default_value for safer access.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/geometry/line_height_mm")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if path doesn't exist. A present value of the
     * wrong type still throws nlohmann::json::exception.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Save current configuration to file
     *
     * Writes pretty JSON to "<path>.tmp" and renames it over the config file.
     *
     * @return false if no path is set or the write failed
     */
    bool save();

    /**
     * @brief Get configuration file path
     */
    std::string get_path();

    /**
     * @brief Restore built-in defaults (in memory)
     */
    void reset_to_defaults();

    /**
     * @brief Parser options from /parser/*
     */
    gcode::ParserOptions parser_options();

    /**
     * @brief Apply /geometry/* and /colors/* to a builder
     */
    void apply_to(gcode::GeometryBuilder& builder);

    /**
     * @brief Layer count from /geometry/layer_count (negative = all)
     */
    int layer_count();

    /**
     * @brief Log level name from /log_level (empty = not configured)
     * @throws nlohmann::json::exception if /log_level is not a string
     */
    std::string log_level();

    /**
     * @brief Built-in default configuration
     */
    static json default_config();

    /**
     * @brief Get singleton instance
     *
     * @return Pointer to global Config instance
     */
    static Config* get_instance();
};

} // namespace printwatch

#endif // __PRINTWATCH_CONFIG_H__
