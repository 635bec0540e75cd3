/**
 * @file   config_bridge.cpp
 * @brief  Implements validate(), loadFile() and saveFile() for the data
 *         channel JSON configuration.
 *
 * @date   2026-10-19
 */

#include "channel_config.hpp"
#include <fstream>

namespace ftp_data::config {

bool validate(const ChannelConfig& cfg, std::string* err)
{
    if (cfg.passive.port < 0 || cfg.passive.port > 65535) {
        if (err) *err = "passive.port must be within 0..65535, got "
                        + std::to_string(cfg.passive.port);
        return false;
    }
    if (cfg.tls.enabled && (cfg.tls.certFile.empty() || cfg.tls.keyFile.empty())) {
        if (err) *err = "tls.enabled requires both tls.certFile and tls.keyFile";
        return false;
    }
    if (cfg.active.tls && !cfg.tls.enabled) {
        if (err) *err = "active.tls requires the tls section to be enabled";
        return false;
    }
    return true;
}

/**
 * Load a configuration from a JSON file.
 *
 * Opens `path`, parses it into an ordered_json, converts it to
 * ChannelConfig and validates the result.
 */
bool loadFile(const std::string& path,
              ChannelConfig& out,
              std::string* err)
{
    // 1) Open & parse JSON
    std::ifstream in(path);
    if (!in.is_open()) {
        if (err) *err = "Failed to open file: " + path;
        return false;
    }

    nlohmann::ordered_json j;
    try {
        in >> j;
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("JSON parse error: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        if (err) *err = "Config root must be a JSON object: " + path;
        return false;
    }

    // 2) Convert JSON → ChannelConfig (throws on wrong value types)
    ChannelConfig cfg;
    try {
        cfg = j.get<ChannelConfig>();
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("Config schema error: ") + e.what();
        return false;
    }

    // 3) Semantic checks
    if (!validate(cfg, err))
        return false;

    out = std::move(cfg);
    return true;
}

/**
 * Save a configuration to a JSON file.
 *
 * If `pretty==true`, uses 4-space indentation.
 */
bool saveFile(const ChannelConfig& cfg,
              const std::string& path,
              bool pretty,
              std::string* err)
{
    std::ofstream out(path);
    if (!out.is_open()) {
        if (err) *err = "Failed to open file for writing: " + path;
        return false;
    }
    try {
        nlohmann::ordered_json j = cfg;
        if (pretty) {
            out << j.dump(4) << '\n';
        } else {
            out << j.dump()  << '\n';
        }
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
    if (!out) {
        if (err) *err = "Write failed: " + path;
        return false;
    }
    return true;
}

} // namespace ftp_data::config
