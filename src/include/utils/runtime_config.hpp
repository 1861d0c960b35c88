#pragma once
/**
 * @file runtime_config.hpp
 * @brief Process configuration for pinshare hosts, loaded from JSON.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "logging":   { "level": "info", "file": "" },
 *   "resources": {
 *     "rng":     { "driver": "0x40001", "buffer": 0, "mode": "rw" },
 *     "console": { "driver": 1,         "buffer": 1, "mode": "ro" }
 *   },
 *   "stream":    { "chunk_bytes": 8, "chunks": 4 },
 *   "sim":       { "rng_seed": 12345 }
 * }
 * @endcode
 *
 * Every section and key is optional; missing keys keep their defaults.
 * `driver` accepts a JSON integer or a decimal / "0x" hex string.
 *
 * Layering (low to high): built-in defaults, then the file, then the
 * PINSHARE_LOG_LEVEL and PINSHARE_LOG_FILE environment variables.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "pinshare_export.h"
#include "share/kernel_abi.hpp"

namespace pinshare::config
{

/// Environment variable naming the config file used by RuntimeConfig::load().
inline constexpr const char *kConfigFileEnv = "PINSHARE_CONFIG_FILE";
inline constexpr const char *kLogLevelEnv = "PINSHARE_LOG_LEVEL";
inline constexpr const char *kLogFileEnv = "PINSHARE_LOG_FILE";

struct LoggingConfig
{
    std::string level{"info"}; ///< trace/debug/info/warn/error/system
    std::string file;          ///< empty = console
};

/**
 * @struct ResourceConfig
 * @brief A named kernel sharing slot: where and how a buffer is lent.
 */
struct ResourceConfig
{
    ResourceId id{};
    AccessMode mode{AccessMode::ReadOnly};

    ShareInfo info() const noexcept { return ShareInfo{mode, id}; }
};

struct StreamConfig
{
    uint32_t chunk_bytes{8};
    uint32_t chunks{4};
};

struct SimConfig
{
    uint64_t rng_seed{0x9E3779B97F4A7C15ull};
};

/**
 * @struct RuntimeConfig
 * @brief Top-level configuration.
 */
struct PINSHARE_EXPORT RuntimeConfig
{
    LoggingConfig logging{};
    std::unordered_map<std::string, ResourceConfig> resources;
    StreamConfig stream{};
    SimConfig sim{};

    /**
     * @brief Built-in defaults: the RNG and console resources of the examples.
     */
    static RuntimeConfig defaults();

    /**
     * @brief Overlays a parsed JSON document on the defaults.
     * @throws std::runtime_error on a malformed section or value; `origin`
     *         names the source in the message.
     */
    static RuntimeConfig from_json(const nlohmann::json &j, const std::string &origin = "<json>");

    /**
     * @brief Loads and validates a JSON config file.
     * @throws std::runtime_error on file-not-found, parse error, or invalid values.
     */
    static RuntimeConfig from_json_file(const std::string &path);

    /**
     * @brief Loads the file named by PINSHARE_CONFIG_FILE (defaults if unset),
     *        then applies environment overrides.
     */
    static RuntimeConfig load();

    /**
     * @brief Applies PINSHARE_LOG_LEVEL and PINSHARE_LOG_FILE, if set.
     */
    void apply_env_overrides();

    [[nodiscard]] std::optional<ResourceConfig> resource(const std::string &name) const;
};

/**
 * @brief Configures the Logger from `cfg.logging`.
 * @throws std::runtime_error if the level is unknown or the log file cannot be opened.
 */
PINSHARE_EXPORT void apply_logging(const RuntimeConfig &cfg);

} // namespace pinshare::config
