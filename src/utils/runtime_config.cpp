/**
 * @file runtime_config.cpp
 * @brief RuntimeConfig JSON parsing and environment overrides.
 */
#include "psh_service.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace pinshare::config
{

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

uint32_t parse_u32(const nlohmann::json &v, const std::string &key, const std::string &origin)
{
    if (v.is_number_unsigned())
    {
        const auto n = v.get<uint64_t>();
        if (n <= std::numeric_limits<uint32_t>::max())
            return static_cast<uint32_t>(n);
    }
    else if (v.is_number_integer())
    {
        const auto n = v.get<int64_t>();
        if (n >= 0 && n <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
            return static_cast<uint32_t>(n);
    }
    else if (v.is_string())
    {
        const auto s = v.get<std::string>();
        // stoul also accepts leading blanks and a sign; a negative value wraps.
        if (!s.empty() && std::isdigit(static_cast<unsigned char>(s.front())))
        {
            try
            {
                std::size_t used = 0;
                const unsigned long n = std::stoul(s, &used, 0);
                if (used == s.size() && n <= std::numeric_limits<uint32_t>::max())
                    return static_cast<uint32_t>(n);
            }
            catch (const std::logic_error &)
            {
                // fall through to the error below
            }
        }
    }
    throw std::runtime_error("Runtime config: invalid '" + key + "' = " + v.dump() + " in '" +
                             origin + "' (expected an unsigned 32-bit number)");
}

ResourceConfig parse_resource(const std::string &name, const nlohmann::json &j,
                              const std::string &origin)
{
    if (!j.is_object())
        throw std::runtime_error("Runtime config: resource '" + name +
                                 "' must be a JSON object in '" + origin + "'");

    if (!j.contains("driver"))
        throw std::runtime_error("Runtime config: resource '" + name +
                                 "': missing required field 'driver' in '" + origin + "'");

    ResourceConfig rc;
    rc.id.driver = parse_u32(j["driver"], "resources." + name + ".driver", origin);
    rc.id.buffer = parse_u32(j.value("buffer", nlohmann::json(0)), "resources." + name + ".buffer",
                             origin);

    const std::string mode = j.value("mode", std::string{"ro"});
    const auto parsed = parse_access_mode(mode);
    if (!parsed)
        throw std::runtime_error("Runtime config: resource '" + name + "': invalid mode '" + mode +
                                 "' (must be 'rw' or 'ro') in '" + origin + "'");
    rc.mode = *parsed;
    return rc;
}

void check_level(const std::string &level, const std::string &origin)
{
    if (!utils::Logger::parse_level(level))
        throw std::runtime_error("Runtime config: invalid 'logging.level' = '" + level +
                                 "' in '" + origin + "'");
}

} // anonymous namespace

// ============================================================================
// RuntimeConfig
// ============================================================================

RuntimeConfig RuntimeConfig::defaults()
{
    RuntimeConfig cfg;
    cfg.resources["rng"] = ResourceConfig{ResourceId{0x40001, 0}, AccessMode::ReadWrite};
    cfg.resources["console"] = ResourceConfig{ResourceId{1, 1}, AccessMode::ReadOnly};
    return cfg;
}

namespace
{

RuntimeConfig parse_document(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
        throw std::runtime_error("Runtime config: top level must be a JSON object in '" + origin +
                                 "'");

    RuntimeConfig cfg = RuntimeConfig::defaults();

    if (j.contains("logging"))
    {
        const auto &l = j["logging"];
        if (!l.is_object())
            throw std::runtime_error("Runtime config: 'logging' must be an object in '" + origin +
                                     "'");
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
        check_level(cfg.logging.level, origin);
    }

    if (j.contains("resources"))
    {
        const auto &r = j["resources"];
        if (!r.is_object())
            throw std::runtime_error("Runtime config: 'resources' must be an object in '" +
                                     origin + "'");
        for (const auto &[name, res_json] : r.items())
        {
            cfg.resources[name] = parse_resource(name, res_json, origin);
        }
    }

    if (j.contains("stream"))
    {
        const auto &s = j["stream"];
        if (!s.is_object())
            throw std::runtime_error("Runtime config: 'stream' must be an object in '" + origin +
                                     "'");
        if (s.contains("chunk_bytes"))
            cfg.stream.chunk_bytes = parse_u32(s["chunk_bytes"], "stream.chunk_bytes", origin);
        if (s.contains("chunks"))
            cfg.stream.chunks = parse_u32(s["chunks"], "stream.chunks", origin);
        if (cfg.stream.chunk_bytes == 0)
            throw std::runtime_error("Runtime config: 'stream.chunk_bytes' must be > 0 in '" +
                                     origin + "'");
    }

    if (j.contains("sim"))
    {
        const auto &s = j["sim"];
        if (!s.is_object())
            throw std::runtime_error("Runtime config: 'sim' must be an object in '" + origin + "'");
        cfg.sim.rng_seed = s.value("rng_seed", cfg.sim.rng_seed);
    }

    return cfg;
}

} // anonymous namespace

RuntimeConfig RuntimeConfig::from_json(const nlohmann::json &j, const std::string &origin)
{
    try
    {
        return parse_document(j, origin);
    }
    catch (const nlohmann::json::type_error &e)
    {
        throw std::runtime_error("Runtime config: type error in '" + origin + "': " + e.what());
    }
}

RuntimeConfig RuntimeConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Runtime config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Runtime config: JSON parse error in '" + path + "': " +
                                 e.what());
    }
    return from_json(j, path);
}

RuntimeConfig RuntimeConfig::load()
{
    const char *path = std::getenv(kConfigFileEnv);
    RuntimeConfig cfg = (path != nullptr && *path != '\0') ? from_json_file(path) : defaults();
    cfg.apply_env_overrides();
    return cfg;
}

void RuntimeConfig::apply_env_overrides()
{
    if (const char *level = std::getenv(kLogLevelEnv); level != nullptr && *level != '\0')
    {
        check_level(level, kLogLevelEnv);
        logging.level = level;
    }
    if (const char *file = std::getenv(kLogFileEnv); file != nullptr)
    {
        logging.file = file;
    }
}

std::optional<ResourceConfig> RuntimeConfig::resource(const std::string &name) const
{
    const auto it = resources.find(name);
    if (it == resources.end())
        return std::nullopt;
    return it->second;
}

void apply_logging(const RuntimeConfig &cfg)
{
    auto &logger = utils::Logger::instance();
    const auto level = utils::Logger::parse_level(cfg.logging.level);
    if (!level)
        throw std::runtime_error("Runtime config: invalid log level '" + cfg.logging.level + "'");

    if (cfg.logging.file.empty())
    {
        logger.set_console();
    }
    else if (!logger.set_logfile(cfg.logging.file))
    {
        throw std::runtime_error("Runtime config: cannot open log file: " + cfg.logging.file);
    }
    logger.set_level(*level);
}

} // namespace pinshare::config
