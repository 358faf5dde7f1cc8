#include "lb_config.h"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sol/sol.hpp>

namespace {

template <typename T>
bool parse_number(std::string_view s, T& out)
{
    if (s.empty())
        return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

bool set_int(std::string_view v, int& out, int min, int max)
{
    int n = 0;
    if (!parse_number(v, n) || n < min || n > max)
        return false;
    out = n;
    return true;
}

bool set_port(std::string_view v, uint16_t& out, int min)
{
    int n = 0;
    if (!set_int(v, n, min, 65535))
        return false;
    out = static_cast<uint16_t>(n);
    return true;
}

bool set_rate(std::string_view v, double& out)
{
    double d = 0.0;
    if (!parse_number(v, d) || d < 0.0)
        return false;
    out = d;
    return true;
}

bool set_text(std::string_view v, std::string& out)
{
    if (v.empty())
        return false;
    out = std::string(v);
    return true;
}

constexpr int max_ms = 24 * 3600 * 1000;

using setter = bool (*)(lb_config&, std::string_view);

struct option_entry
{
    const char* key;   // Lua config field
    const char* env;   // environment override
    setter apply;
};

const option_entry g_options[] = {
    {"listen_host", "MCSLB_LISTEN_HOST",
        [](lb_config& c, std::string_view v) { return set_text(v, c.listen_host); }},
    {"listen_port", "MCS_PORT",
        [](lb_config& c, std::string_view v) { return set_port(v, c.listen_port, 1); }},
    {"metrics_host", "MCSLB_METRICS_HOST",
        [](lb_config& c, std::string_view v) { return set_text(v, c.metrics_host); }},
    {"metrics_port", "PROMETHEUS_PORT",
        [](lb_config& c, std::string_view v) { return set_port(v, c.metrics_port, 0); }},
    {"metrics_path", nullptr,
        [](lb_config& c, std::string_view v) { return v.starts_with('/') && set_text(v, c.metrics_path); }},
    {"tls_dir", "MCSLB_TLS_DIR",
        [](lb_config& c, std::string_view v) { c.tls_dir = std::string(v); return true; }},
    {"tls_cert", "TLS_CERT",
        [](lb_config& c, std::string_view v) { return set_text(v, c.tls_cert); }},
    {"tls_key", "TLS_KEY",
        [](lb_config& c, std::string_view v) { return set_text(v, c.tls_key); }},
    {"redis_url", "REDIS_URL",
        [](lb_config& c, std::string_view v) { redis_url u; return parse_redis_url(v, u) && set_text(v, c.redis_url); }},
    {"registry_key", "MCSLB_REGISTRY_KEY",
        [](lb_config& c, std::string_view v) { return set_text(v, c.registry_key); }},
    {"registry_mode", "MCSLB_REGISTRY_MODE",
        [](lb_config& c, std::string_view v) { return parse_registry_mode(v, c.registry); }},
    {"heartbeat_ttl", "MCSLB_HEARTBEAT_TTL",
        [](lb_config& c, std::string_view v) { return set_int(v, c.heartbeat_ttl_s, 1, 86400); }},
    {"registry_poll_ms", "MCSLB_REGISTRY_POLL_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.registry_poll_ms, 10, max_ms); }},
    {"registry_timeout_ms", "MCSLB_REGISTRY_TIMEOUT_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.registry_timeout_ms, 1, max_ms); }},
    {"registry_max_failures", "MCSLB_REGISTRY_MAX_FAILURES",
        [](lb_config& c, std::string_view v) { return set_int(v, c.registry_max_failures, 1, 1000000); }},
    {"registry_stale_ms", "MCSLB_REGISTRY_STALE_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.registry_stale_ms, 1, max_ms); }},
    {"drain_grace_ms", "MCSLB_DRAIN_GRACE_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.drain_grace_ms, 0, max_ms); }},
    {"health_interval_ms", "MCSLB_HEALTH_INTERVAL_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.health_interval_ms, 10, max_ms); }},
    {"health_timeout_ms", "MCSLB_HEALTH_TIMEOUT_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.health_timeout_ms, 1, max_ms); }},
    {"health_threshold", "MCSLB_HEALTH_THRESHOLD",
        [](lb_config& c, std::string_view v) { return set_int(v, c.health_threshold, 1, 1000); }},
    {"policy", "MCSLB_POLICY",
        [](lb_config& c, std::string_view v) { return parse_schedule_policy(v, c.policy); }},
    {"handshake_timeout_ms", "MCSLB_HANDSHAKE_TIMEOUT_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.handshake_timeout_ms, 1, max_ms); }},
    {"connect_timeout_ms", "MCSLB_CONNECT_TIMEOUT_MS",
        [](lb_config& c, std::string_view v) { return set_int(v, c.connect_timeout_ms, 1, max_ms); }},
    {"idle_timeout_s", "MCSLB_IDLE_TIMEOUT_S",
        [](lb_config& c, std::string_view v) { return set_int(v, c.idle_timeout_s, 1, 7 * 86400); }},
    {"shutdown_drain_s", "MCSLB_SHUTDOWN_DRAIN_S",
        [](lb_config& c, std::string_view v) { return set_int(v, c.shutdown_drain_s, 0, 86400); }},
    {"conn_rate", "MCSLB_CONN_RATE",
        [](lb_config& c, std::string_view v) { return set_rate(v, c.conn_rate); }},
    {"bandwidth", "MCSLB_BANDWIDTH",
        [](lb_config& c, std::string_view v) { return set_rate(v, c.bandwidth); }},
    {"bandwidth_burst", "MCSLB_BANDWIDTH_BURST",
        [](lb_config& c, std::string_view v) { return set_rate(v, c.bandwidth_burst); }},
    {"log_level", "MCSLB_LOG_LEVEL",
        [](lb_config& c, std::string_view v) { return logger::parse_level(v, c.level); }},
};

const option_entry* find_option(std::string_view key)
{
    for (const auto& o : g_options)
    {
        if (key == o.key)
            return &o;
    }
    return nullptr;
}

// Lua numbers arrive as doubles; keep integral values free of a fraction
bool lua_value_text(const sol::object& v, std::string& out)
{
    switch (v.get_type())
    {
        case sol::type::string:
            out = v.as<std::string>();
            return true;
        case sol::type::number:
        {
            double d = v.as<double>();
            char buf[64];
            if (d == static_cast<double>(static_cast<int64_t>(d)))
                std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
            else
                std::snprintf(buf, sizeof(buf), "%.17g", d);
            out = buf;
            return true;
        }
        default:
            return false;
    }
}

} // namespace

bool apply_option(lb_config& cfg, std::string_view key, std::string_view value, std::string& err)
{
    const option_entry* o = find_option(key);
    if (!o)
    {
        err = "unknown option '" + std::string(key) + "'";
        return false;
    }
    if (!o->apply(cfg, value))
    {
        err = "invalid value '" + std::string(value) + "' for " + std::string(key);
        return false;
    }
    return true;
}

bool apply_config_file(const std::string& path, lb_config& cfg, std::string& err)
{
    std::ifstream check(path);
    if (!check.good())
    {
        err = "cannot open config file " + path;
        return false;
    }
    check.close();

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::math, sol::lib::os);

    auto result = lua.safe_script_file(path, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error e = result;
        err = "error loading " + path + ": " + e.what();
        return false;
    }

    sol::optional<sol::table> config = lua["config"];
    if (!config)
    {
        err = path + ": no global 'config' table";
        return false;
    }

    bool ok = true;
    config->for_each([&](const sol::object& k, const sol::object& v) {
        if (!ok)
            return;
        if (k.get_type() != sol::type::string)
        {
            err = path + ": config keys must be strings";
            ok = false;
            return;
        }

        std::string key = k.as<std::string>();
        std::string text;
        if (!lua_value_text(v, text))
        {
            err = path + ": " + key + " must be a string or number";
            ok = false;
            return;
        }
        if (!apply_option(cfg, key, text, err))
        {
            err = path + ": " + err;
            ok = false;
        }
    });

    if (ok)
        cfg.config_path = path;
    return ok;
}

bool apply_environment(lb_config& cfg, std::string& err)
{
    for (const auto& o : g_options)
    {
        if (!o.env)
            continue;

        const char* v = std::getenv(o.env);
        if (!v || !v[0])
            continue;

        if (!o.apply(cfg, v))
        {
            err = "invalid value '" + std::string(v) + "' in " + o.env;
            return false;
        }
    }
    return true;
}

bool validate_config(const lb_config& cfg, std::string& err)
{
    if (cfg.metrics_port != 0 && cfg.metrics_port == cfg.listen_port && cfg.metrics_host == cfg.listen_host)
    {
        err = "metrics_port and listen_port must differ";
        return false;
    }
    if (cfg.health_timeout_ms > cfg.health_interval_ms)
    {
        err = "health_timeout_ms must not exceed health_interval_ms";
        return false;
    }
    if (cfg.bandwidth > 0.0 && cfg.bandwidth_burst > 0.0 && cfg.bandwidth_burst < 1.0)
    {
        err = "bandwidth_burst must be at least 1 byte";
        return false;
    }
    redis_url u;
    if (!parse_redis_url(cfg.redis_url, u))
    {
        err = "invalid redis_url '" + cfg.redis_url + "'";
        return false;
    }
    return true;
}

bool load_config(int argc, char** argv, lb_config& cfg, std::string& err)
{
    std::string config_path;
    std::string cli_level;

    const char* env_path = std::getenv("MCSLB_CONFIG");
    if (env_path && env_path[0])
        config_path = env_path;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc)
            config_path = argv[++i];
        else if (arg == "--log-level" && i + 1 < argc)
            cli_level = argv[++i];
        else
        {
            err = "unknown argument '" + std::string(arg) + "'";
            return false;
        }
    }

    if (!config_path.empty() && !apply_config_file(config_path, cfg, err))
        return false;

    if (!apply_environment(cfg, err))
        return false;

    if (!cli_level.empty() && !apply_option(cfg, "log_level", cli_level, err))
        return false;

    return validate_config(cfg, err);
}

std::string resolve_tls_path(const lb_config& cfg, const std::string& file)
{
    if (cfg.tls_dir.empty() || file.empty() || file[0] == '/')
        return file;

    std::string out = cfg.tls_dir;
    if (out.back() != '/')
        out += '/';
    out += file;
    return out;
}

void print_usage(const char* argv0)
{
    std::fprintf(stderr,
        "usage: %s [--config <file.lua>] [--log-level debug|info|warn|error]\n"
        "\n"
        "Environment: MCS_PORT, PROMETHEUS_PORT, REDIS_URL, TLS_CERT, TLS_KEY,\n"
        "  MCSLB_CONFIG, MCSLB_TLS_DIR, MCSLB_POLICY, MCSLB_LOG_LEVEL and the other\n"
        "  MCSLB_* overrides named after the config fields.\n", argv0);
}
