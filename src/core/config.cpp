#include "cad/core/config.hpp"
#include "cad/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cad {

namespace {

using json = dpp::json;

std::string trim(std::string_view s)
{
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

std::vector<std::string> split(std::string_view s, char sep)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        parts.push_back(trim(s.substr(start, pos == std::string_view::npos ? pos : pos - start)));
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

bool parse_flag(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "yes" || value == "1" || value == "enabled";
}

unsigned long parse_number(const std::string& what, const std::string& value)
{
    try {
        std::size_t used = 0;
        unsigned long n = std::stoul(value, &used);
        if (used != value.size()) {
            throw config_error(what + ": trailing characters in '" + value + "'");
        }
        return n;
    } catch (const std::logic_error&) {
        throw config_error(what + ": expected a number, got '" + value + "'");
    }
}

uint16_t parse_port(const std::string& value)
{
    auto port = parse_number("node port", value);
    if (port == 0 || port > 65535) {
        throw config_error("node port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

std::string default_name(const node_config& n)
{
    return n.host + ":" + std::to_string(n.port);
}

void validate(const bot_config& cfg)
{
    if (cfg.reconnect.multiplier < 1.0) {
        throw config_error("reconnect multiplier must be >= 1");
    }
    if (cfg.reconnect.base_delay.count() <= 0 || cfg.reconnect.max_delay < cfg.reconnect.base_delay) {
        throw config_error("reconnect delays must satisfy 0 < base <= max");
    }
    if (cfg.reconnect.failure_threshold == 0) {
        throw config_error("failure threshold must be at least 1");
    }
    if (cfg.rest.attempts == 0) {
        throw config_error("rest attempts must be at least 1");
    }
    if (cfg.player.max_queue_length == 0) {
        throw config_error("queue limit must be at least 1");
    }
    if (cfg.player.auto_skip_ceiling == 0) {
        throw config_error("auto-skip ceiling must be at least 1");
    }
    if (cfg.player.default_volume < 0 || cfg.player.default_volume > 1000) {
        throw config_error("default volume must be within 0..1000");
    }
}

const char* env(const char* name)
{
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

} // namespace

node_config parse_node(std::string_view text)
{
    node_config n;
    auto parts = split(text, ',');

    if (!parts.empty() && !parts[0].empty()) {
        const auto& address = parts[0];
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            n.host = address;
        } else {
            n.host = address.substr(0, colon);
            n.port = parse_port(address.substr(colon + 1));
        }
        if (n.host.empty()) {
            throw config_error("node address without host: '" + address + "'");
        }
    }
    if (parts.size() > 1 && !parts[1].empty()) {
        n.password = parts[1];
    }
    if (parts.size() > 2 && !parts[2].empty()) {
        n.secure = parse_flag(parts[2]);
    }

    n.name = default_name(n);
    return n;
}

std::vector<node_config> parse_node_list(std::string_view text)
{
    std::vector<node_config> nodes;
    for (const auto& entry : split(text, ';')) {
        if (!entry.empty()) {
            nodes.push_back(parse_node(entry));
        }
    }
    return nodes;
}

bot_config config_from_json(const json& j, bot_config cfg)
{
    if (!j.is_object()) {
        throw config_error("configuration root must be an object");
    }

    try {
        cfg.token       = j.value("token", cfg.token);
        cfg.client_name = j.value("client_name", cfg.client_name);

        if (j.contains("nodes")) {
            cfg.nodes.clear();
            for (const auto& el : j.at("nodes")) {
                node_config n;
                n.host       = el.value("host", n.host);
                n.port       = el.value("port", n.port);
                n.secure     = el.value("secure", n.secure);
                n.password   = el.value("password", n.password);
                n.api_prefix = el.value("api_prefix", n.api_prefix);
                n.name       = el.value("name", default_name(n));
                if (n.port == 0) {
                    throw config_error("node '" + n.name + "' has port 0");
                }
                cfg.nodes.push_back(std::move(n));
            }
        }

        if (j.contains("reconnect")) {
            const auto& r = j.at("reconnect");
            auto& p = cfg.reconnect;
            p.base_delay        = std::chrono::milliseconds(r.value("base_delay_ms", p.base_delay.count()));
            p.max_delay         = std::chrono::milliseconds(r.value("max_delay_ms", p.max_delay.count()));
            p.multiplier        = r.value("multiplier", p.multiplier);
            p.failure_threshold = r.value("failure_threshold", p.failure_threshold);
            p.resume_window     = std::chrono::seconds(r.value("resume_window_s", p.resume_window.count()));
            p.connect_timeout   = std::chrono::milliseconds(r.value("connect_timeout_ms", p.connect_timeout.count()));
        }

        if (j.contains("rest")) {
            const auto& r = j.at("rest");
            cfg.rest.attempts   = r.value("attempts", cfg.rest.attempts);
            cfg.rest.base_delay = std::chrono::milliseconds(r.value("base_delay_ms", cfg.rest.base_delay.count()));
        }

        if (j.contains("player")) {
            const auto& pl = j.at("player");
            auto& p = cfg.player;
            p.max_queue_length  = pl.value("max_queue_length", p.max_queue_length);
            p.idle_timeout      = std::chrono::seconds(pl.value("idle_timeout_s", p.idle_timeout.count()));
            p.auto_skip_ceiling = pl.value("auto_skip_ceiling", p.auto_skip_ceiling);
            p.default_volume    = pl.value("default_volume", p.default_volume);
            p.search_prefix     = pl.value("search_prefix", p.search_prefix);
        }
    } catch (const json::exception& e) {
        throw config_error(std::string("invalid configuration: ") + e.what());
    }

    validate(cfg);
    return cfg;
}

bot_config apply_environment(bot_config cfg)
{
    if (const char* v = env("CADENCE_TOKEN")) {
        cfg.token = v;
    } else if (const char* legacy = env("token")) {
        cfg.token = legacy;
    }
    if (const char* v = env("CADENCE_NODES")) {
        cfg.nodes = parse_node_list(v);
    }
    if (const char* v = env("CADENCE_QUEUE_LIMIT")) {
        cfg.player.max_queue_length = parse_number("CADENCE_QUEUE_LIMIT", v);
    }
    if (const char* v = env("CADENCE_IDLE_TIMEOUT")) {
        cfg.player.idle_timeout = std::chrono::seconds(parse_number("CADENCE_IDLE_TIMEOUT", v));
    }
    if (const char* v = env("CADENCE_AUTO_SKIP_CEILING")) {
        cfg.player.auto_skip_ceiling = static_cast<std::uint32_t>(parse_number("CADENCE_AUTO_SKIP_CEILING", v));
    }
    if (const char* v = env("CADENCE_RESUME_WINDOW")) {
        cfg.reconnect.resume_window = std::chrono::seconds(parse_number("CADENCE_RESUME_WINDOW", v));
    }
    if (const char* v = env("CADENCE_SEARCH_PREFIX")) {
        cfg.player.search_prefix = v;
    }

    validate(cfg);
    return cfg;
}

bot_config load_config()
{
    bot_config cfg;

    if (const char* path = env("CADENCE_CONFIG")) {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw config_error(std::string("cannot open configuration file ") + path);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        json j;
        try {
            j = json::parse(buffer.str());
        } catch (const json::parse_error& e) {
            throw config_error(std::string("cannot parse ") + path + ": " + e.what());
        }
        cfg = config_from_json(j, std::move(cfg));
    }

    cfg = apply_environment(std::move(cfg));

    if (cfg.nodes.empty()) {
        node_config n;
        n.name = default_name(n);
        cfg.nodes.push_back(std::move(n));
    }
    return cfg;
}

} // namespace cad
