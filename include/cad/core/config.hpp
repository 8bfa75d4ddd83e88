#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <dpp/json.h>

namespace cad {

struct node_config {
    std::string name;                        // for logs and /nodes, defaults to host:port
    std::string host       = "127.0.0.1";
    uint16_t    port       = 2333;
    bool        secure     = false;          // wss:// and https://
    std::string password   = "youshallnotpass";
    std::string api_prefix = "/v4";
};

struct reconnect_policy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double                    multiplier = 2.0;
    std::uint32_t             failure_threshold = 5;
    std::chrono::seconds      resume_window{60};
    std::chrono::milliseconds connect_timeout{5000};
};

struct rest_policy {
    std::uint32_t             attempts = 3;
    std::chrono::milliseconds base_delay{250};
};

struct player_policy {
    std::size_t          max_queue_length  = 1000;
    std::chrono::seconds idle_timeout{10};
    std::uint32_t        auto_skip_ceiling = 3;
    int                  default_volume    = 100;
    std::string          search_prefix     = "ytsearch:";
};

struct bot_config {
    std::string              token;
    std::string              client_name = "cadence";
    std::vector<node_config> nodes;
    reconnect_policy         reconnect;
    rest_policy              rest;
    player_policy            player;
};

// "host:port,password,tls". Missing parts take the node_config defaults.
node_config parse_node(std::string_view text);

// ';' separated list of parse_node() entries; empty entries are skipped.
std::vector<node_config> parse_node_list(std::string_view text);

// Overlays the keys present in `j` on top of `base`. Throws config_error.
bot_config config_from_json(const dpp::json& j, bot_config base = {});

// Applies CADENCE_* environment variables on top of `base`.
bot_config apply_environment(bot_config base);

// JSON file named by CADENCE_CONFIG (if any), then the environment. Adds the
// default node when none is configured.
bot_config load_config();

} // namespace cad
