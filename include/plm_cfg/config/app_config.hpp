#pragma once

#include <plm_cfg/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace plm_cfg {

inline constexpr const char* kDefaultHost = "127.0.0.1";
inline constexpr uint16_t kDefaultPort = 1234;
inline constexpr const char* kDefaultApiVersion = "v2";
inline constexpr int kDefaultTimeoutSeconds = 10;
inline constexpr int kDefaultRetries = 1;

struct ConnectionConfig {
    std::string host = kDefaultHost;
    uint16_t port = kDefaultPort;
    std::optional<ApiVersion> api_version; // defaults to v2
    int timeout_seconds = kDefaultTimeoutSeconds;
    int retries = kDefaultRetries;
};

struct MaterialConfig {
    std::string dummy; // material connected to every target first; empty: off
    bool use_copy_method = false;
    bool replace_target_name = false;
};

struct AppConfig {
    ConnectionConfig connection;
    std::string document;           // PLM-XML file
    std::string configuration;      // configuration string, wins over pr_codes
    std::vector<PrCode> pr_codes;   // joined to "+A+B" if no configuration given
    MaterialConfig material;
    std::string scene_name;         // scene set
    bool validate_scene = false;    // run the scene validation after apply
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    bool force_color = false;
    bool force_no_color = false;
};

} // namespace plm_cfg
