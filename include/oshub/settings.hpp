#pragma once
#include "oshub/types.hpp"

#include <string>

namespace oshub
{

struct Settings
{
    std::string api_key;
    std::string base_url{"https://staging.opensupplyhub.org/api"};
    std::string server_name{"opensupplyhub-server"};
    std::string server_version{"0.1.0"};
    std::string log_level{"INFO"};
    bool enable_prompts{true};
    std::string probe_query{"test"};
    int connect_timeout_s{10};
    int read_timeout_s{30};

    /// Overlay environment variables on top of `base`.
    static Settings from_env(Settings base);
    static Settings from_env()
    {
        return from_env(Settings{});
    }
    static Settings from_json(const Json& j);
    static Settings from_file(const std::string& path);

    /// Throws ConfigError when a required value is missing or out of range.
    void validate() const;
};

/// Load KEY=VALUE lines from a dotenv-style file into the process environment.
/// Variables that are already set are left untouched.
/// Returns the number of variables applied; a missing file applies none.
int load_env_file(const std::string& path);

} // namespace oshub
