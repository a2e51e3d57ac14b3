#include "oshub/settings.hpp"

#include "oshub/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace oshub
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool parse_bool(const std::string& v, bool defv)
{
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes")
        return true;
    if (v == "0" || v == "false" || v == "FALSE" || v == "no")
        return false;
    return defv;
}

static int parse_int(const std::string& s, int default_value)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size())
            return default_value;
        return v;
    }
    catch (const std::exception&)
    {
        return default_value;
    }
}

static std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return "";
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

static void set_env(const std::string& name, const std::string& value)
{
#ifdef _WIN32
    _putenv_s(name.c_str(), value.c_str());
#else
    setenv(name.c_str(), value.c_str(), 0);
#endif
}

Settings Settings::from_env(Settings s)
{
    // Both spellings of the key variable are accepted.
    s.api_key = getenv_str("OPEN_SUPPLY_HUB_API_KEY", getenv_str("Open_Supply_Hub_API_KEY", s.api_key));
    s.base_url = getenv_str("OSHUB_BASE_URL", s.base_url);
    s.server_name = getenv_str("OSHUB_SERVER_NAME", s.server_name);
    auto lvl = getenv_str("OSHUB_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.enable_prompts = parse_bool(getenv_str("OSHUB_ENABLE_PROMPTS", ""), s.enable_prompts);
    s.probe_query = getenv_str("OSHUB_PROBE_QUERY", s.probe_query);
    s.connect_timeout_s = parse_int(getenv_str("OSHUB_CONNECT_TIMEOUT", ""), s.connect_timeout_s);
    s.read_timeout_s = parse_int(getenv_str("OSHUB_READ_TIMEOUT", ""), s.read_timeout_s);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("api_key"))
        s.api_key = j.at("api_key").get<std::string>();
    if (j.contains("base_url"))
        s.base_url = j.at("base_url").get<std::string>();
    if (j.contains("server_name"))
        s.server_name = j.at("server_name").get<std::string>();
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("enable_prompts"))
        s.enable_prompts = j.at("enable_prompts").get<bool>();
    if (j.contains("probe_query"))
        s.probe_query = j.at("probe_query").get<std::string>();
    if (j.contains("connect_timeout_s"))
        s.connect_timeout_s = j.at("connect_timeout_s").get<int>();
    if (j.contains("read_timeout_s"))
        s.read_timeout_s = j.at("read_timeout_s").get<int>();
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open config file: " + path);
    try
    {
        return from_json(Json::parse(in));
    }
    catch (const Json::exception& e)
    {
        throw ConfigError("invalid config file " + path + ": " + e.what());
    }
}

void Settings::validate() const
{
    if (api_key.empty())
        throw ConfigError("OPEN_SUPPLY_HUB_API_KEY environment variable required");
    if (base_url.empty())
        throw ConfigError("base_url must not be empty");
    if (connect_timeout_s <= 0 || read_timeout_s <= 0)
        throw ConfigError("timeouts must be positive");
}

int load_env_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        return 0;

    int applied = 0;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.rfind("export ", 0) == 0)
            line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front())
            value = value.substr(1, value.size() - 2);
        if (key.empty() || std::getenv(key.c_str()) != nullptr)
            continue;

        set_env(key, value);
        ++applied;
    }
    return applied;
}

} // namespace oshub
