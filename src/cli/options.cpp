#include "oshub/cli/options.hpp"

#include "oshub/exceptions.hpp"
#include "oshub/mcp/handler.hpp"
#include "oshub/prompts/facility_prompts.hpp"
#include "oshub/server/stdio_server.hpp"
#include "oshub/tools/facility_tools.hpp"
#include "oshub/upstream/client.hpp"
#include "oshub/util/log.hpp"
#include "oshub/version.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace oshub::cli
{

namespace
{

std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                              const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != flag)
            continue;
        if (i + 1 >= args.size())
            throw UsageError("Missing value for " + flag);
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<long long>(i),
                   args.begin() + static_cast<long long>(i) + 2);
        return value;
    }
    return std::nullopt;
}

bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

Options parse_args(std::vector<std::string> args)
{
    Options options;
    options.help = consume_flag(args, "--help");
    options.help = consume_flag(args, "-h") || options.help;
    options.version = consume_flag(args, "--version");
    options.config_path = consume_flag_value(args, "--config");
    options.env_file = consume_flag_value(args, "--env-file");
    options.log_level = consume_flag_value(args, "--log-level");
    if (!args.empty())
        throw UsageError("Unknown option: " + args.front());
    return options;
}

Settings resolve_settings(const Options& options)
{
    load_env_file(options.env_file.value_or(".env"));

    Settings settings = options.config_path ? Settings::from_file(*options.config_path)
                                            : Settings{};
    settings = Settings::from_env(settings);
    if (options.log_level)
        settings.log_level = to_upper(*options.log_level);
    return settings;
}

void print_usage(std::ostream& os)
{
    os << "oshub-mcp " << VERSION_STRING << "\n";
    os << "MCP stdio server exposing Open Supply Hub facility search.\n";
    os << "Usage:\n";
    os << "  oshub-mcp [--config <file>] [--env-file <file>] [--log-level <level>]\n";
    os << "  oshub-mcp --help | --version\n";
    os << "\n";
    os << "Environment:\n";
    os << "  OPEN_SUPPLY_HUB_API_KEY   API token (required)\n";
    os << "  OSHUB_BASE_URL            API base URL\n";
    os << "  OSHUB_LOG_LEVEL           DEBUG, INFO, WARNING, ERROR or OFF\n";
    os << "  OSHUB_ENABLE_PROMPTS      1/0\n";
    os << "  OSHUB_PROBE_QUERY         query used to probe the API on initialize\n";
    os << "  OSHUB_CONNECT_TIMEOUT     seconds\n";
    os << "  OSHUB_READ_TIMEOUT        seconds\n";
}

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
        std::ostream& err)
{
    Options options;
    try
    {
        options = parse_args(args);
    }
    catch (const UsageError& e)
    {
        err << e.what() << "\n";
        print_usage(err);
        return kExitUsage;
    }

    if (options.help)
    {
        print_usage(out);
        return 0;
    }
    if (options.version)
    {
        out << "oshub-mcp " << VERSION_STRING << "\n";
        return 0;
    }

    util::Logger logger(util::LogLevel::Info,
                        [&err](util::LogLevel lvl, const std::string& msg)
                        { err << "[oshub] " << util::to_string(lvl) << " " << msg << std::endl; });
    try
    {
        Settings settings = resolve_settings(options);
        logger.set_level(util::log_level_from_string(settings.log_level));
        settings.validate();

        upstream::HttpUpstreamClient upstream(
            upstream::HttpClientOptions{settings.base_url, settings.api_key,
                                        settings.connect_timeout_s, settings.read_timeout_s},
            &logger);

        tools::ToolManager tools;
        tools::register_facility_tools(tools, upstream);
        prompts::PromptManager prompts;
        if (settings.enable_prompts)
            prompts::register_facility_prompts(prompts, upstream);

        mcp::DispatcherOptions dispatcher_options;
        dispatcher_options.server_info = ServerInfo{settings.server_name, settings.server_version};
        dispatcher_options.enable_prompts = settings.enable_prompts;
        dispatcher_options.probe_query = settings.probe_query;
        mcp::Dispatcher dispatcher(dispatcher_options, tools, prompts, upstream, logger);

        logger.info("Starting " + settings.server_name + " " + settings.server_version +
                    " on stdio");
        server::StdioServer server(dispatcher, logger);
        return server.run(in, out);
    }
    catch (const ConfigError& e)
    {
        logger.error(std::string("Configuration error: ") + e.what());
        return kExitConfigError;
    }
    catch (const std::exception& e)
    {
        logger.error(std::string("Server error: ") + e.what());
        return kExitConfigError;
    }
}

} // namespace oshub::cli
