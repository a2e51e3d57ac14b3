#include "oshub/server/stdio_server.hpp"

#include "oshub/exceptions.hpp"

#include <iostream>
#include <string>
#include <type_traits>

namespace oshub::server
{

StdioServer::StdioServer(mcp::Dispatcher& dispatcher, const util::Logger& logger)
    : dispatcher_(dispatcher), logger_(logger)
{
}

int StdioServer::run(std::istream& in, std::ostream& out)
{
    responses_written_ = 0;
    logger_.debug("stdio server awaiting input");

    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        // Skip empty lines
        if (line.empty())
            continue;

        if (!process_line(line, out))
        {
            logger_.error("Failed to write response; output stream is unusable");
            return kExitTransportFailure;
        }
    }

    if (in.bad())
    {
        logger_.error("Error reading input; input stream is unusable");
        return kExitTransportFailure;
    }

    logger_.info("Input closed, shutting down");
    return kExitOk;
}

bool StdioServer::process_line(const std::string& line, std::ostream& out)
{
    mcp::Message message;
    try
    {
        message = mcp::decode(line);
    }
    catch (const DecodeError& e)
    {
        if (e.id())
        {
            logger_.warning(std::string("Rejecting invalid request: ") + e.what());
            return write(mcp::make_error(*e.id(), mcp::error_code::InvalidRequest, e.what()),
                         out);
        }
        if (e.method())
        {
            logger_.debug("Dropping notification " + *e.method());
            return true;
        }
        logger_.warning(std::string("Dropping malformed message: ") + e.what());
        return true;
    }

    return std::visit(
        [&](const auto& m) -> bool
        {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, mcp::Request>)
            {
                return write(dispatcher_.handle(m), out);
            }
            else
            {
                logger_.debug("Ignoring inbound response for id " + m.id.dump());
                return true;
            }
        },
        message);
}

bool StdioServer::write(const mcp::Message& message, std::ostream& out)
{
    // Write JSON-RPC response to the output (line-delimited)
    out << mcp::encode(message) << '\n';
    out.flush();
    if (!out)
        return false;
    ++responses_written_;
    return true;
}

} // namespace oshub::server
