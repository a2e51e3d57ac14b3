#pragma once
#include "oshub/mcp/handler.hpp"
#include "oshub/util/log.hpp"

#include <iosfwd>
#include <string>

namespace oshub::server
{

/// Process exit codes returned by StdioServer::run().
constexpr int kExitOk = 0;
constexpr int kExitTransportFailure = 1;

/**
 * STDIO transport for line-delimited JSON-RPC communication.
 *
 * Reads one message per line from `in`, hands requests to the Dispatcher and
 * writes each response as one line to `out`, flushing before the next line
 * is read. Logs go through the Logger, never to `out`.
 *
 * Usage:
 *   oshub::server::StdioServer server(dispatcher, logger);
 *   return server.run(std::cin, std::cout);
 *
 * Lines that cannot be decoded are answered with Invalid Request when an id
 * could be read, otherwise dropped with a diagnostic.
 */
class StdioServer
{
  public:
    StdioServer(mcp::Dispatcher& dispatcher, const util::Logger& logger);

    /**
     * Run until end of input (blocking).
     *
     * @return kExitOk on EOF, kExitTransportFailure when reading `in` or
     *         writing `out` fails.
     */
    int run(std::istream& in, std::ostream& out);

    /// Number of responses written by the last run().
    size_t responses_written() const
    {
        return responses_written_;
    }

  private:
    bool process_line(const std::string& line, std::ostream& out);
    bool write(const mcp::Message& message, std::ostream& out);

    mcp::Dispatcher& dispatcher_;
    const util::Logger& logger_;
    size_t responses_written_{0};
};

} // namespace oshub::server
