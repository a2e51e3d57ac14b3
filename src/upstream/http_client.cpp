#include "oshub/exceptions.hpp"
#include "oshub/upstream/client.hpp"
#include "oshub/util/json.hpp"

#include <cctype>
#include <httplib.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace oshub::upstream
{

namespace
{
struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    std::string path; // without trailing '/', may be empty
};

ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl result;
    std::string remaining = url;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }

    if (result.scheme != "http" && result.scheme != "https")
        throw ConfigError("Unsupported URL scheme: " + result.scheme +
                          " (only http and https are allowed)");

    auto slash_pos = remaining.find('/');
    if (slash_pos != std::string::npos)
    {
        result.path = remaining.substr(slash_pos);
        remaining = remaining.substr(0, slash_pos);
    }
    while (!result.path.empty() && result.path.back() == '/')
        result.path.pop_back();

    auto colon_pos = remaining.rfind(':');
    if (colon_pos != std::string::npos)
    {
        result.host = remaining.substr(0, colon_pos);
        try
        {
            result.port = std::stoi(remaining.substr(colon_pos + 1));
        }
        catch (const std::exception&)
        {
            throw ConfigError("Invalid port in URL: " + url);
        }
    }
    else
    {
        result.host = remaining;
        result.port = result.scheme == "https" ? 443 : 80;
    }

    if (result.host.empty())
        throw ConfigError("URL has no host: " + url);
    return result;
}
} // namespace

std::string url_encode_component(const std::string& value)
{
    std::ostringstream out;
    out << std::uppercase << std::hex;
    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            out << static_cast<char>(c);
        else
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return out.str();
}

HttpUpstreamClient::HttpUpstreamClient(HttpClientOptions options, const util::Logger* logger)
    : options_(std::move(options)), logger_(logger)
{
    auto parsed = parse_url(options_.base_url);
    scheme_ = parsed.scheme;
    host_ = parsed.host;
    port_ = parsed.port;
    base_path_ = parsed.path;
}

std::optional<std::string> HttpUpstreamClient::same_origin_target(const std::string& location) const
{
    if (!location.empty() && location[0] == '/')
        return location;

    auto scheme_pos = location.find("://");
    if (scheme_pos == std::string::npos)
        return std::nullopt;
    auto slash_pos = location.find('/', scheme_pos + 3);
    std::string origin = location.substr(0, slash_pos);
    std::string target = slash_pos == std::string::npos ? "/" : location.substr(slash_pos);

    const std::string bare = scheme_ + "://" + host_;
    const int default_port = scheme_ == "https" ? 443 : 80;
    if (origin == bare + ":" + std::to_string(port_) || (origin == bare && port_ == default_port))
        return target;
    return std::nullopt;
}

HttpUpstreamClient::HttpReply HttpUpstreamClient::get(const std::string& target) const
{
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https")
        throw ConfigError("https:// base URL requires CPPHTTPLIB_OPENSSL_SUPPORT at build time");
#endif
    // Client picks plain or TLS transport from the scheme prefix
    auto client = std::make_unique<httplib::Client>(scheme_ + "://" + host_ + ":" +
                                                    std::to_string(port_));
    // Redirects are followed below, and only within this origin, so the token
    // never reaches another host.
    client->set_follow_location(false);
    client->set_connection_timeout(options_.connect_timeout_s, 0);
    client->set_read_timeout(options_.read_timeout_s, 0);

    httplib::Headers headers = {{"Authorization", "Token " + options_.api_key},
                                {"Accept", "application/json"}};

    std::string current = target;
    for (int hop = 0; hop <= kMaxRedirects; ++hop)
    {
        if (logger_)
            logger_->debug("GET " + scheme_ + "://" + host_ + current);

        auto res = client->Get(current.c_str(), headers);
        if (!res)
            throw TransportError("Upstream request failed for GET " + current + ": " +
                                 httplib::to_string(res.error()));

        if (logger_)
            logger_->debug("Received response: " + std::to_string(res->status));

        if (res->status < 300 || res->status >= 400 || !res->has_header("Location"))
            return HttpReply{res->status, res->body};

        auto next = same_origin_target(res->get_header_value("Location"));
        if (!next)
            throw UpstreamError("Refusing redirect to another host for GET " + current,
                                res->status);
        current = *next;
    }
    throw UpstreamError("Too many redirects for GET " + target);
}

Json HttpUpstreamClient::parse_body(const HttpReply& reply, const std::string& what) const
{
    if (reply.status < 200 || reply.status >= 300)
        throw UpstreamError("Failed to fetch " + what + ": HTTP " + std::to_string(reply.status),
                            reply.status);
    try
    {
        return util::json::parse(reply.body);
    }
    catch (const Json::parse_error&)
    {
        throw UpstreamError("Upstream returned a non-JSON body for " + what, reply.status);
    }
}

Json HttpUpstreamClient::search(const std::string& query)
{
    auto reply = get(base_path_ + "/facilities/?q=" + url_encode_component(query));
    return parse_body(reply, "facilities");
}

std::optional<Json> HttpUpstreamClient::get_by_id(const std::string& os_id)
{
    auto reply = get(base_path_ + "/facilities/" + url_encode_component(os_id) + "/");
    if (reply.status == 404)
        return std::nullopt;
    return parse_body(reply, "facility " + os_id);
}

} // namespace oshub::upstream
