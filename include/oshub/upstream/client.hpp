#pragma once
#include "oshub/types.hpp"
#include "oshub/util/log.hpp"

#include <optional>
#include <string>

namespace oshub::upstream
{

/**
 * Facility data provider consumed by the tool and prompt handlers.
 *
 * Both operations throw TransportError when the provider cannot be reached
 * and UpstreamError when it answers with a non-success status or an
 * unreadable body.
 */
class UpstreamClient
{
  public:
    virtual ~UpstreamClient() = default;

    /// Free-text facility search. Returns the provider's result document.
    virtual Json search(const std::string& query) = 0;

    /// Facility record by OS ID; std::nullopt when the provider reports it unknown.
    virtual std::optional<Json> get_by_id(const std::string& os_id) = 0;
};

struct HttpClientOptions
{
    std::string base_url; ///< e.g. https://staging.opensupplyhub.org/api
    std::string api_key;  ///< sent as "Authorization: Token <api_key>"
    int connect_timeout_s{10};
    int read_timeout_s{30};
};

/// UpstreamClient talking to the Open Supply Hub REST API over HTTP(S).
class HttpUpstreamClient : public UpstreamClient
{
  public:
    explicit HttpUpstreamClient(HttpClientOptions options,
                                const util::Logger* logger = nullptr);

    Json search(const std::string& query) override;
    std::optional<Json> get_by_id(const std::string& os_id) override;

  private:
    struct HttpReply
    {
        int status;
        std::string body;
    };

    static constexpr int kMaxRedirects = 5;

    /// Request target for a Location on this client's origin; std::nullopt otherwise.
    std::optional<std::string> same_origin_target(const std::string& location) const;
    HttpReply get(const std::string& target) const;
    Json parse_body(const HttpReply& reply, const std::string& what) const;

    HttpClientOptions options_;
    std::string scheme_;
    std::string host_;
    int port_;
    std::string base_path_;
    const util::Logger* logger_;
};

/// Percent-encode a value for use in a URL path segment or query string.
std::string url_encode_component(const std::string& value);

} // namespace oshub::upstream
