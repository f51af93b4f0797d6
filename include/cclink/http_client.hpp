/**
 * @file http_client.hpp
 * @brief Small retrying HTTP/1.1 client over the cclink link types.
 *
 * @details
 * One request per connection (`Connection: close`). `https` URLs go through
 * TlsLink, `http` through TcpLink. Response bodies are read by Content-Length,
 * chunked transfer coding, or until the peer closes.
 *
 * A request is attempted up to `retries` times (at least once), sleeping
 * `retry_delay` between attempts. Transport failures and 5xx statuses are
 * retried. After the last attempt the last response is returned as is, or
 * std::nullopt if no response was ever read.
 */

#ifndef CCLINK_HTTP_CLIENT_HPP
#define CCLINK_HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cclink {
namespace http {

struct Url {
  std::string scheme;   // "http" | "https"
  std::string host;
  uint16_t    port{0};
  std::string target;   // path + query, at least "/"

  bool secure() const { return scheme == "https"; }
};

/// "scheme://host[:port][/path]". nullopt for other schemes or a bad port.
std::optional<Url> parse_url(const std::string& url);

struct Response {
  int status{0};
  std::map<std::string, std::string> header;  // lowercase names
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

struct RequestOptions {
  std::chrono::milliseconds timeout{5000};     // connect + whole exchange, per attempt
  int retries{1};
  std::chrono::milliseconds retry_delay{0};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string content_type{"application/json"};
};

/// Reject header names/values that would allow CRLF injection.
bool is_valid_header(const std::string& key, const std::string& value);

enum class Parse : uint8_t { Incomplete = 0, Complete, Bad };

/**
 * @brief Parse a raw response buffer.
 * @param head_request no body expected
 * @param eof          peer closed; a body without length ends here
 */
Parse parse_response(const std::string& raw, bool head_request, bool eof, Response& out);

std::optional<Response> request(const std::string& method, const std::string& url,
                                const std::string& body, const RequestOptions& opts);

std::optional<Response> get(const std::string& url, const RequestOptions& opts = {});
std::optional<Response> post(const std::string& url, const std::string& body, const RequestOptions& opts = {});
std::optional<Response> put(const std::string& url, const std::string& body, const RequestOptions& opts = {});
std::optional<Response> del(const std::string& url, const RequestOptions& opts = {});
std::optional<Response> head(const std::string& url, const RequestOptions& opts = {});

} // namespace http
} // namespace cclink

#endif // CCLINK_HTTP_CLIENT_HPP
