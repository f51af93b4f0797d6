// ============================================================================
// http_client.cpp - implementation for http_client.hpp
// ============================================================================

#include "cclink/http_client.hpp"
#include "cclink/logging.hpp"
#include "cclink/transport/link.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>

namespace cclink {
namespace http {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

// Decode a chunked body starting at raw[pos]. Incomplete until the zero chunk
// and the blank line after optional trailers have arrived.
Parse dechunk(const std::string& raw, size_t pos, std::string& body) {
  body.clear();
  while (true) {
    const auto eol = raw.find("\r\n", pos);
    if (eol == std::string::npos) return Parse::Incomplete;
    std::string size_line = raw.substr(pos, eol - pos);
    const auto semi = size_line.find(';');
    if (semi != std::string::npos) size_line.resize(semi);
    size_line = trim(size_line);
    if (size_line.empty()) return Parse::Bad;

    char* endp = nullptr;
    const unsigned long n = std::strtoul(size_line.c_str(), &endp, 16);
    if (!endp || *endp != '\0') return Parse::Bad;
    pos = eol + 2;

    if (n == 0) {
      // trailers end with an empty line
      while (true) {
        const auto t = raw.find("\r\n", pos);
        if (t == std::string::npos) return Parse::Incomplete;
        if (t == pos) return Parse::Complete;
        pos = t + 2;
      }
    }
    if (raw.size() < pos + n + 2) return Parse::Incomplete;
    body.append(raw, pos, n);
    pos += n;
    if (raw.compare(pos, 2, "\r\n") != 0) return Parse::Bad;
    pos += 2;
  }
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// ---------- exchange() ----------
// One attempt: connect, write the request, read until the response parses.
std::optional<Response> exchange(const Url& u, const std::string& wire, bool head_request,
                                 std::chrono::milliseconds timeout, std::string& why) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  auto link = transport::make_link(u.secure());
  transport::LinkConfig lc;
  lc.host = u.host;
  lc.port = u.port;
  lc.connect_timeout_ms = static_cast<int>(timeout.count());
  lc.send_timeout_ms = static_cast<int>(timeout.count());
  if (!link->begin(lc)) {
    why = "connect: " + link->last_error();
    return std::nullopt;
  }

  if (link->send(reinterpret_cast<const uint8_t*>(wire.data()), wire.size()) != transport::TxResult::Ok) {
    why = "send: " + link->last_error();
    link->end();
    return std::nullopt;
  }

  std::string raw;
  uint8_t buf[4096];
  Response resp;
  while (true) {
    const int left = remaining_ms(deadline);
    if (left == 0) {
      why = "timed out";
      link->end();
      return std::nullopt;
    }
    size_t n = 0;
    const auto rx = link->recv(buf, sizeof(buf), n, left);
    const bool eof = rx == transport::RxResult::Closed;
    if (rx == transport::RxResult::Error) {
      why = "recv: " + link->last_error();
      link->end();
      return std::nullopt;
    }
    if (rx == transport::RxResult::Ok) raw.append(reinterpret_cast<const char*>(buf), n);
    if (rx == transport::RxResult::None) continue;

    const Parse p = parse_response(raw, head_request, eof, resp);
    if (p == Parse::Complete) {
      link->end();
      return resp;
    }
    if (p == Parse::Bad || eof) {
      why = p == Parse::Bad ? "malformed response" : "closed before end of response";
      link->end();
      return std::nullopt;
    }
  }
}

} // namespace

std::optional<Url> parse_url(const std::string& url) {
  Url u;
  const auto sep = url.find("://");
  if (sep == std::string::npos) return std::nullopt;
  u.scheme = lower(url.substr(0, sep));
  if (u.scheme != "http" && u.scheme != "https") return std::nullopt;

  const auto rest_at = sep + 3;
  const auto slash = url.find('/', rest_at);
  std::string authority = url.substr(rest_at, slash == std::string::npos ? std::string::npos : slash - rest_at);
  u.target = slash == std::string::npos ? "/" : url.substr(slash);

  u.port = u.secure() ? 443 : 80;
  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    const std::string p = authority.substr(colon + 1);
    authority.resize(colon);
    if (p.empty() || p.size() > 5 || !std::all_of(p.begin(), p.end(), ::isdigit)) return std::nullopt;
    const long v = std::strtol(p.c_str(), nullptr, 10);
    if (v <= 0 || v > 65535) return std::nullopt;
    u.port = static_cast<uint16_t>(v);
  }
  if (authority.empty()) return std::nullopt;
  u.host = authority;
  return u;
}

bool is_valid_header(const std::string& key, const std::string& value) {
  if (key.empty()) return false;
  if (key.find_first_of("\r\n:") != std::string::npos) return false;
  if (value.find_first_of("\r\n") != std::string::npos) return false;
  return true;
}

/*
 * parse_response()
 * ----------------
 * PRE:    raw holds every byte read so far, starting at the status line.
 * POLICY: HEAD, 1xx, 204 and 304 carry no body. Chunked wins over
 *         Content-Length. Without either the body runs to EOF.
 * OUT:    Complete with `out` filled, Incomplete (read more) or Bad.
 */
Parse parse_response(const std::string& raw, bool head_request, bool eof, Response& out) {
  const auto hdr_end = raw.find("\r\n\r\n");
  if (hdr_end == std::string::npos) return eof && !raw.empty() ? Parse::Bad : Parse::Incomplete;

  out = Response{};
  const auto first_eol = raw.find("\r\n");
  const std::string status_line = raw.substr(0, first_eol);
  if (status_line.compare(0, 5, "HTTP/") != 0) return Parse::Bad;
  const auto sp = status_line.find(' ');
  if (sp == std::string::npos || status_line.size() < sp + 4) return Parse::Bad;
  const std::string code = status_line.substr(sp + 1, 3);
  if (!std::all_of(code.begin(), code.end(), ::isdigit)) return Parse::Bad;
  out.status = std::atoi(code.c_str());

  size_t pos = first_eol + 2;
  while (pos < hdr_end) {
    const auto eol = raw.find("\r\n", pos);
    const std::string line = raw.substr(pos, eol - pos);
    pos = eol + 2;
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    out.header[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }

  const size_t body_at = hdr_end + 4;
  if (head_request || out.status / 100 == 1 || out.status == 204 || out.status == 304) return Parse::Complete;

  const auto te = out.header.find("transfer-encoding");
  if (te != out.header.end() && lower(te->second).find("chunked") != std::string::npos) {
    return dechunk(raw, body_at, out.body);
  }

  const auto cl = out.header.find("content-length");
  if (cl != out.header.end()) {
    char* endp = nullptr;
    const unsigned long n = std::strtoul(cl->second.c_str(), &endp, 10);
    if (!endp || *endp != '\0') return Parse::Bad;
    if (raw.size() - body_at < n) return Parse::Incomplete;
    out.body = raw.substr(body_at, n);
    return Parse::Complete;
  }

  if (!eof) return Parse::Incomplete;
  out.body = raw.substr(body_at);
  return Parse::Complete;
}

std::optional<Response> request(const std::string& method, const std::string& url,
                                const std::string& body, const RequestOptions& opts) {
  auto lg = log::get("http");

  const auto u = parse_url(url);
  if (!u) {
    lg->error("{} {}: bad url", method, url);
    return std::nullopt;
  }

  std::string wire;
  wire.reserve(256 + body.size());
  wire += method + " " + u->target + " HTTP/1.1\r\n";
  wire += "Host: " + u->host;
  if (u->port != (u->secure() ? 443 : 80)) wire += ":" + std::to_string(u->port);
  wire += "\r\n";
  wire += "User-Agent: cclink\r\n";
  wire += "Accept: */*\r\n";
  wire += "Connection: close\r\n";
  for (const auto& [k, v] : opts.headers) {
    if (!is_valid_header(k, v)) {
      lg->warn("{} {}: skipping invalid header '{}'", method, url, k);
      continue;
    }
    wire += k + ": " + v + "\r\n";
  }
  if (!body.empty() || method == "POST" || method == "PUT") {
    if (!opts.content_type.empty()) wire += "Content-Type: " + opts.content_type + "\r\n";
    wire += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  wire += "\r\n";
  wire += body;

  const int attempts = std::max(1, opts.retries);
  std::optional<Response> last;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    std::string why;
    last = exchange(*u, wire, method == "HEAD", opts.timeout, why);
    if (last && last->status < 500) return last;

    if (last) lg->warn("{} {}: status {} (attempt {}/{})", method, url, last->status, attempt, attempts);
    else      lg->warn("{} {}: {} (attempt {}/{})", method, url, why, attempt, attempts);

    if (attempt < attempts && opts.retry_delay.count() > 0) std::this_thread::sleep_for(opts.retry_delay);
  }
  return last;
}

std::optional<Response> get(const std::string& url, const RequestOptions& opts) {
  return request("GET", url, {}, opts);
}

std::optional<Response> post(const std::string& url, const std::string& body, const RequestOptions& opts) {
  return request("POST", url, body, opts);
}

std::optional<Response> put(const std::string& url, const std::string& body, const RequestOptions& opts) {
  return request("PUT", url, body, opts);
}

std::optional<Response> del(const std::string& url, const RequestOptions& opts) {
  return request("DELETE", url, {}, opts);
}

std::optional<Response> head(const std::string& url, const RequestOptions& opts) {
  return request("HEAD", url, {}, opts);
}

} // namespace http
} // namespace cclink
