// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_HTTP_CLIENT_HPP
#define SLUICE_HTTP_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace sluice {
namespace transfer {

enum class HttpMethod { Get, Put, Post };

const char* toString(HttpMethod method);

struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers;  // Names lower-cased
  std::string body;

  bool ok() const {
    return status >= 200 && status < 300;
  }

  /**
   * Case-insensitive header lookup, empty string when absent
   */
  std::string header(const std::string& name) const;
};

/**
 * Receives body bytes of a streamed 2xx response as they arrive
 */
using ChunkHandler = std::function<void(const char* data, std::size_t size)>;

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string target;  // Path plus query, "/" when empty
  bool use_ssl = false;
};

/**
 * Parse http(s)://host(:port)/path?query. Default ports are 80 and 443.
 */
std::optional<ParsedUrl> parse_url(const std::string& url);

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds request_timeout{120000};  // Per read or write on the connection
  bool verify_ssl = true;
  std::string user_agent = "sluice/1.0";
};

/**
 * Blocking HTTP/1.1 client.
 *
 * Any status code is returned as a response. Transport failures throw
 * TransferError with kind Timeout, Connect or Transport; a malformed URL
 * throws TransferError(InvalidArgument).
 */
class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  /**
   * Send a request and buffer the whole response body
   */
  virtual HttpResponse send(const HttpRequest& request) = 0;

  /**
   * Send a request and hand a 2xx body to `on_chunk` piece by piece.
   * Non-2xx bodies are buffered into the returned response instead.
   */
  virtual HttpResponse stream(const HttpRequest& request, const ChunkHandler& on_chunk) = 0;
};

/**
 * IHttpClient over Boost.Beast, TLS through OpenSSL.
 * One connection per request. Safe to share between threads.
 */
class BeastHttpClient : public IHttpClient {
public:
  explicit BeastHttpClient(const HttpClientConfig& config = {});
  ~BeastHttpClient() override;

  // Non-copyable
  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;

  HttpResponse send(const HttpRequest& request) override;
  HttpResponse stream(const HttpRequest& request, const ChunkHandler& on_chunk) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_HTTP_CLIENT_HPP
