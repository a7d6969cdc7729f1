// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <regex>
#include <vector>

#include "transfer_error.hpp"

#define SLUICE_LOG_COMPONENT "http_client"
#include <sluice_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;
using ::sluice::logging::redact_url;

namespace {

constexpr std::size_t kBodyBufferSize = 64 * 1024;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

http::verb to_verb(HttpMethod method) {
  switch (method) {
    case HttpMethod::Get:
      return http::verb::get;
    case HttpMethod::Put:
      return http::verb::put;
    case HttpMethod::Post:
      return http::verb::post;
  }
  return http::verb::get;
}

TransferError connection_error(
  ErrorKind kind, const beast::error_code& ec, const std::string& step, const ParsedUrl& url
) {
  if (ec == beast::error::timeout) {
    kind = ErrorKind::Timeout;
  }
  return TransferError(kind, step + " " + url.host + ":" + url.port + " failed: " + ec.message());
}

// Every step is started asynchronously so the tcp_stream timers apply,
// then the context is drained before the next step.
void run_pending(net::io_context& ioc) {
  ioc.restart();
  ioc.run();
}

template<typename Stream>
void connect_stream(
  Stream& stream, net::io_context& ioc, const ParsedUrl& url, std::chrono::milliseconds timeout
) {
  beast::error_code ec;
  tcp::resolver resolver(ioc);
  auto const results = resolver.resolve(url.host, url.port, ec);
  if (ec) {
    throw connection_error(ErrorKind::Connect, ec, "resolve", url);
  }

  auto& lowest = beast::get_lowest_layer(stream);
  lowest.expires_after(timeout);
  lowest.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) {
    ec = e;
  });
  run_pending(ioc);
  if (ec) {
    throw connection_error(ErrorKind::Connect, ec, "connect to", url);
  }
}

template<typename Stream>
HttpResponse exchange(
  Stream& stream, net::io_context& ioc, const ParsedUrl& url, const HttpRequest& request,
  const ChunkHandler* on_chunk, const HttpClientConfig& config
) {
  auto& lowest = beast::get_lowest_layer(stream);
  beast::error_code ec;

  http::request<http::string_body> req{to_verb(request.method), url.target, 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, config.user_agent);
  for (const auto& header : request.headers) {
    req.set(header.first, header.second);
  }
  req.body() = request.body;
  req.prepare_payload();

  lowest.expires_after(config.request_timeout);
  http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) {
    ec = e;
  });
  run_pending(ioc);
  if (ec) {
    throw connection_error(ErrorKind::Transport, ec, "send request to", url);
  }

  beast::flat_buffer buffer;
  http::response_parser<http::buffer_body> parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

  lowest.expires_after(config.request_timeout);
  http::async_read_header(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) {
    ec = e;
  });
  run_pending(ioc);
  if (ec) {
    throw connection_error(ErrorKind::Transport, ec, "read response header from", url);
  }

  HttpResponse response;
  response.status = static_cast<int>(parser.get().result_int());
  for (const auto& field : parser.get()) {
    auto name = field.name_string();
    auto value = field.value();
    response.headers[to_lower(std::string(name.data(), name.size()))] =
      std::string(value.data(), value.size());
  }

  const bool deliver = on_chunk != nullptr && *on_chunk && response.ok();
  std::vector<char> chunk(kBodyBufferSize);

  while (!parser.is_done()) {
    parser.get().body().data = chunk.data();
    parser.get().body().size = chunk.size();

    lowest.expires_after(config.request_timeout);
    http::async_read(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) {
      ec = e;
    });
    run_pending(ioc);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      throw connection_error(ErrorKind::Transport, ec, "read response body from", url);
    }

    std::size_t received = chunk.size() - parser.get().body().size;
    if (received == 0) {
      continue;
    }
    if (deliver) {
      (*on_chunk)(chunk.data(), received);
    } else {
      response.body.append(chunk.data(), received);
    }
  }

  return response;
}

void close_socket(beast::tcp_stream& lowest) {
  beast::error_code ec;
  lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
  // not_connected is expected when the peer closed first
  if (ec && ec != beast::errc::not_connected) {
    SLUICE_LOG_DEBUG("Socket shutdown" << kv("error", ec.message()));
  }
}

}  // namespace

const char* toString(HttpMethod method) {
  switch (method) {
    case HttpMethod::Get:
      return "GET";
    case HttpMethod::Put:
      return "PUT";
    case HttpMethod::Post:
      return "POST";
  }
  return "GET";
}

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  if (it == headers.end()) {
    return std::string();
  }
  return it->second;
}

std::optional<ParsedUrl> parse_url(const std::string& url) {
  // Format: http(s)://host(:port)/path?query
  static const std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl parsed;
  parsed.scheme = to_lower(match[1].str());
  parsed.host = match[2].str();
  parsed.target = match[4].str();
  parsed.use_ssl = (parsed.scheme == "https");

  if (parsed.target.empty()) {
    parsed.target = "/";
  } else if (parsed.target[0] == '?') {
    parsed.target = "/" + parsed.target;
  } else if (parsed.target[0] != '/') {
    return std::nullopt;
  }

  std::string port_str = match[3].str();
  parsed.port = port_str.empty() ? (parsed.use_ssl ? "443" : "80") : port_str;
  return parsed;
}

// ============================================================================
// BeastHttpClient
// ============================================================================

struct BeastHttpClient::Impl {
  explicit Impl(const HttpClientConfig& cfg)
      : config(cfg)
      , ssl_ctx(ssl::context::tls_client) {
    boost::system::error_code ec;
    ssl_ctx.set_default_verify_paths(ec);
    if (ec) {
      SLUICE_LOG_WARN("Could not load system CA certificates" << kv("error", ec.message()));
    }
    ssl_ctx.set_verify_mode(config.verify_ssl ? ssl::verify_peer : ssl::verify_none);
  }

  HttpResponse perform(const HttpRequest& request, const ChunkHandler* on_chunk);

  HttpClientConfig config;
  ssl::context ssl_ctx;
};

HttpResponse BeastHttpClient::Impl::perform(
  const HttpRequest& request, const ChunkHandler* on_chunk
) {
  auto url = parse_url(request.url);
  if (!url) {
    throw TransferError(ErrorKind::InvalidArgument, "invalid URL: " + redact_url(request.url));
  }

  SLUICE_LOG_DEBUG(
    toString(request.method) << " " << redact_url(request.url)
                             << kv("body_bytes", request.body.size())
  );

  net::io_context ioc;
  HttpResponse response;

  if (url->use_ssl) {
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);

    // SNI, required by virtual-hosted object stores
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
      throw TransferError(ErrorKind::Connect, "cannot set TLS server name for " + url->host);
    }
    if (config.verify_ssl) {
      stream.set_verify_callback(ssl::host_name_verification(url->host));
    }

    connect_stream(stream, ioc, *url, config.connect_timeout);

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(config.connect_timeout);
    stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) {
      ec = e;
    });
    run_pending(ioc);
    if (ec) {
      throw connection_error(ErrorKind::Connect, ec, "TLS handshake with", *url);
    }

    response = exchange(stream, ioc, *url, request, on_chunk, config);
    close_socket(beast::get_lowest_layer(stream));
  } else {
    beast::tcp_stream stream(ioc);
    connect_stream(stream, ioc, *url, config.connect_timeout);
    response = exchange(stream, ioc, *url, request, on_chunk, config);
    close_socket(stream);
  }

  SLUICE_LOG_DEBUG(
    toString(request.method) << " " << redact_url(request.url) << kv("status", response.status)
  );
  return response;
}

BeastHttpClient::BeastHttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

BeastHttpClient::~BeastHttpClient() = default;

HttpResponse BeastHttpClient::send(const HttpRequest& request) {
  return impl_->perform(request, nullptr);
}

HttpResponse BeastHttpClient::stream(const HttpRequest& request, const ChunkHandler& on_chunk) {
  return impl_->perform(request, &on_chunk);
}

}  // namespace transfer
}  // namespace sluice
