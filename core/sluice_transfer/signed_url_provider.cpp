// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "signed_url_provider.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

#include "transfer_error.hpp"

#define SLUICE_LOG_COMPONENT "signed_url_provider"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace transfer {

using ::sluice::logging::kv;

namespace {

template<typename T>
std::optional<T> optional_field(const nlohmann::json& j, const char* name) {
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

nlohmann::json parse_body(const HttpResponse& response, const std::string& context) {
  nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw TransferError(ErrorKind::InvalidResponse, context + ": response is not a JSON object");
  }
  return j;
}

void check_status(const HttpResponse& response, const std::string& context) {
  if (!response.ok()) {
    throw TransferError::httpStatus(response.status, response.body, context);
  }
}

}  // namespace

std::vector<std::string> SignedDownload::segmentUrls() const {
  if (!urls.empty()) {
    return urls;
  }
  if (url && !url->empty()) {
    return {*url};
  }
  return {};
}

std::string percentEncode(const std::string& raw) {
  std::ostringstream oss;
  oss << std::uppercase << std::hex << std::setfill('0');
  for (unsigned char c : raw) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      oss << static_cast<char>(c);
    } else {
      oss << '%' << std::setw(2) << static_cast<int>(c);
    }
  }
  return oss.str();
}

OssSignedUrlProvider::OssSignedUrlProvider(const ProviderConfig& config, IHttpClient& http)
    : config_(config)
    , http_(http) {
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
  if (config_.base_url.empty()) {
    throw TransferError(ErrorKind::InvalidArgument, "API base URL is empty");
  }
}

std::string OssSignedUrlProvider::objectUrl(
  const std::string& bucket_key, const std::string& object_key, const std::string& endpoint
) const {
  return config_.base_url + "/buckets/" + bucket_key + "/objects/" + percentEncode(object_key) +
         "/" + endpoint;
}

HttpRequest OssSignedUrlProvider::makeRequest(HttpMethod method, const std::string& url) const {
  HttpRequest request;
  request.method = method;
  request.url = url;
  if (!config_.access_token.empty()) {
    request.headers["Authorization"] = "Bearer " + config_.access_token;
  }
  if (!config_.region.empty()) {
    request.headers["x-ads-region"] = config_.region;
  }
  return request;
}

SignedUpload OssSignedUrlProvider::getSignedUpload(
  const std::string& bucket_key, const std::string& object_key, std::optional<uint32_t> parts,
  const std::string& upload_key
) {
  std::string url = objectUrl(bucket_key, object_key, "signeds3upload");

  std::vector<std::string> params;
  if (parts) {
    params.push_back("parts=" + std::to_string(*parts));
  }
  if (!upload_key.empty()) {
    params.push_back("uploadKey=" + percentEncode(upload_key));
  }
  if (config_.expiry_minutes) {
    params.push_back("minutesExpiration=" + std::to_string(*config_.expiry_minutes));
  }
  for (size_t i = 0; i < params.size(); ++i) {
    url += (i == 0 ? "?" : "&") + params[i];
  }

  const std::string context = "get signed upload URL for " + bucket_key + "/" + object_key;
  auto response = http_.send(makeRequest(HttpMethod::Get, url));
  check_status(response, context);
  auto j = parse_body(response, context);

  SignedUpload signed_upload;
  try {
    j.at("uploadKey").get_to(signed_upload.upload_key);
    j.at("urls").get_to(signed_upload.urls);
    signed_upload.upload_expiration =
      optional_field<std::string>(j, "uploadExpiration").value_or(std::string());
  } catch (const nlohmann::json::exception& e) {
    throw TransferError(ErrorKind::InvalidResponse, context + ": " + e.what());
  }

  if (signed_upload.upload_key.empty()) {
    throw TransferError(ErrorKind::InvalidResponse, context + ": empty uploadKey");
  }

  SLUICE_LOG_DEBUG(
    "Signed upload URLs issued" << kv("urls", signed_upload.urls.size())
                                << kv("expires", signed_upload.upload_expiration)
  );
  return signed_upload;
}

ObjectInfo OssSignedUrlProvider::completeSignedUpload(
  const std::string& bucket_key, const std::string& object_key, const std::string& upload_key
) {
  const std::string context = "complete upload of " + bucket_key + "/" + object_key;

  auto request = makeRequest(HttpMethod::Post, objectUrl(bucket_key, object_key, "signeds3upload"));
  request.headers["Content-Type"] = "application/json";
  request.body = nlohmann::json{{"uploadKey", upload_key}}.dump();

  auto response = http_.send(request);
  check_status(response, context);
  auto j = parse_body(response, context);

  ObjectInfo info;
  try {
    j.at("bucketKey").get_to(info.bucket_key);
    j.at("objectKey").get_to(info.object_key);
    j.at("objectId").get_to(info.object_id);
    info.size = optional_field<uint64_t>(j, "size").value_or(0);
    info.sha1 = optional_field<std::string>(j, "sha1");
    info.location = optional_field<std::string>(j, "location");
    info.content_type = optional_field<std::string>(j, "contentType");
  } catch (const nlohmann::json::exception& e) {
    throw TransferError(ErrorKind::InvalidResponse, context + ": " + e.what());
  }
  return info;
}

SignedDownload OssSignedUrlProvider::getSignedDownload(
  const std::string& bucket_key, const std::string& object_key
) {
  std::string url = objectUrl(bucket_key, object_key, "signeds3download");
  if (config_.expiry_minutes) {
    url += "?minutesExpiration=" + std::to_string(*config_.expiry_minutes);
  }

  const std::string context = "get signed download URL for " + bucket_key + "/" + object_key;
  auto response = http_.send(makeRequest(HttpMethod::Get, url));
  check_status(response, context);
  auto j = parse_body(response, context);

  SignedDownload download;
  try {
    download.url = optional_field<std::string>(j, "url");
    download.urls = optional_field<std::vector<std::string>>(j, "urls").value_or(
      std::vector<std::string>()
    );
    download.size = optional_field<uint64_t>(j, "size");
    download.sha1 = optional_field<std::string>(j, "sha1");
    download.status = optional_field<std::string>(j, "status");
  } catch (const nlohmann::json::exception& e) {
    throw TransferError(ErrorKind::InvalidResponse, context + ": " + e.what());
  }

  if (download.segmentUrls().empty()) {
    throw TransferError(ErrorKind::InvalidResponse, context + ": no download URL in response");
  }
  return download;
}

}  // namespace transfer
}  // namespace sluice
