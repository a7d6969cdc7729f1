// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_SIGNED_URL_PROVIDER_HPP
#define SLUICE_SIGNED_URL_PROVIDER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "http_client.hpp"

namespace sluice {
namespace transfer {

/**
 * Pre-signed PUT URLs for one upload session
 */
struct SignedUpload {
  std::string upload_key;  // Session token, required for completion
  std::vector<std::string> urls;
  std::string upload_expiration;
};

/**
 * Descriptor of a finalized remote object
 */
struct ObjectInfo {
  std::string bucket_key;
  std::string object_key;
  std::string object_id;
  std::optional<std::string> sha1;
  uint64_t size = 0;
  std::optional<std::string> location;
  std::optional<std::string> content_type;
};

/**
 * Pre-signed GET URL(s) for one object
 */
struct SignedDownload {
  std::optional<std::string> url;
  std::vector<std::string> urls;  // Set when the object was stored in parts
  std::optional<uint64_t> size;
  std::optional<std::string> sha1;
  std::optional<std::string> status;

  /**
   * URLs to fetch in order: `urls` when present, otherwise the single `url`
   */
  std::vector<std::string> segmentUrls() const;
};

/**
 * Remote API that issues pre-signed URLs and finalizes uploads.
 * Failures are reported as TransferError.
 */
class ISignedUrlProvider {
public:
  virtual ~ISignedUrlProvider() = default;

  /**
   * @param parts Number of part URLs to sign, std::nullopt for a single-part upload
   * @param upload_key Existing session to sign more URLs for, empty to open a new one
   */
  virtual SignedUpload getSignedUpload(
    const std::string& bucket_key, const std::string& object_key, std::optional<uint32_t> parts,
    const std::string& upload_key
  ) = 0;

  virtual ObjectInfo completeSignedUpload(
    const std::string& bucket_key, const std::string& object_key, const std::string& upload_key
  ) = 0;

  virtual SignedDownload getSignedDownload(
    const std::string& bucket_key, const std::string& object_key
  ) = 0;
};

struct ProviderConfig {
  std::string base_url;      // e.g. https://developer.api.autodesk.com/oss/v2
  std::string access_token;  // Bearer token, acquired elsewhere
  std::string region;        // Sent as x-ads-region when set
  std::optional<uint32_t> expiry_minutes;
};

/**
 * RFC 3986 percent-encoding; unreserved characters pass through
 */
std::string percentEncode(const std::string& raw);

/**
 * ISignedUrlProvider for the OSS signeds3upload / signeds3download endpoints
 */
class OssSignedUrlProvider : public ISignedUrlProvider {
public:
  OssSignedUrlProvider(const ProviderConfig& config, IHttpClient& http);

  SignedUpload getSignedUpload(
    const std::string& bucket_key, const std::string& object_key, std::optional<uint32_t> parts,
    const std::string& upload_key
  ) override;

  ObjectInfo completeSignedUpload(
    const std::string& bucket_key, const std::string& object_key, const std::string& upload_key
  ) override;

  SignedDownload getSignedDownload(
    const std::string& bucket_key, const std::string& object_key
  ) override;

  std::string objectUrl(
    const std::string& bucket_key, const std::string& object_key, const std::string& endpoint
  ) const;

private:
  HttpRequest makeRequest(HttpMethod method, const std::string& url) const;

  ProviderConfig config_;
  IHttpClient& http_;
};

}  // namespace transfer
}  // namespace sluice

#endif  // SLUICE_SIGNED_URL_PROVIDER_HPP
