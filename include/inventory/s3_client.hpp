#pragma once

#include "inventory/iobject_store.h"

#include <cstdint>
#include <cstdio>
#include <map>
#include <utility>
#include <string>

namespace inventory
{

struct S3Credentials
{
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token;   // optional
};

struct S3Options
{
  std::string endpoint;        // e.g. "http://localhost:9000"; empty => AWS
  std::string region = "us-east-1";
  bool path_style = false;
  long timeout_sec = 60;
  S3Credentials credentials;
};

// --- AWS Signature Version 4 helpers (exposed for tests) ---

std::string sha256_hex(const std::string& data);
std::string hmac_sha256(const std::string& key, const std::string& data);
std::string hex_encode(const std::string& bytes);

// Percent-encode a URI path; '/' is kept when keep_slash is set
std::string uri_encode(const std::string& s, bool keep_slash);

// Value for the Authorization header. `headers` are the signed request
// headers keyed by lower-case name (host, x-amz-date, x-amz-content-sha256, ...).
std::string sigv4_authorization(const std::string& method,
                                const std::string& canonical_uri,
                                const std::string& canonical_query,
                                const std::map<std::string, std::string>& headers,
                                const std::string& payload_hash,
                                const std::string& amz_date,
                                const std::string& region,
                                const S3Credentials& creds);

// Fill missing credentials from AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN
S3Credentials credentials_from_env(S3Credentials creds);

// Bytes [offset, offset+length) of a ranged GET reply. A 206 body is the range
// itself; a 200 body is the whole object and gets sliced. Any other status throws.
std::string range_body(const std::string& bucket, const std::string& key, long http_code,
                       std::string body, uint64_t offset, uint64_t length);

// libcurl process-wide setup; call once before any S3Client and pair with cleanup
void s3_global_init();
void s3_global_cleanup();

class S3Client : public IObjectStore
{
public:
  explicit S3Client(S3Options options);
  ~S3Client() override;

  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;

  std::string get_object(const std::string& bucket, const std::string& key) override;
  std::string get_range(const std::string& bucket, const std::string& key,
                        uint64_t offset, uint64_t length) override;
  ObjectInfo head_object(const std::string& bucket, const std::string& key) override;
  void download(const std::string& bucket, const std::string& key,
                const std::string& local_path) override;

  // Host and path (already encoded) for an object
  std::pair<std::string, std::string> host_and_path(const std::string& bucket, const std::string& key) const;
  std::string object_url(const std::string& bucket, const std::string& key) const;

private:
  struct Response
  {
    long http_code = 0;
    int64_t content_length = -1;
  };

  Response perform_request(const std::string& method,
                           const std::string& bucket,
                           const std::string& key,
                           const std::string& range,
                           std::string* body,
                           FILE* file) const;

  S3Options options_;
  std::string scheme_;
  std::string endpoint_host_;
};

} // namespace inventory
