// src/s3_client.cpp
#include "inventory/s3_client.hpp"
#include "inventory/errors.h"
#include "inventory/logging.h"

#include <curl/curl.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace std;

namespace inventory
{

// SHA-256 of an empty body; every request here is a GET or HEAD
static const char* kEmptyPayloadHash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

// ------------------------ low-level helpers ------------------------

static size_t curl_write_string_cb(void *contents, size_t size, size_t nmemb, void *userp)
{
    size_t realsize = size * nmemb;
    string *s = static_cast<string *>(userp);
    s->append(static_cast<char *>(contents), realsize);
    return realsize;
}

static size_t curl_write_file_cb(void *contents, size_t size, size_t nmemb, void *userp)
{
    FILE *f = static_cast<FILE *>(userp);
    return fwrite(contents, size, nmemb, f) * size;
}

string hex_encode(const string &bytes)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : bytes)
    {
        oss << setw(2) << static_cast<unsigned int>(c);
    }
    return oss.str();
}

string sha256_hex(const string &data)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return hex_encode(string(reinterpret_cast<const char*>(digest), SHA256_DIGEST_LENGTH));
}

string hmac_sha256(const string &key, const string &data)
{
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              result, &len))
    {
        throw runtime_error("HMAC failed");
    }
    return string(reinterpret_cast<const char*>(result), len);
}

string uri_encode(const string &s, bool keep_slash)
{
    std::ostringstream oss;
    for (unsigned char c : s)
    {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slash && c == '/'))
            oss << c;
        else
        {
            oss << '%' << std::uppercase << std::hex << setw(2) << setfill('0') << int(c)
                << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

static string trim(const string &s)
{
    size_t b = s.find_first_not_of(" \t");
    if (b == string::npos) return string();
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

string sigv4_authorization(const string &method,
                           const string &canonical_uri,
                           const string &canonical_query,
                           const map<string, string> &headers,
                           const string &payload_hash,
                           const string &amz_date,
                           const string &region,
                           const S3Credentials &creds)
{
    // map keeps header names sorted, as the canonical form requires
    std::ostringstream canonical_headers;
    std::ostringstream signed_headers;
    bool first = true;
    for (const auto &kv : headers)
    {
        canonical_headers << kv.first << ':' << trim(kv.second) << '\n';
        if (!first) signed_headers << ';';
        first = false;
        signed_headers << kv.first;
    }

    std::ostringstream canonical;
    canonical << method << '\n'
              << canonical_uri << '\n'
              << canonical_query << '\n'
              << canonical_headers.str() << '\n'
              << signed_headers.str() << '\n'
              << payload_hash;

    const string date = amz_date.substr(0, 8);
    const string scope = date + "/" + region + "/s3/aws4_request";

    std::ostringstream to_sign;
    to_sign << "AWS4-HMAC-SHA256\n"
            << amz_date << '\n'
            << scope << '\n'
            << sha256_hex(canonical.str());

    string k = hmac_sha256("AWS4" + creds.secret_access_key, date);
    k = hmac_sha256(k, region);
    k = hmac_sha256(k, "s3");
    k = hmac_sha256(k, "aws4_request");
    const string signature = hex_encode(hmac_sha256(k, to_sign.str()));

    return "AWS4-HMAC-SHA256 Credential=" + creds.access_key_id + "/" + scope +
           ",SignedHeaders=" + signed_headers.str() +
           ",Signature=" + signature;
}

S3Credentials credentials_from_env(S3Credentials creds)
{
    auto fill = [](string &field, const char *var)
    {
        if (!field.empty()) return;
        const char *v = std::getenv(var);
        if (v) field = v;
    };
    fill(creds.access_key_id, "AWS_ACCESS_KEY_ID");
    fill(creds.secret_access_key, "AWS_SECRET_ACCESS_KEY");
    fill(creds.session_token, "AWS_SESSION_TOKEN");
    return creds;
}

static string amz_date_now()
{
    time_t t = time(nullptr);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_buf);
    return string(buf);
}

// ------------------------ construction & destruction ------------------------

void s3_global_init()
{
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK)
    {
        throw runtime_error(string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }
}

void s3_global_cleanup()
{
    curl_global_cleanup();
}

S3Client::S3Client(S3Options options)
    : options_(std::move(options))
{
    options_.credentials = credentials_from_env(options_.credentials);

    scheme_ = "https";
    if (!options_.endpoint.empty())
    {
        string ep = options_.endpoint;
        size_t p = ep.find("://");
        if (p != string::npos)
        {
            scheme_ = ep.substr(0, p);
            ep = ep.substr(p + 3);
        }
        while (!ep.empty() && ep.back() == '/') ep.pop_back();
        endpoint_host_ = ep;
    }

    std::ostringstream oss;
    oss << "[S3Client] constructed. endpoint=" << (options_.endpoint.empty() ? "aws" : options_.endpoint)
        << " region=" << options_.region
        << " path_style=" << (options_.path_style ? "true" : "false")
        << " access_key.len=" << options_.credentials.access_key_id.size();
    log_message(oss.str());
}

S3Client::~S3Client() {}

pair<string, string> S3Client::host_and_path(const string &bucket, const string &key) const
{
    string rel = key;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    const string encoded_key = uri_encode(rel, true);

    string base = endpoint_host_.empty() ? ("s3." + options_.region + ".amazonaws.com") : endpoint_host_;
    if (options_.path_style)
    {
        return {base, "/" + uri_encode(bucket, false) + "/" + encoded_key};
    }
    return {bucket + "." + base, "/" + encoded_key};
}

string S3Client::object_url(const string &bucket, const string &key) const
{
    auto hp = host_and_path(bucket, key);
    return scheme_ + "://" + hp.first + hp.second;
}

// ------------------------ networking ------------------------

S3Client::Response S3Client::perform_request(const string &method,
                                             const string &bucket,
                                             const string &key,
                                             const string &range,
                                             string *body,
                                             FILE *file) const
{
    auto hp = host_and_path(bucket, key);
    const string url = scheme_ + "://" + hp.first + hp.second;
    const string amz_date = amz_date_now();

    map<string, string> signed_headers;
    signed_headers["host"] = hp.first;
    signed_headers["x-amz-content-sha256"] = kEmptyPayloadHash;
    signed_headers["x-amz-date"] = amz_date;
    if (!range.empty()) signed_headers["range"] = range;
    if (!options_.credentials.session_token.empty())
        signed_headers["x-amz-security-token"] = options_.credentials.session_token;

    const string authorization = sigv4_authorization(method, hp.second, "", signed_headers, kEmptyPayloadHash,
                                                     amz_date, options_.region, options_.credentials);

    CURL *curl = curl_easy_init();
    if (!curl)
    {
        log_error("[perform_request] curl_easy_init failed");
        throw ObjectStoreError(bucket, key, 0, "curl_easy_init failed");
    }

    struct curl_slist *headers = nullptr;
    for (const auto &kv : signed_headers)
    {
        if (kv.first == "host") continue; // curl sends Host itself
        string h = kv.first + ": " + kv.second;
        headers = curl_slist_append(headers, h.c_str());
    }
    {
        string h = "Authorization: " + authorization;
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_sec);

    string error_body;
    if (method == "HEAD")
    {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    }
    else
    {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        if (file)
        {
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_file_cb);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, file);
        }
        else
        {
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_string_cb);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, body ? body : &error_body);
        }
    }

    CURLcode res = curl_easy_perform(curl);
    Response out;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.http_code);
    curl_off_t cl = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl);
    out.content_length = static_cast<int64_t>(cl);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
    {
        std::ostringstream oss;
        oss << "[perform_request] curl_easy_perform() failed: " << curl_easy_strerror(res) << " url=" << url;
        log_error(oss.str());
        throw ObjectStoreError(bucket, key, out.http_code, string("curl error: ") + curl_easy_strerror(res));
    }

    {
        std::ostringstream oss;
        oss << "[perform_request] url=" << url << " method=" << method << " http_code=" << out.http_code;
        if (!range.empty()) oss << " range=" << range;
        log_message(oss.str());
    }

    if (out.http_code >= 300)
    {
        string preview;
        if (body && !body->empty()) preview = *body;
        else preview = error_body;
        if (preview.size() > 512) preview = preview.substr(0, 512) + "...";
        throw ObjectStoreError(bucket, key, out.http_code,
                               method + " failed" + (preview.empty() ? string() : ": " + preview));
    }
    return out;
}

// ------------------------ object access ------------------------

string range_body(const string &bucket, const string &key, long http_code,
                  string body, uint64_t offset, uint64_t length)
{
    if (http_code == 206)
    {
        if (body.size() > length) body.resize(length);
        return body;
    }
    if (http_code == 200)
    {
        // Range was ignored: the body is the full object
        if (offset >= body.size()) return string();
        return body.substr(offset, length);
    }
    throw ObjectStoreError(bucket, key, http_code, "unexpected status for ranged GET");
}

string S3Client::get_object(const string &bucket, const string &key)
{
    string body;
    perform_request("GET", bucket, key, "", &body, nullptr);
    return body;
}

string S3Client::get_range(const string &bucket, const string &key, uint64_t offset, uint64_t length)
{
    if (length == 0) return string();
    std::ostringstream range;
    range << "bytes=" << offset << '-' << (offset + length - 1);
    string body;
    Response r = perform_request("GET", bucket, key, range.str(), &body, nullptr);
    return range_body(bucket, key, r.http_code, std::move(body), offset, length);
}

ObjectInfo S3Client::head_object(const string &bucket, const string &key)
{
    Response r = perform_request("HEAD", bucket, key, "", nullptr, nullptr);
    if (r.content_length < 0)
    {
        throw ObjectStoreError(bucket, key, r.http_code, "HEAD response without Content-Length");
    }
    ObjectInfo info;
    info.size = static_cast<uint64_t>(r.content_length);
    return info;
}

void S3Client::download(const string &bucket, const string &key, const string &local_path)
{
    FILE *f = fopen(local_path.c_str(), "wb");
    if (!f)
    {
        throw ObjectStoreError(bucket, key, 0, "cannot create local file " + local_path);
    }
    try
    {
        perform_request("GET", bucket, key, "", nullptr, f);
    }
    catch (const exception &)
    {
        fclose(f);
        std::remove(local_path.c_str());
        throw;
    }
    if (fclose(f) != 0)
    {
        std::remove(local_path.c_str());
        throw ObjectStoreError(bucket, key, 0, "failed to flush local file " + local_path);
    }
}

} // namespace inventory
