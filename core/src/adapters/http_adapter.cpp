#include "adapters_internal.h"

#include <sstream>
#include <stdexcept>

#include "../util/string_util.h"

#ifdef ETLQ_USE_CURL
#include <curl/curl.h>
#endif

namespace etlq::adapters_internal {

namespace {

std::string normalize_content_type(const std::string& raw) {
  std::string value = raw;
  size_t end = value.find(';');
  if (end != std::string::npos) {
    value = value.substr(0, end);
  }
  return util::to_lower(util::trim_ws(value));
}

#ifdef ETLQ_USE_CURL
/// Appends curl response chunks into the caller-owned buffer.
/// MUST return the full byte count or curl will treat it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

struct FetchResult {
  std::string body;
  std::string content_type;
};

FetchResult fetch_url(const std::string& url, int timeout_ms) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl");
  }
  FetchResult result;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "etlq/0.1");
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    curl_easy_cleanup(curl);
    throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  const char* raw_type = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &raw_type) == CURLE_OK && raw_type) {
    result.content_type = raw_type;
  }
  curl_easy_cleanup(curl);
  if (status >= 400) {
    throw std::runtime_error("HTTP status " + std::to_string(status) + " for " + url);
  }
  return result;
}
#endif

}  // namespace

BodyFormat detect_body_format(const std::string& content_type, const std::string& url) {
  std::string type = normalize_content_type(content_type);
  if (type == "application/json" || util::ends_with(type, "+json")) return BodyFormat::Json;
  if (type == "text/csv" || type == "application/csv") return BodyFormat::Csv;
  std::string path = util::to_lower(url.substr(0, url.find_first_of("?#")));
  if (util::ends_with(path, ".json")) return BodyFormat::Json;
  if (util::ends_with(path, ".csv")) return BodyFormat::Csv;
  return BodyFormat::Unknown;
}

Relation HttpExtractor::extract(const std::string& path) {
  std::string url = util::starts_with(path, "//") ? scheme_ + ":" + path : scheme_ + "://" + path;
#ifdef ETLQ_USE_CURL
  FetchResult fetched = fetch_url(url, timeout_ms_);
  switch (detect_body_format(fetched.content_type, url)) {
    case BodyFormat::Json:
      return relation_from_json(fetched.body);
    case BodyFormat::Csv: {
      std::istringstream in(fetched.body);
      return read_csv(in, delimiter_);
    }
    case BodyFormat::Unknown:
      break;
  }
  throw std::runtime_error("Unsupported Content-Type '" + normalize_content_type(fetched.content_type) +
                           "' for " + url + "; expected JSON or CSV");
#else
  (void)timeout_ms_;
  (void)delimiter_;
  throw std::runtime_error("URL fetching is disabled (libcurl not available): " + url);
#endif
}

Relation RemoteExtractor::extract(const std::string& path) {
  std::string error;
  auto descriptor = parse_remote_descriptor(path, error);
  if (!descriptor.has_value()) {
    throw std::runtime_error(error);
  }
  return collector_->collect(*descriptor);
}

}  // namespace etlq::adapters_internal
