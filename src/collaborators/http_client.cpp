#include "collaborators/http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <utility>

namespace comfytest::collaborators {

namespace {

// curl_global_init is not thread safe; platform threads may race to the
// first request.
bool EnsureCurlGlobal(std::string& error) {
  static std::once_flag once;
  static CURLcode init_result = CURLE_OK;
  std::call_once(once, []() { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (init_result != CURLE_OK) {
    error = std::string("curl_global_init failed: ") + curl_easy_strerror(init_result);
    return false;
  }
  return true;
}

size_t AppendBody(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

int AbortWhenCancelled(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                       curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  const auto* cancel = static_cast<const core::CancellationToken*>(clientp);
  return cancel->IsCancelled() ? 1 : 0;
}

} // namespace

std::string EncodeQueryValue(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(value.size());
  for (const char c : value) {
    const auto byte = static_cast<unsigned char>(c);
    const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    if (unreserved) {
      encoded.push_back(c);
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[byte >> 4U]);
      encoded.push_back(kHex[byte & 0x0FU]);
    }
  }
  return encoded;
}

HttpClient::HttpClient(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

bool HttpClient::Get(std::string_view path, const core::CancellationToken& cancel,
                     HttpResponse& response, std::string& error) const {
  return Perform(path, nullptr, cancel, response, error);
}

bool HttpClient::PostJson(std::string_view path, std::string_view body,
                          const core::CancellationToken& cancel, HttpResponse& response,
                          std::string& error) const {
  const std::string owned(body);
  return Perform(path, &owned, cancel, response, error);
}

bool HttpClient::Perform(std::string_view path, const std::string* post_body,
                         const core::CancellationToken& cancel, HttpResponse& response,
                         std::string& error) const {
  response = HttpResponse{};
  if (!EnsureCurlGlobal(error)) {
    return false;
  }

  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    error = "could not initialize curl";
    return false;
  }

  const std::string url = base_url_ + std::string(path);
  struct curl_slist* headers = nullptr;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, AbortWhenCancelled);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);
  if (post_body != nullptr) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }

  const CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res == CURLE_ABORTED_BY_CALLBACK) {
    error = "request to " + url + " cancelled";
    return false;
  }
  if (res != CURLE_OK) {
    error = "request to " + url + " failed: " + curl_easy_strerror(res);
    return false;
  }
  return true;
}

} // namespace comfytest::collaborators
