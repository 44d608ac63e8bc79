#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace comfytest::collaborators {

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Blocking HTTP/1.1 client for the host server's REST API (libcurl easy
// interface). One transfer per call; safe to use from several threads since
// every call owns its own easy handle.
//
// Contract:
// - Returns false on transport failure (connect refused, timeout, cancel).
//   Any HTTP status is a successful transfer; callers check `status`.
// - A cancelled token aborts an in-flight transfer within one progress tick.
// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string EncodeQueryValue(std::string_view value);

class HttpClient {
public:
  explicit HttpClient(std::string base_url,
                      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  const std::string& BaseUrl() const {
    return base_url_;
  }

  bool Get(std::string_view path, const core::CancellationToken& cancel, HttpResponse& response,
           std::string& error) const;
  bool PostJson(std::string_view path, std::string_view body,
                const core::CancellationToken& cancel, HttpResponse& response,
                std::string& error) const;

private:
  bool Perform(std::string_view path, const std::string* post_body,
               const core::CancellationToken& cancel, HttpResponse& response,
               std::string& error) const;

  std::string base_url_;
  std::chrono::milliseconds timeout_;
};

} // namespace comfytest::collaborators
