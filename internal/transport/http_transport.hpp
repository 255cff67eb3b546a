#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace crumbtrail::transport {

struct HttpRequest {
  std::string                                      url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
  std::chrono::milliseconds                        timeout{10'000};
};

struct HttpResponse {
  long        status_code = 0; // 0 when no response arrived
  std::string error;           // transport-level failure description

  bool IsSuccess() const {
    return status_code >= 200 && status_code < 300;
  }
};

/*
  Synchronous HTTP seam.

  Implementations report network failures in HttpResponse::error instead of
  throwing, and must honour HttpRequest::timeout.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Post(const HttpRequest& request) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace crumbtrail::transport
