#pragma once

#include <chrono>
#include <string>

#include "crumbtrail/v1/telemetry.pb.h"
#include "internal/transport/http_transport.hpp"

namespace crumbtrail::runtime::config {
class CollectorConfig;
}

namespace crumbtrail::transport {

inline constexpr const char* kEventsSubmitPath  = "/api/v1/events/submit";
inline constexpr const char* kCrashesSubmitPath = "/api/v1/crashes/submit";

/*
  Collector endpoints.

  Each call is one JSON POST with X-API-Key and Content-Type headers.
  Returns true only for a 2xx response; network errors, timeouts and
  non-2xx statuses are logged and reported as false, never thrown.
*/
class ApiClient {
 public:
  ApiClient(HttpTransportPtr transport, std::string base_url, std::string api_key,
            std::chrono::milliseconds timeout = std::chrono::milliseconds(10'000));
  ApiClient(HttpTransportPtr transport, const crumbtrail::runtime::config::CollectorConfig& config);

  bool SendEvents(const crumbtrail::v1::SubmitEventsRequest& request);
  bool SendCrashes(const crumbtrail::v1::SubmitCrashesRequest& request);

  // base_url without trailing '/' followed by `path`.
  std::string EndpointUrl(const std::string& path) const;

 private:
  bool Submit(const std::string& path, const google::protobuf::Message& body);

  HttpTransportPtr          transport_;
  std::string               base_url_;
  std::string               api_key_;
  std::chrono::milliseconds timeout_;
};

} // namespace crumbtrail::transport
