#include "api_client.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "config/config.pb.h"
#include "internal/codec/json_codec.hpp"
#include "internal/observability/logging.hpp"

namespace crumbtrail::transport {

namespace {

std::string TrimTrailingSlashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

ApiClient::ApiClient(HttpTransportPtr transport, std::string base_url, std::string api_key, std::chrono::milliseconds timeout)
    : transport_(std::move(transport)), base_url_(TrimTrailingSlashes(std::move(base_url))), api_key_(std::move(api_key)), timeout_(timeout) {
  if (!transport_) {
    throw std::invalid_argument("ApiClient: transport is null");
  }
}

ApiClient::ApiClient(HttpTransportPtr transport, const crumbtrail::runtime::config::CollectorConfig& config)
    : ApiClient(std::move(transport), config.base_url(), config.api_key(), std::chrono::milliseconds(config.timeout_ms())) {
}

std::string ApiClient::EndpointUrl(const std::string& path) const {
  return base_url_ + path;
}

bool ApiClient::SendEvents(const crumbtrail::v1::SubmitEventsRequest& request) {
  return Submit(kEventsSubmitPath, request);
}

bool ApiClient::SendCrashes(const crumbtrail::v1::SubmitCrashesRequest& request) {
  return Submit(kCrashesSubmitPath, request);
}

bool ApiClient::Submit(const std::string& path, const google::protobuf::Message& body) {
  HttpRequest request;
  request.url     = EndpointUrl(path);
  request.timeout = timeout_;
  request.headers = {
      {"X-API-Key", api_key_},
      {"Content-Type", "application/json"},
  };

  try {
    request.body = crumbtrail::codec::ToWireJson(body);
  } catch (const std::exception& e) {
    CRUMBTRAIL_LOG_ERROR("request encode failed", {observability::StringField("url", request.url), observability::StringField("error", e.what())});
    return false;
  }

  HttpResponse response = transport_->Post(request);
  if (!response.error.empty()) {
    CRUMBTRAIL_LOG_WARN("submit failed", {observability::StringField("url", request.url), observability::StringField("error", response.error)});
    return false;
  }
  if (!response.IsSuccess()) {
    CRUMBTRAIL_LOG_WARN("submit rejected", {observability::StringField("url", request.url), observability::IntField("status", response.status_code)});
    return false;
  }

  CRUMBTRAIL_LOG_DEBUG("submit ok", {observability::StringField("url", request.url), observability::IntField("bytes", static_cast<int64_t>(request.body.size()))});
  return true;
}

} // namespace crumbtrail::transport
