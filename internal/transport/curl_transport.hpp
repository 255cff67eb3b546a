#pragma once

#include <string>

#include "internal/transport/http_transport.hpp"

namespace crumbtrail::transport {

/*
  libcurl-backed transport. One easy handle per request; TLS peer and host
  verification stay on. CRUMBTRAIL_CA_BUNDLE points curl at a custom CA file.
*/
class CurlTransport final : public HttpTransport {
 public:
  CurlTransport();

  HttpResponse Post(const HttpRequest& request) override;
};

} // namespace crumbtrail::transport
