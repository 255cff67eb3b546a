#include "curl_transport.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <mutex>

#include "internal/util/errors.hpp"

namespace crumbtrail::transport {

namespace {

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw crumbtrail::util::TransportError("curl_global_init failed");
    }
  });
}

size_t DiscardBody(char*, size_t size, size_t nmemb, void*) {
  return size * nmemb;
}

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

struct EasyDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

} // namespace

CurlTransport::CurlTransport() {
  EnsureCurlInitialized();
}

HttpResponse CurlTransport::Post(const HttpRequest& request) {
  HttpResponse response;

  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    response.error = "curl_easy_init failed";
    return response;
  }

  curl_slist* raw_headers = nullptr;
  for (const auto& [name, value] : request.headers) {
    raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &DiscardBody);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  if (const char* ca_bundle = std::getenv("CRUMBTRAIL_CA_BUNDLE"); ca_bundle && ca_bundle[0] != '\0') {
    curl_easy_setopt(curl.get(), CURLOPT_CAINFO, ca_bundle);
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    response.error = curl_easy_strerror(res);
    return response;
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

} // namespace crumbtrail::transport
