#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace enginebridge {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{60000};
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace enginebridge
