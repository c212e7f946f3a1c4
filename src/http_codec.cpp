#include "http_codec.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

template<class Message>
std::string serialize(Message& message) {
  message.keep_alive(false);
  message.prepare_payload();
  std::ostringstream out;
  out << message;
  return out.str();
}

} // namespace

HttpRequest make_http_request(http::verb method,
                              const std::string& target,
                              const std::string& host,
                              std::string body) {
  HttpRequest request{method, target, 11};
  request.set(http::field::host, host);
  request.set(http::field::user_agent, "roomdrop");
  if(!body.empty()) request.set(http::field::content_type, "application/json");
  request.body() = std::move(body);
  return request;
}

HttpResponse json_response(http::status status, const nlohmann::json& body) {
  HttpResponse response{status, 11};
  response.set(http::field::content_type, "application/json");
  response.body() = body.dump();
  return response;
}

std::string to_wire(HttpRequest message) {
  return serialize(message);
}

std::string to_wire(HttpResponse message) {
  return serialize(message);
}

bool parse_http_url(const std::string& url, HttpUrl& out, std::string& error) {
  const std::string scheme = "http://";
  std::string prefix = url.substr(0, scheme.size());
  std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if(prefix != scheme) {
    error = "only http:// urls are supported";
    return false;
  }
  auto rest = url.substr(scheme.size());
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  out.base_path = slash == std::string::npos ? "" : rest.substr(slash);
  while(!out.base_path.empty() && out.base_path.back() == '/') out.base_path.pop_back();

  auto colon = authority.rfind(':');
  if(colon != std::string::npos) {
    out.host = authority.substr(0, colon);
    out.port = authority.substr(colon + 1);
  } else {
    out.host = authority;
    out.port = "80";
  }
  if(out.host.empty() || out.port.empty() ||
     !std::all_of(out.port.begin(), out.port.end(), [](unsigned char c){ return std::isdigit(c); })) {
    error = "malformed url";
    return false;
  }
  return true;
}
