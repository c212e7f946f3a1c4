#pragma once
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

// HTTP/1.1 for the discovery registry. Messages, parsing and serialization
// come from Beast; the sockets stay on the node's asio io_context, so bytes
// are fed to the Beast parser by hand. One request per connection.

namespace http = boost::beast::http;

inline constexpr std::uint32_t kMaxHttpHeadSize = 16 * 1024;
inline constexpr std::uint64_t kMaxHttpBodySize = 1024 * 1024;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

inline std::string to_std_string(boost::beast::string_view view) {
  return std::string(view.data(), view.size());
}

HttpRequest make_http_request(http::verb method,
                              const std::string& target,
                              const std::string& host,
                              std::string body = "");
HttpResponse json_response(http::status status, const nlohmann::json& body);

// Wire form of a message, Content-Length and "Connection: close" included.
std::string to_wire(HttpRequest message);
std::string to_wire(HttpResponse message);

enum class HttpReadStatus { NeedMore, Done, Failed };

// Accumulates socket reads into a Beast parser until one message is complete.
template<bool isRequest>
class HttpReader {
public:
  using Parser = http::parser<isRequest, http::string_body>;

  HttpReader() {
    parser_.header_limit(kMaxHttpHeadSize);
    parser_.body_limit(kMaxHttpBodySize);
    parser_.eager(true);
  }

  HttpReadStatus feed(const char* data, std::size_t size) {
    pending_.append(data, size);
    while(!parser_.is_done()) {
      if(pending_.empty()) return HttpReadStatus::NeedMore;
      boost::beast::error_code ec;
      auto used = parser_.put(boost::asio::const_buffer(pending_.data(), pending_.size()), ec);
      pending_.erase(0, used);
      if(ec == http::error::need_more) return HttpReadStatus::NeedMore;
      if(ec) {
        error_ = ec;
        return HttpReadStatus::Failed;
      }
    }
    return HttpReadStatus::Done;
  }

  // The peer closed the stream; completes a body delimited by end of file.
  HttpReadStatus finish() {
    if(parser_.is_done()) return HttpReadStatus::Done;
    boost::beast::error_code ec;
    parser_.put_eof(ec);
    if(ec || !parser_.is_done()) {
      error_ = ec ? ec : boost::beast::error_code(http::error::partial_message);
      return HttpReadStatus::Failed;
    }
    return HttpReadStatus::Done;
  }

  std::string error() const { return error_.message(); }
  bool too_large() const {
    return error_ == http::error::header_limit || error_ == http::error::body_limit;
  }
  typename Parser::value_type& message() { return parser_.get(); }

private:
  Parser parser_;
  std::string pending_;
  boost::beast::error_code error_;
};

using HttpRequestReader = HttpReader<true>;
using HttpResponseReader = HttpReader<false>;

// "http://host:port/base" -> parts. Only plain http is supported.
struct HttpUrl {
  std::string host;
  std::string port = "80";
  std::string base_path; // without trailing slash
};

bool parse_http_url(const std::string& url, HttpUrl& out, std::string& error);
