#include "discovery_client.hpp"

#include <array>
#include <stdexcept>

#include "utils.hpp"

using json = nlohmann::json;
using asio::ip::tcp;

struct DiscoveryClient::Exchange {
    explicit Exchange(asio::io_context& io) : resolver(io), socket(io), timer(io) {}

    tcp::resolver resolver;
    tcp::socket socket;
    asio::steady_timer timer;
    std::string out;
    HttpResponseReader reader;
    std::array<char, 4096> chunk{};
    std::string description;
    std::shared_ptr<Logger> logger;
    Callback cb;
    bool done = false;
};

DiscoveryResult discovery_result_from_response(const HttpResponse& response){
    DiscoveryResult result;
    result.status = static_cast<int>(response.result_int());
    auto body = json::parse(response.body(), nullptr, false);

    if(result.status < 200 || result.status >= 300){
        result.error = "HTTP " + std::to_string(result.status);
        if(body.is_object() && body.contains("error") && body["error"].is_string()){
            result.error += ": " + body["error"].get<std::string>();
        }
        return result;
    }
    if(!body.is_object() || !body.contains("peers") || !body["peers"].is_array()){
        result.error = "malformed registry response";
        return result;
    }
    for(const auto& item : body["peers"]){
        if(!item.is_object()) continue;
        auto peer_id = item.find("peerId");
        if(peer_id == item.end() || !peer_id->is_string() || peer_id->get_ref<const std::string&>().empty()) continue;
        auto name = item.find("name");
        result.peers.push_back(RoomUser{peer_id->get<std::string>(),
                                        name != item.end() && name->is_string() ? name->get<std::string>() : ""});
    }
    result.ok = true;
    return result;
}

DiscoveryClient::DiscoveryClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
: io_(io), options_(std::move(options)), logger_(std::move(logger))
{
    std::string error;
    if(!parse_http_url(options_.base_url, url_, error)){
        throw std::invalid_argument("discovery_url '" + options_.base_url + "': " + error);
    }
}

void DiscoveryClient::fetch_peers(const std::string& room, Callback cb){
    request(http::verb::get, room, "", std::move(cb));
}

void DiscoveryClient::register_self(const std::string& room, const RoomUser& self, Callback cb){
    json body{{"peerId", self.peer_id}, {"name", self.name}};
    request(http::verb::post, room, body.dump(), std::move(cb));
}

void DiscoveryClient::remove_self(const std::string& room, const std::string& peer_id, Callback cb){
    json body{{"peerId", peer_id}};
    request(http::verb::delete_, room, body.dump(), std::move(cb));
}

void DiscoveryClient::complete(const std::shared_ptr<Exchange>& exchange, DiscoveryResult result){
    if(exchange->done) return;
    exchange->done = true;
    std::error_code ignored;
    exchange->timer.cancel(ignored);
    exchange->resolver.cancel();
    exchange->socket.close(ignored);
    if(!result.ok){
        log_warn(exchange->logger.get(), "Registry {} failed: {}", exchange->description, result.error);
    } else {
        log_debug(exchange->logger.get(), "Registry {} -> {} peer(s)", exchange->description, result.peers.size());
    }
    if(exchange->cb) exchange->cb(result);
}

void DiscoveryClient::request(http::verb method, const std::string& room, std::string body, Callback cb){
    auto exchange = std::make_shared<Exchange>(io_);
    exchange->cb = std::move(cb);
    exchange->logger = logger_;
    exchange->description = to_std_string(http::to_string(method)) + " " + room;

    auto target = url_.base_path + "/rooms/" + percent_encode(room) + "/peers";
    exchange->out = to_wire(make_http_request(method, target, url_.host + ":" + url_.port, std::move(body)));

    exchange->timer.expires_after(options_.timeout);
    exchange->timer.async_wait([exchange](const std::error_code& ec){
        if(ec) return;
        DiscoveryResult result;
        result.error = "request timed out";
        complete(exchange, std::move(result));
    });

    exchange->resolver.async_resolve(url_.host, url_.port,
        [exchange](std::error_code ec, tcp::resolver::results_type results){
            if(exchange->done) return;
            if(ec){
                DiscoveryResult result;
                result.error = "resolve failed: " + ec.message();
                complete(exchange, std::move(result));
                return;
            }
            asio::async_connect(exchange->socket, results,
                [exchange](std::error_code ec, const tcp::endpoint&){
                    if(exchange->done) return;
                    if(ec){
                        DiscoveryResult result;
                        result.error = "connect failed: " + ec.message();
                        complete(exchange, std::move(result));
                        return;
                    }
                    asio::async_write(exchange->socket, asio::buffer(exchange->out),
                        [exchange](std::error_code ec, std::size_t){
                            if(exchange->done) return;
                            if(ec){
                                DiscoveryResult result;
                                result.error = "write failed: " + ec.message();
                                complete(exchange, std::move(result));
                                return;
                            }
                            read_response(exchange);
                        });
                });
        });
}

void DiscoveryClient::read_response(const std::shared_ptr<Exchange>& exchange){
    exchange->socket.async_read_some(asio::buffer(exchange->chunk),
        [exchange](std::error_code ec, std::size_t n){
            if(exchange->done) return;
            if(ec && ec != asio::error::eof){
                DiscoveryResult result;
                result.error = "read failed: " + ec.message();
                complete(exchange, std::move(result));
                return;
            }

            auto status = ec ? exchange->reader.finish() : exchange->reader.feed(exchange->chunk.data(), n);
            if(status == HttpReadStatus::NeedMore){
                read_response(exchange);
                return;
            }
            if(status == HttpReadStatus::Failed){
                DiscoveryResult result;
                result.error = "bad response: " + exchange->reader.error();
                complete(exchange, std::move(result));
                return;
            }
            complete(exchange, discovery_result_from_response(exchange->reader.message()));
        });
}
