#include "registry_server.hpp"

#include <array>

#include "utils.hpp"

using json = nlohmann::json;

namespace {

std::string string_field(const json& body, const char* key) {
    if(!body.is_object()) return "";
    auto it = body.find(key);
    if(it == body.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

json error_body(const std::string& message) {
    return json{{"error", message}};
}

// "/rooms/{roomId}/peers" -> roomId; empty when the path does not match.
std::string room_from_target(const std::string& target) {
    auto path = target.substr(0, target.find('?'));
    const std::string prefix = "/rooms/";
    const std::string suffix = "/peers";
    if(path.size() <= prefix.size() + suffix.size()) return "";
    if(path.compare(0, prefix.size(), prefix) != 0) return "";
    if(path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) return "";
    auto encoded = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
    if(encoded.find('/') != std::string::npos) return "";
    return percent_decode(encoded);
}

} // namespace

// ---- RegistryHandler -------------------------------------------------------

RegistryHandler::RegistryHandler(std::shared_ptr<RegistryStore> store, std::shared_ptr<Logger> logger)
: store_(std::move(store)), logger_(std::move(logger))
{
}

HttpResponse RegistryHandler::handle(const HttpRequest& request) const {
    auto room = room_from_target(to_std_string(request.target()));
    if(room.empty()){
        return json_response(http::status::not_found, error_body("not found"));
    }

    if(request.method() == http::verb::get){
        auto peers = store_->get(room);
        log_debug(logger_.get(), "GET {} -> {} peer(s)", room, peers.size());
        return json_response(http::status::ok, json{{"peers", registry_entries_to_json(peers)}});
    }

    if(request.method() != http::verb::post && request.method() != http::verb::delete_){
        auto response = json_response(http::status::method_not_allowed, error_body("method not allowed"));
        response.set(http::field::allow, "GET, POST, DELETE");
        return response;
    }

    auto body = json::parse(request.body(), nullptr, false);
    if(body.is_discarded()){
        return json_response(http::status::bad_request, error_body("invalid json"));
    }

    auto peer_id = string_field(body, "peerId");
    if(request.method() == http::verb::post){
        auto name = string_field(body, "name");
        if(peer_id.empty() || name.empty()){
            return json_response(http::status::bad_request, error_body("peerId and name are required"));
        }
        auto peers = store_->put(room, peer_id, name);
        log_info(logger_.get(), "Registered {} ({}) in room {}", peer_id, name, room);
        return json_response(http::status::ok, json{{"peers", registry_entries_to_json(peers)}});
    }

    if(peer_id.empty()){
        return json_response(http::status::bad_request, error_body("peerId is required"));
    }
    auto peers = store_->remove(room, peer_id);
    log_info(logger_.get(), "Removed {} from room {}", peer_id, room);
    return json_response(http::status::ok, json{{"peers", registry_entries_to_json(peers)}});
}

// ---- RegistryServer::Session -----------------------------------------------

class RegistryServer::Session : public std::enable_shared_from_this<RegistryServer::Session> {
public:
    Session(tcp::socket sock, std::shared_ptr<RegistryServer> server)
    : socket_(std::move(sock)), server_(std::move(server))
    {
    }

    void start(){
        do_read();
    }

private:
    void do_read(){
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(chunk_),
            [self](std::error_code ec, std::size_t n){
                if(ec){
                    log_debug(self->server_->logger_.get(), "Request read failed: {}", ec.message());
                    return;
                }
                self->on_read(n);
            });
    }

    void on_read(std::size_t n){
        switch(reader_.feed(chunk_.data(), n)){
            case HttpReadStatus::NeedMore:
                do_read();
                return;
            case HttpReadStatus::Failed:
                if(reader_.too_large()){
                    respond(json_response(http::status::payload_too_large, error_body("request too large")));
                } else {
                    respond(json_response(http::status::bad_request, error_body(reader_.error())));
                }
                return;
            case HttpReadStatus::Done:
                dispatch();
                return;
        }
    }

    void dispatch(){
        const auto& request = reader_.message();
        auto response = server_->handler_.handle(request);
        ++server_->requests_served_;
        log_debug(server_->logger_.get(), "{} {} -> {}",
                  to_std_string(request.method_string()), to_std_string(request.target()), response.result_int());
        respond(std::move(response));
    }

    void respond(HttpResponse response){
        out_ = to_wire(std::move(response));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(out_),
            [self](std::error_code ec, std::size_t){
                std::error_code ignored;
                if(!ec) self->socket_.shutdown(tcp::socket::shutdown_both, ignored);
                self->socket_.close(ignored);
            });
    }

    tcp::socket socket_;
    std::shared_ptr<RegistryServer> server_;
    std::array<char, 4096> chunk_{};
    HttpRequestReader reader_;
    std::string out_;
};

// ---- RegistryServer --------------------------------------------------------

RegistryServer::RegistryServer(asio::io_context& io,
                               std::shared_ptr<InMemoryRegistryStore> store,
                               Options options,
                               std::shared_ptr<Logger> logger)
: io_(io),
  store_(store),
  handler_(store, logger),
  options_(std::move(options)),
  logger_(std::move(logger)),
  acceptor_(io),
  sweep_timer_(io)
{
}

void RegistryServer::start(){
    tcp::endpoint endpoint(asio::ip::make_address(options_.listen_ip), options_.listen_port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    bound_port_ = acceptor_.local_endpoint().port();
    running_ = true;
    log_info(logger_.get(), "Room registry listening on {}:{}", options_.listen_ip, bound_port_);
    do_accept();
    schedule_sweep();
}

void RegistryServer::stop(){
    running_ = false;
    std::error_code ignored;
    acceptor_.close(ignored);
    sweep_timer_.cancel(ignored);
}

void RegistryServer::do_accept(){
    auto self = shared_from_this();
    acceptor_.async_accept([self](std::error_code ec, tcp::socket sock){
        if(!self->running_) return;
        if(ec){
            log_error(self->logger_.get(), "accept failed: {}", ec.message());
        } else {
            std::make_shared<Session>(std::move(sock), self)->start();
        }
        self->do_accept();
    });
}

void RegistryServer::schedule_sweep(){
    if(options_.sweep_interval.count() <= 0) return;
    sweep_timer_.expires_after(options_.sweep_interval);
    auto self = shared_from_this();
    sweep_timer_.async_wait([self](const std::error_code& ec){
        if(ec || !self->running_) return;
        auto pruned = self->store_->sweep_all();
        if(pruned > 0){
            log_info(self->logger_.get(), "Pruned {} stale registry entr{}", pruned, pruned == 1 ? "y" : "ies");
        }
        self->schedule_sweep();
    });
}
