#pragma once
#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "http_codec.hpp"
#include "log.hpp"
#include "protocol.hpp"

struct DiscoveryResult {
    bool ok = false;
    int status = 0;          // HTTP status, 0 for transport failures
    std::string error;
    std::vector<RoomUser> peers;
};

// Room registry as seen by the membership engine.
class DiscoveryService {
public:
    using Callback = std::function<void(const DiscoveryResult&)>;

    virtual ~DiscoveryService() = default;

    virtual void fetch_peers(const std::string& room, Callback cb) = 0;
    virtual void register_self(const std::string& room, const RoomUser& self, Callback cb) = 0;
    virtual void remove_self(const std::string& room, const std::string& peer_id, Callback cb) = 0;
};

// Parses a registry reply body ({"peers":[{peerId,name},...]}) into a result.
DiscoveryResult discovery_result_from_response(const HttpResponse& response);

// HTTP client for the room registry, running on the node's io_context.
class DiscoveryClient : public DiscoveryService, public std::enable_shared_from_this<DiscoveryClient> {
public:
    struct Options {
        std::string base_url = "http://127.0.0.1:8080";
        std::chrono::milliseconds timeout{5000};
    };

    // Throws std::invalid_argument for a base_url that is not plain http.
    DiscoveryClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger = nullptr);

    void fetch_peers(const std::string& room, Callback cb) override;
    void register_self(const std::string& room, const RoomUser& self, Callback cb) override;
    void remove_self(const std::string& room, const std::string& peer_id, Callback cb) override;

    const std::string& base_url() const { return options_.base_url; }

private:
    struct Exchange;

    void request(http::verb method, const std::string& room, std::string body, Callback cb);
    static void complete(const std::shared_ptr<Exchange>& exchange, DiscoveryResult result);
    static void read_response(const std::shared_ptr<Exchange>& exchange);

    asio::io_context& io_;
    Options options_;
    HttpUrl url_;
    std::shared_ptr<Logger> logger_;
};
