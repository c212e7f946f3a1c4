#pragma once
#include <asio.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "http_codec.hpp"
#include "log.hpp"
#include "registry_store.hpp"

// Maps /rooms/{roomId}/peers requests onto a RegistryStore.
class RegistryHandler {
public:
    RegistryHandler(std::shared_ptr<RegistryStore> store, std::shared_ptr<Logger> logger = nullptr);

    HttpResponse handle(const HttpRequest& request) const;

private:
    std::shared_ptr<RegistryStore> store_;
    std::shared_ptr<Logger> logger_;
};

class RegistryServer : public std::enable_shared_from_this<RegistryServer> {
public:
    struct Options {
        std::string listen_ip = "0.0.0.0";
        uint16_t listen_port = 8080;
        // zero disables the periodic sweep of every room
        std::chrono::seconds sweep_interval{300};
    };

    RegistryServer(asio::io_context& io,
                   std::shared_ptr<InMemoryRegistryStore> store,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr);

    // Throws std::system_error when the port cannot be bound.
    void start();
    void stop();

    uint16_t listen_port() const { return bound_port_; }
    std::size_t requests_served() const { return requests_served_; }

private:
    using tcp = asio::ip::tcp;
    class Session;

    void do_accept();
    void schedule_sweep();

    asio::io_context& io_;
    std::shared_ptr<InMemoryRegistryStore> store_;
    RegistryHandler handler_;
    Options options_;
    std::shared_ptr<Logger> logger_;
    tcp::acceptor acceptor_;
    asio::steady_timer sweep_timer_;
    uint16_t bound_port_ = 0;
    std::size_t requests_served_ = 0;
    bool running_ = false;
};
