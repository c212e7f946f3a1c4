#pragma once
#include <asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "log.hpp"
#include "peer_channel.hpp"

// Peer ids minted by TcpSignaling look like "<token>@<host>:<port>".
bool parse_peer_address(const std::string& peer_id, std::string& host, uint16_t& port);

class TcpChannel : public PeerChannel, public std::enable_shared_from_this<TcpChannel> {
public:
    TcpChannel(asio::io_context& io,
               asio::ip::tcp::socket sock,
               std::string remote_peer_id,
               std::shared_ptr<Logger> logger);
    ~TcpChannel() override;

    asio::ip::tcp::socket& socket() { return socket_; }

    // Handshake finished: report open and start the read loop.
    void start();
    // Handshake failed before the channel opened.
    void fail(const std::string& reason);

    void send(Frame frame) override;
    void close() override;
    std::size_t queued_bytes() const override { return queued_bytes_; }

private:
    struct Outgoing {
        std::array<std::uint8_t, 4> header;
        Frame body;
    };

    void do_read_header();
    void do_read_body(std::uint32_t length);
    void do_write();
    void shutdown(const std::string& reason);

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    std::shared_ptr<Logger> logger_;
    std::array<std::uint8_t, 4> read_header_{};
    std::vector<std::uint8_t> read_body_;
    std::deque<Outgoing> write_queue_;
    std::size_t queued_bytes_ = 0;
    bool writing_ = false;
};

class TcpSignaling : public Signaling, public std::enable_shared_from_this<TcpSignaling> {
public:
    struct Options {
        std::string listen_ip = "127.0.0.1";
        uint16_t listen_port = 0;
        std::string advertise_host;   // defaults to listen_ip
        std::string peer_token;       // random when empty
        std::chrono::milliseconds retry_interval{3000};
        std::chrono::milliseconds handshake_timeout{10000};
    };

    TcpSignaling(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);
    ~TcpSignaling() override;

    const std::string& local_peer_id() const override { return local_peer_id_; }
    bool ready() const override { return ready_; }

    // Throws std::system_error when the listening socket cannot be opened the
    // first time; later failures are retried every retry_interval.
    void start() override;
    void stop() override;

    std::shared_ptr<PeerChannel> dial(const std::string& remote_peer_id) override;

    uint16_t listen_port() const { return bound_port_; }

private:
    using tcp = asio::ip::tcp;

    void open_acceptor();
    void do_accept();
    void schedule_retry(const std::string& reason);
    void handle_accepted(tcp::socket sock);

    asio::io_context& io_;
    Options options_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    asio::steady_timer retry_timer_;
    std::string local_peer_id_;
    uint16_t bound_port_ = 0;
    bool ready_ = false;
    bool running_ = false;
};
