#include "tcp_signaling.hpp"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

using json = nlohmann::json;
using asio::ip::tcp;

namespace {

constexpr std::uint32_t kMaxHandshakeFrame = 4096;

std::array<std::uint8_t, 4> encode_length(std::uint32_t n) {
    return {static_cast<std::uint8_t>(n >> 24),
            static_cast<std::uint8_t>(n >> 16),
            static_cast<std::uint8_t>(n >> 8),
            static_cast<std::uint8_t>(n)};
}

std::uint32_t decode_length(const std::array<std::uint8_t, 4>& h) {
    return (std::uint32_t(h[0]) << 24) | (std::uint32_t(h[1]) << 16) |
           (std::uint32_t(h[2]) << 8) | std::uint32_t(h[3]);
}

// Handshake frames are small msgpack maps using the same length framing as
// envelopes. The caller's handler keeps the socket alive.
template<typename Handler>
void async_write_control(tcp::socket& sock, const json& message, Handler handler) {
    auto body = std::make_shared<std::vector<std::uint8_t>>(json::to_msgpack(message));
    auto header = std::make_shared<std::array<std::uint8_t, 4>>(
        encode_length(static_cast<std::uint32_t>(body->size())));
    std::array<asio::const_buffer, 2> buffers{asio::buffer(*header), asio::buffer(*body)};
    asio::async_write(sock, buffers,
        [header, body, handler](std::error_code ec, std::size_t) mutable {
            handler(ec);
        });
}

template<typename Handler>
void async_read_control(tcp::socket& sock, Handler handler) {
    auto header = std::make_shared<std::array<std::uint8_t, 4>>();
    asio::async_read(sock, asio::buffer(*header),
        [&sock, header, handler](std::error_code ec, std::size_t) mutable {
            if(ec) {
                handler(ec, json());
                return;
            }
            auto length = decode_length(*header);
            if(length == 0 || length > kMaxHandshakeFrame) {
                handler(std::error_code(asio::error::message_size), json());
                return;
            }
            auto body = std::make_shared<std::vector<std::uint8_t>>(length);
            asio::async_read(sock, asio::buffer(*body),
                [body, handler](std::error_code ec, std::size_t) mutable {
                    if(ec) {
                        handler(ec, json());
                        return;
                    }
                    handler(std::error_code(), json::from_msgpack(*body, true, false));
                });
        });
}

// Empty unless the control frame carries a string under key.
std::string control_string(const json& message, const char* key) {
    if(!message.is_object()) return "";
    auto it = message.find(key);
    if(it == message.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::string random_token() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << dist(rng);
    return oss.str();
}

} // namespace

bool parse_peer_address(const std::string& peer_id, std::string& host, uint16_t& port) {
    auto at = peer_id.rfind('@');
    if(at == std::string::npos) return false;
    auto colon = peer_id.rfind(':');
    if(colon == std::string::npos || colon < at) return false;
    host = peer_id.substr(at + 1, colon - at - 1);
    auto port_text = peer_id.substr(colon + 1);
    if(host.empty() || port_text.empty() || port_text.size() > 5) return false;
    for(char c : port_text) {
        if(c < '0' || c > '9') return false;
    }
    auto value = std::stoul(port_text);
    if(value == 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

// ---- TcpChannel ------------------------------------------------------------

TcpChannel::TcpChannel(asio::io_context& io,
                       tcp::socket sock,
                       std::string remote_peer_id,
                       std::shared_ptr<Logger> logger)
: PeerChannel(std::move(remote_peer_id)), io_(io), socket_(std::move(sock)), logger_(std::move(logger))
{
}

TcpChannel::~TcpChannel(){
    std::error_code ignored;
    socket_.close(ignored);
}

void TcpChannel::start(){
    notify_open();
    if(is_open()) do_read_header();
}

void TcpChannel::fail(const std::string& reason){
    shutdown(reason);
}

void TcpChannel::do_read_header(){
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(read_header_),
        [this, self](std::error_code ec, std::size_t){
            if(state() == ChannelState::Closed) return;
            if(ec){
                shutdown(ec == asio::error::eof ? std::string() : ec.message());
                return;
            }
            auto length = decode_length(read_header_);
            if(length == 0 || length > kMaxFrameSize){
                log_warn(logger_.get(), "Frame of {} bytes from {} rejected", length, remote_peer_id());
                shutdown("oversized frame");
                return;
            }
            do_read_body(length);
        });
}

void TcpChannel::do_read_body(std::uint32_t length){
    read_body_.resize(length);
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(read_body_),
        [this, self](std::error_code ec, std::size_t){
            if(state() == ChannelState::Closed) return;
            if(ec){
                shutdown(ec == asio::error::eof ? std::string() : ec.message());
                return;
            }
            auto frame = std::move(read_body_);
            read_body_ = {};
            notify_frame(std::move(frame));
            if(is_open()) do_read_header();
        });
}

void TcpChannel::send(Frame frame){
    if(!is_open() || !frame) return;
    queued_bytes_ += frame->size();
    write_queue_.push_back(Outgoing{encode_length(static_cast<std::uint32_t>(frame->size())), std::move(frame)});
    if(!writing_){
        do_write();
    }
}

void TcpChannel::do_write(){
    if(write_queue_.empty()) return;
    writing_ = true;
    auto& front = write_queue_.front();
    std::array<asio::const_buffer, 2> buffers{asio::buffer(front.header), asio::buffer(*front.body)};
    auto self = shared_from_this();
    asio::async_write(socket_, buffers,
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                writing_ = false;
                if(state() != ChannelState::Closed){
                    log_info(logger_.get(), "Write to {} failed: {}", remote_peer_id(), ec.message());
                    shutdown(ec.message());
                } else {
                    std::error_code ignored;
                    socket_.close(ignored);
                }
                return;
            }
            queued_bytes_ -= write_queue_.front().body->size();
            write_queue_.pop_front();
            if(!write_queue_.empty()){
                do_write();
                return;
            }
            writing_ = false;
            if(state() == ChannelState::Closed){
                // local close waited for the queue to flush
                std::error_code ignored;
                socket_.shutdown(tcp::socket::shutdown_both, ignored);
                socket_.close(ignored);
            } else {
                notify_drained();
            }
        });
}

void TcpChannel::close(){
    if(state() == ChannelState::Closed) return;
    const bool flush = is_open() && writing_;
    mark_closed();
    clear_handlers();
    if(flush) return;
    write_queue_.clear();
    queued_bytes_ = 0;
    std::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

void TcpChannel::shutdown(const std::string& reason){
    std::error_code ignored;
    socket_.close(ignored);
    write_queue_.clear();
    queued_bytes_ = 0;
    notify_closed(reason);
}

// ---- TcpSignaling ----------------------------------------------------------

TcpSignaling::TcpSignaling(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
: io_(io), options_(std::move(options)), logger_(std::move(logger)), retry_timer_(io)
{
    if(options_.peer_token.empty()) options_.peer_token = random_token();
    if(options_.advertise_host.empty()) options_.advertise_host = options_.listen_ip;
}

TcpSignaling::~TcpSignaling(){
    std::error_code ignored;
    retry_timer_.cancel(ignored);
    if(acceptor_) acceptor_->close(ignored);
}

void TcpSignaling::open_acceptor(){
    auto address = asio::ip::make_address(options_.listen_ip);
    auto acceptor = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(address, bound_port_ != 0 ? bound_port_ : options_.listen_port);
    acceptor->open(endpoint.protocol());
    acceptor->set_option(tcp::acceptor::reuse_address(true));
    acceptor->bind(endpoint);
    acceptor->listen();
    bound_port_ = acceptor->local_endpoint().port();
    acceptor_ = std::move(acceptor);
}

void TcpSignaling::start(){
    if(running_) return;
    running_ = true;
    open_acceptor();
    local_peer_id_ = options_.peer_token + "@" + options_.advertise_host + ":" + std::to_string(bound_port_);
    ready_ = true;
    log_info(logger_.get(), "Accepting peer channels on {}:{} as {}", options_.listen_ip, bound_port_, local_peer_id_);
    notify_session(true, "");
    do_accept();
}

void TcpSignaling::stop(){
    running_ = false;
    ready_ = false;
    std::error_code ignored;
    retry_timer_.cancel(ignored);
    if(acceptor_){
        acceptor_->close(ignored);
        acceptor_.reset();
    }
}

void TcpSignaling::do_accept(){
    if(!acceptor_) return;
    auto self = shared_from_this();
    acceptor_->async_accept(
        [self](std::error_code ec, tcp::socket sock){
            if(!self->running_ || ec == asio::error::operation_aborted) return;
            if(ec){
                self->schedule_retry(ec.message());
                return;
            }
            self->handle_accepted(std::move(sock));
            self->do_accept();
        });
}

void TcpSignaling::schedule_retry(const std::string& reason){
    ready_ = false;
    std::error_code ignored;
    if(acceptor_){
        acceptor_->close(ignored);
        acceptor_.reset();
    }
    log_warn(logger_.get(), "Signaling session lost: {}", reason);
    notify_session(false, reason);

    retry_timer_.expires_after(options_.retry_interval);
    auto self = shared_from_this();
    retry_timer_.async_wait([self](const std::error_code& ec){
        if(ec || !self->running_) return;
        try {
            self->open_acceptor();
        } catch(const std::system_error& e) {
            self->schedule_retry(e.what());
            return;
        }
        self->ready_ = true;
        log_info(self->logger_.get(), "Signaling session restored on port {}", self->bound_port_);
        self->notify_session(true, "");
        self->do_accept();
    });
}

void TcpSignaling::handle_accepted(tcp::socket sock){
    auto pending = std::make_shared<tcp::socket>(std::move(sock));
    auto timer = std::make_shared<asio::steady_timer>(io_, options_.handshake_timeout);
    timer->async_wait([pending](const std::error_code& ec){
        if(ec) return;
        std::error_code ignored;
        pending->close(ignored);
    });

    auto self = shared_from_this();
    async_read_control(*pending, [self, pending, timer](std::error_code ec, const json& hello){
        std::error_code ignored;
        timer->cancel(ignored);
        if(ec){
            log_debug(self->logger_.get(), "Handshake read failed: {}", ec.message());
            return;
        }
        std::string remote = control_string(hello, "type") == "hello"
            ? control_string(hello, "peerId")
            : std::string();
        if(remote.empty()){
            log_warn(self->logger_.get(), "Dropping connection without a valid hello");
            pending->close(ignored);
            return;
        }

        auto channel = std::make_shared<TcpChannel>(self->io_, std::move(*pending), remote, self->logger_);
        if(!self->offer_incoming(channel)){
            log_info(self->logger_.get(), "Rejected channel from {}", remote);
            channel->close();
            return;
        }
        async_write_control(channel->socket(), json{{"type", "welcome"}},
            [channel](std::error_code ec){
                if(channel->state() == ChannelState::Closed) return;
                if(ec){
                    channel->fail("handshake failed: " + ec.message());
                    return;
                }
                channel->start();
            });
    });
}

std::shared_ptr<PeerChannel> TcpSignaling::dial(const std::string& remote_peer_id){
    auto channel = std::make_shared<TcpChannel>(io_, tcp::socket(io_), remote_peer_id, logger_);
    std::string host;
    uint16_t port = 0;
    if(!parse_peer_address(remote_peer_id, host, port)){
        asio::post(io_, [channel](){ channel->fail("peer id carries no address"); });
        return channel;
    }

    auto self = shared_from_this();
    auto resolver = std::make_shared<tcp::resolver>(io_);
    resolver->async_resolve(host, std::to_string(port),
        [self, resolver, channel](std::error_code ec, tcp::resolver::results_type results){
            if(channel->state() == ChannelState::Closed) return;
            if(ec){
                channel->fail("resolve failed: " + ec.message());
                return;
            }
            asio::async_connect(channel->socket(), results,
                [self, channel](std::error_code ec, const tcp::endpoint&){
                    if(channel->state() == ChannelState::Closed) return;
                    if(ec){
                        channel->fail("connect failed: " + ec.message());
                        return;
                    }
                    json hello{{"type", "hello"}, {"peerId", self->local_peer_id_}};
                    async_write_control(channel->socket(), hello, [channel](std::error_code ec){
                        if(channel->state() == ChannelState::Closed) return;
                        if(ec){
                            channel->fail("handshake failed: " + ec.message());
                            return;
                        }
                        async_read_control(channel->socket(), [channel](std::error_code ec, const json& reply){
                            if(channel->state() == ChannelState::Closed) return;
                            if(ec){
                                channel->fail(ec == asio::error::eof ? "rejected by peer"
                                                                     : "handshake failed: " + ec.message());
                                return;
                            }
                            if(control_string(reply, "type") != "welcome"){
                                channel->fail("unexpected handshake reply");
                                return;
                            }
                            channel->start();
                        });
                    });
                });
        });
    return channel;
}
