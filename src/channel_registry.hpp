#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "peer_channel.hpp"
#include "protocol.hpp"

// Owns every peer channel of the local node, at most one per remote peer id.
// All calls and callbacks happen on the io_context thread.
class ChannelRegistry : public std::enable_shared_from_this<ChannelRegistry> {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{10000};
        // per channel high-water mark for queued bytes
        std::size_t send_queue_limit = 1024 * 1024;
    };

    using MessageCallback = std::function<void(const std::string& peer_id, const Envelope& message)>;
    using PeerCallback = std::function<void(const std::string& peer_id)>;
    using ErrorCallback = std::function<void(const std::string& peer_id, const std::string& reason, bool was_open)>;

    ChannelRegistry(asio::io_context& io,
                    std::shared_ptr<Signaling> signaling,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);
    ~ChannelRegistry();

    // Idempotent: an existing Connecting or Open channel is returned as is.
    std::shared_ptr<PeerChannel> open(const std::string& peer_id);

    // Registers a channel dialled by the remote peer. Returns false when the
    // channel is refused because one already exists for that peer.
    bool adopt(std::shared_ptr<PeerChannel> channel);

    bool send_to_one(const std::string& peer_id, const Envelope& message);
    // Sends to every Open channel except excluded_peer_id; returns the fan-out.
    std::size_t send_to_all_except(const std::string& excluded_peer_id, const Envelope& message);

    void close(const std::string& peer_id);
    void close_all();

    bool congested() const;
    // Runs callback (posted) once no open channel is above the send queue limit.
    void when_drained(std::function<void()> callback);

    std::vector<std::string> open_peer_ids() const;
    bool has(const std::string& peer_id) const;
    std::optional<ChannelState> state(const std::string& peer_id) const;
    std::size_t open_count() const;
    std::size_t size() const { return entries_.size(); }

    void set_message_callback(MessageCallback cb) { on_message_ = std::move(cb); }
    void set_open_callback(PeerCallback cb) { on_open_ = std::move(cb); }
    void set_close_callback(PeerCallback cb) { on_close_ = std::move(cb); }
    void set_error_callback(ErrorCallback cb) { on_error_ = std::move(cb); }

    void set_transfer_debug(bool enabled) { transfer_debug_ = enabled; }
    const Options& options() const { return options_; }

private:
    struct Entry {
        std::shared_ptr<PeerChannel> channel;
        std::unique_ptr<asio::steady_timer> connect_timer;
        bool outgoing = false;
        bool opened = false;
    };

    void attach(const std::shared_ptr<PeerChannel>& channel);
    void arm_connect_timer(Entry& entry);
    bool is_current(const std::shared_ptr<PeerChannel>& channel) const;

    void handle_open(const std::shared_ptr<PeerChannel>& channel);
    void handle_frame(const std::shared_ptr<PeerChannel>& channel, const std::vector<std::uint8_t>& bytes);
    void handle_closed(const std::shared_ptr<PeerChannel>& channel, const std::string& reason);
    void handle_connect_timeout(const std::shared_ptr<PeerChannel>& channel);
    void release_drain_waiters();

    asio::io_context& io_;
    std::shared_ptr<Signaling> signaling_;
    Options options_;
    std::shared_ptr<Logger> logger_;
    std::map<std::string, Entry> entries_;
    std::vector<std::function<void()>> drain_waiters_;
    bool transfer_debug_ = false;

    MessageCallback on_message_;
    PeerCallback on_open_;
    PeerCallback on_close_;
    ErrorCallback on_error_;
};
