#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "protocol.hpp"

enum class ChannelState { Connecting, Open, Closed };

const char* channel_state_name(ChannelState state);

// A reliable, ordered, bidirectional message channel to one remote peer.
// Events are always delivered from the io_context, never from inside a call
// made on the channel.
class PeerChannel {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(std::vector<std::uint8_t>)> on_frame;
        // reason is empty for an orderly close by the remote side
        std::function<void(const std::string& reason)> on_closed;
        // fired when the send queue becomes empty
        std::function<void()> on_drained;
    };

    explicit PeerChannel(std::string remote_peer_id);
    virtual ~PeerChannel() = default;

    PeerChannel(const PeerChannel&) = delete;
    PeerChannel& operator=(const PeerChannel&) = delete;

    const std::string& remote_peer_id() const { return remote_peer_id_; }
    ChannelState state() const { return state_; }
    bool is_open() const { return state_ == ChannelState::Open; }

    void set_handlers(Handlers handlers) { handlers_ = std::move(handlers); }
    void clear_handlers() { handlers_ = Handlers{}; }

    // Queues a frame. Frames sent before the channel opens are dropped.
    virtual void send(Frame frame) = 0;
    // Closes locally without notifying our own handlers.
    virtual void close() = 0;
    virtual std::size_t queued_bytes() const = 0;

protected:
    void notify_open();
    void notify_frame(std::vector<std::uint8_t> frame);
    void notify_closed(const std::string& reason);
    void notify_drained();
    void mark_closed() { state_ = ChannelState::Closed; }

private:
    std::string remote_peer_id_;
    ChannelState state_ = ChannelState::Connecting;
    Handlers handlers_;
};

// The external negotiation layer: turns a remote peer id into a channel and
// surfaces channels dialled by remote peers.
class Signaling {
public:
    // Return false to reject the channel; it is then closed by the signaling layer.
    using IncomingHandler = std::function<bool(std::shared_ptr<PeerChannel>)>;
    using SessionHandler = std::function<void(bool ready, const std::string& reason)>;

    virtual ~Signaling() = default;

    virtual const std::string& local_peer_id() const = 0;
    virtual bool ready() const = 0;
    virtual void start() = 0;
    virtual void stop() = 0;

    // The returned channel starts in Connecting; on_open or on_closed follows.
    virtual std::shared_ptr<PeerChannel> dial(const std::string& remote_peer_id) = 0;

    void set_incoming_handler(IncomingHandler handler) { incoming_handler_ = std::move(handler); }
    void set_session_handler(SessionHandler handler) { session_handler_ = std::move(handler); }

protected:
    bool offer_incoming(const std::shared_ptr<PeerChannel>& channel) {
        return incoming_handler_ && incoming_handler_(channel);
    }
    void notify_session(bool ready, const std::string& reason) {
        if(session_handler_) session_handler_(ready, reason);
    }

private:
    IncomingHandler incoming_handler_;
    SessionHandler session_handler_;
};
