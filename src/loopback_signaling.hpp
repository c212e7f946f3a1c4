#pragma once
#include <asio.hpp>

#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "peer_channel.hpp"

// In-process signaling: every node registers on a shared switchboard and
// channels hand frames to each other through the io_context. Used by the
// test runners and by single-process demos.

class LoopbackSwitchboard;
class LoopbackSignaling;

class LoopbackChannel : public PeerChannel, public std::enable_shared_from_this<LoopbackChannel> {
public:
    LoopbackChannel(LoopbackSwitchboard& board, std::string remote_peer_id);

    void send(Frame frame) override;
    void close() override;
    std::size_t queued_bytes() const override { return queued_bytes_; }

private:
    friend class LoopbackSwitchboard;

    void link(const std::shared_ptr<LoopbackChannel>& remote);
    void fail(const std::string& reason);
    void deliver(const Frame& frame);
    void flush();
    void sever(const std::string& reason);

    LoopbackSwitchboard& board_;
    std::weak_ptr<LoopbackChannel> remote_;
    std::deque<Frame> held_;
    std::size_t queued_bytes_ = 0;
    bool close_after_flush_ = false;
};

class LoopbackSignaling : public Signaling, public std::enable_shared_from_this<LoopbackSignaling> {
public:
    LoopbackSignaling(LoopbackSwitchboard& board, std::string peer_id);
    ~LoopbackSignaling() override;

    const std::string& local_peer_id() const override { return peer_id_; }
    bool ready() const override { return ready_; }
    void start() override;
    void stop() override;
    std::shared_ptr<PeerChannel> dial(const std::string& remote_peer_id) override;

    // Simulates the signaling session dropping and coming back.
    void drop_session(const std::string& reason);
    void restore_session();

private:
    friend class LoopbackSwitchboard;

    void track(const std::shared_ptr<LoopbackChannel>& channel);
    bool accept(const std::shared_ptr<LoopbackChannel>& channel) { return offer_incoming(channel); }

    LoopbackSwitchboard& board_;
    std::string peer_id_;
    bool ready_ = false;
    std::vector<std::weak_ptr<LoopbackChannel>> channels_;
};

class LoopbackSwitchboard {
public:
    explicit LoopbackSwitchboard(asio::io_context& io) : io_(io) {}

    asio::io_context& io() { return io_; }

    // Dials to a peer id nobody registered stay Connecting until closed.
    void connect(const std::string& caller_id, const std::shared_ptr<LoopbackChannel>& channel);

    // Abrupt departure: the node's channels vanish and every remote end
    // sees a non-orderly close.
    void disconnect(const std::string& peer_id);

    // While paused, frames addressed to peer_id stay queued at the sender.
    void pause_delivery(const std::string& peer_id, bool paused);
    bool delivery_paused(const std::string& peer_id) const { return paused_.count(peer_id) > 0; }

    bool registered(const std::string& peer_id) const;

private:
    friend class LoopbackSignaling;

    void attach(const std::shared_ptr<LoopbackSignaling>& node);
    void detach(const std::string& peer_id);
    std::shared_ptr<LoopbackSignaling> find(const std::string& peer_id) const;

    asio::io_context& io_;
    std::unordered_map<std::string, std::weak_ptr<LoopbackSignaling>> nodes_;
    std::unordered_set<std::string> paused_;
};
