#include "peer_channel.hpp"

const char* channel_state_name(ChannelState state) {
    switch(state) {
        case ChannelState::Connecting: return "connecting";
        case ChannelState::Open: return "open";
        case ChannelState::Closed: return "closed";
    }
    return "unknown";
}

PeerChannel::PeerChannel(std::string remote_peer_id)
: remote_peer_id_(std::move(remote_peer_id))
{
}

void PeerChannel::notify_open() {
    if(state_ != ChannelState::Connecting) return;
    state_ = ChannelState::Open;
    auto cb = handlers_.on_open;
    if(cb) cb();
}

void PeerChannel::notify_frame(std::vector<std::uint8_t> frame) {
    if(state_ != ChannelState::Open) return;
    auto cb = handlers_.on_frame;
    if(cb) cb(std::move(frame));
}

void PeerChannel::notify_closed(const std::string& reason) {
    if(state_ == ChannelState::Closed) return;
    state_ = ChannelState::Closed;
    auto cb = handlers_.on_closed;
    handlers_ = Handlers{};
    if(cb) cb(reason);
}

void PeerChannel::notify_drained() {
    if(state_ != ChannelState::Open) return;
    auto cb = handlers_.on_drained;
    if(cb) cb();
}
