#include "loopback_signaling.hpp"

#include <algorithm>

// ---- LoopbackChannel -------------------------------------------------------

LoopbackChannel::LoopbackChannel(LoopbackSwitchboard& board, std::string remote_peer_id)
: PeerChannel(std::move(remote_peer_id)), board_(board)
{
}

void LoopbackChannel::link(const std::shared_ptr<LoopbackChannel>& remote){
    remote_ = remote;
    notify_open();
}

void LoopbackChannel::fail(const std::string& reason){
    held_.clear();
    queued_bytes_ = 0;
    notify_closed(reason);
}

void LoopbackChannel::send(Frame frame){
    if(!is_open() || !frame) return;
    queued_bytes_ += frame->size();
    auto self = shared_from_this();
    asio::post(board_.io(), [self, frame](){
        if(self->board_.delivery_paused(self->remote_peer_id())){
            self->held_.push_back(frame);
            return;
        }
        self->deliver(frame);
        if(self->queued_bytes_ == 0) self->notify_drained();
    });
}

void LoopbackChannel::deliver(const Frame& frame){
    queued_bytes_ -= std::min(queued_bytes_, frame->size());
    if(auto remote = remote_.lock()){
        remote->notify_frame(*frame);
    }
}

void LoopbackChannel::flush(){
    while(!held_.empty()){
        auto frame = held_.front();
        held_.pop_front();
        deliver(frame);
    }
    if(close_after_flush_){
        close_after_flush_ = false;
        if(auto remote = remote_.lock()) remote->notify_closed("");
        return;
    }
    if(queued_bytes_ == 0) notify_drained();
}

void LoopbackChannel::close(){
    if(state() == ChannelState::Closed) return;
    mark_closed();
    clear_handlers();
    auto self = shared_from_this();
    // queued after any frame already sent, so the remote sees them first
    asio::post(board_.io(), [self](){
        if(!self->held_.empty()){
            self->close_after_flush_ = true;
            return;
        }
        if(auto remote = self->remote_.lock()) remote->notify_closed("");
    });
}

void LoopbackChannel::sever(const std::string& reason){
    if(state() == ChannelState::Closed) return;
    mark_closed();
    clear_handlers();
    held_.clear();
    queued_bytes_ = 0;
    auto remote = remote_.lock();
    if(!remote) return;
    asio::post(board_.io(), [remote, reason](){ remote->fail(reason); });
}

// ---- LoopbackSignaling -----------------------------------------------------

LoopbackSignaling::LoopbackSignaling(LoopbackSwitchboard& board, std::string peer_id)
: board_(board), peer_id_(std::move(peer_id))
{
}

LoopbackSignaling::~LoopbackSignaling(){
    board_.detach(peer_id_);
}

void LoopbackSignaling::start(){
    board_.attach(shared_from_this());
    ready_ = true;
    notify_session(true, "");
}

void LoopbackSignaling::stop(){
    board_.detach(peer_id_);
    ready_ = false;
}

void LoopbackSignaling::drop_session(const std::string& reason){
    ready_ = false;
    notify_session(false, reason);
}

void LoopbackSignaling::restore_session(){
    ready_ = true;
    notify_session(true, "");
}

void LoopbackSignaling::track(const std::shared_ptr<LoopbackChannel>& channel){
    channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                   [](const std::weak_ptr<LoopbackChannel>& w){
                                       auto c = w.lock();
                                       return !c || c->state() == ChannelState::Closed;
                                   }),
                    channels_.end());
    channels_.push_back(channel);
}

std::shared_ptr<PeerChannel> LoopbackSignaling::dial(const std::string& remote_peer_id){
    auto channel = std::make_shared<LoopbackChannel>(board_, remote_peer_id);
    track(channel);
    auto self = shared_from_this();
    asio::post(board_.io(), [self, channel](){
        self->board_.connect(self->peer_id_, channel);
    });
    return channel;
}

// ---- LoopbackSwitchboard ---------------------------------------------------

void LoopbackSwitchboard::attach(const std::shared_ptr<LoopbackSignaling>& node){
    nodes_[node->local_peer_id()] = node;
}

void LoopbackSwitchboard::detach(const std::string& peer_id){
    nodes_.erase(peer_id);
}

std::shared_ptr<LoopbackSignaling> LoopbackSwitchboard::find(const std::string& peer_id) const {
    auto it = nodes_.find(peer_id);
    if(it == nodes_.end()) return nullptr;
    return it->second.lock();
}

bool LoopbackSwitchboard::registered(const std::string& peer_id) const {
    return find(peer_id) != nullptr;
}

void LoopbackSwitchboard::connect(const std::string& caller_id, const std::shared_ptr<LoopbackChannel>& channel){
    if(channel->state() == ChannelState::Closed) return;
    auto target = find(channel->remote_peer_id());
    if(!target || !target->ready()) return;

    auto far = std::make_shared<LoopbackChannel>(*this, caller_id);
    target->track(far);
    if(!target->accept(far)){
        far->mark_closed();
        channel->fail("rejected");
        return;
    }
    far->link(channel);
    if(channel->state() == ChannelState::Connecting){
        channel->link(far);
    }
}

void LoopbackSwitchboard::disconnect(const std::string& peer_id){
    auto node = find(peer_id);
    nodes_.erase(peer_id);
    if(!node) return;
    node->ready_ = false;
    for(auto& weak : node->channels_){
        if(auto channel = weak.lock()) channel->sever("connection lost");
    }
    node->channels_.clear();
}

void LoopbackSwitchboard::pause_delivery(const std::string& peer_id, bool paused){
    if(paused){
        paused_.insert(peer_id);
        return;
    }
    paused_.erase(peer_id);
    for(auto& entry : nodes_){
        auto node = entry.second.lock();
        if(!node) continue;
        for(auto& weak : node->channels_){
            auto channel = weak.lock();
            if(channel && channel->remote_peer_id() == peer_id) channel->flush();
        }
    }
}
