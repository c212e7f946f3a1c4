#include "channel_registry.hpp"

ChannelRegistry::ChannelRegistry(asio::io_context& io,
                                 std::shared_ptr<Signaling> signaling,
                                 Options options,
                                 std::shared_ptr<Logger> logger)
: io_(io), signaling_(std::move(signaling)), options_(options), logger_(std::move(logger))
{
}

ChannelRegistry::~ChannelRegistry(){
    for(auto& kv : entries_){
        if(kv.second.connect_timer) kv.second.connect_timer->cancel();
        kv.second.channel->clear_handlers();
        kv.second.channel->close();
    }
}

std::shared_ptr<PeerChannel> ChannelRegistry::open(const std::string& peer_id){
    auto it = entries_.find(peer_id);
    if(it != entries_.end()){
        return it->second.channel;
    }

    log_info(logger_.get(), "Opening channel to {}", peer_id);
    Entry entry;
    entry.channel = signaling_->dial(peer_id);
    entry.outgoing = true;
    attach(entry.channel);
    arm_connect_timer(entry);
    auto channel = entry.channel;
    entries_.emplace(peer_id, std::move(entry));
    return channel;
}

bool ChannelRegistry::adopt(std::shared_ptr<PeerChannel> channel){
    if(!channel || channel->state() == ChannelState::Closed) return false;
    const std::string peer_id = channel->remote_peer_id();

    auto it = entries_.find(peer_id);
    if(it != entries_.end()){
        auto& existing = it->second;
        // both sides dialled at once: keep the channel dialled by the smaller id
        if(existing.outgoing && existing.channel->state() == ChannelState::Connecting &&
           peer_id < signaling_->local_peer_id()){
            log_debug(logger_.get(), "Simultaneous dial with {}, keeping their channel", peer_id);
            if(existing.connect_timer) existing.connect_timer->cancel();
            existing.channel->close();
            entries_.erase(it);
        } else {
            log_debug(logger_.get(), "Refusing duplicate channel from {} (existing is {})",
                      peer_id, channel_state_name(existing.channel->state()));
            return false;
        }
    }

    Entry entry;
    entry.channel = channel;
    entry.outgoing = false;
    attach(entry.channel);
    arm_connect_timer(entry);
    entries_.emplace(peer_id, std::move(entry));
    log_info(logger_.get(), "Accepted channel from {}", peer_id);
    return true;
}

void ChannelRegistry::attach(const std::shared_ptr<PeerChannel>& channel){
    std::weak_ptr<ChannelRegistry> weak_self = weak_from_this();
    std::weak_ptr<PeerChannel> weak_channel = channel;

    PeerChannel::Handlers handlers;
    handlers.on_open = [weak_self, weak_channel](){
        auto self = weak_self.lock();
        auto ch = weak_channel.lock();
        if(self && ch) self->handle_open(ch);
    };
    handlers.on_frame = [weak_self, weak_channel](std::vector<std::uint8_t> bytes){
        auto self = weak_self.lock();
        auto ch = weak_channel.lock();
        if(self && ch) self->handle_frame(ch, bytes);
    };
    handlers.on_closed = [weak_self, weak_channel](const std::string& reason){
        auto self = weak_self.lock();
        auto ch = weak_channel.lock();
        if(self && ch) self->handle_closed(ch, reason);
    };
    handlers.on_drained = [weak_self](){
        if(auto self = weak_self.lock()) self->release_drain_waiters();
    };
    channel->set_handlers(std::move(handlers));
}

void ChannelRegistry::arm_connect_timer(Entry& entry){
    entry.connect_timer = std::make_unique<asio::steady_timer>(io_, options_.connect_timeout);
    std::weak_ptr<ChannelRegistry> weak_self = weak_from_this();
    std::weak_ptr<PeerChannel> weak_channel = entry.channel;
    entry.connect_timer->async_wait([weak_self, weak_channel](const std::error_code& ec){
        if(ec) return;
        auto self = weak_self.lock();
        auto ch = weak_channel.lock();
        if(self && ch) self->handle_connect_timeout(ch);
    });
}

bool ChannelRegistry::is_current(const std::shared_ptr<PeerChannel>& channel) const {
    auto it = entries_.find(channel->remote_peer_id());
    return it != entries_.end() && it->second.channel == channel;
}

void ChannelRegistry::handle_open(const std::shared_ptr<PeerChannel>& channel){
    if(!is_current(channel)) return;
    auto& entry = entries_.at(channel->remote_peer_id());
    entry.opened = true;
    if(entry.connect_timer) entry.connect_timer->cancel();
    log_info(logger_.get(), "Channel to {} open", channel->remote_peer_id());
    if(on_open_) on_open_(channel->remote_peer_id());
}

void ChannelRegistry::handle_frame(const std::shared_ptr<PeerChannel>& channel,
                                   const std::vector<std::uint8_t>& bytes){
    if(!is_current(channel)) return;
    std::string error;
    auto message = decode_envelope(bytes, error);
    if(!message){
        log_debug(logger_.get(), "Dropping frame from {}: {}", channel->remote_peer_id(), error);
        return;
    }
    if(transfer_debug_ || !std::holds_alternative<ChunkMessage>(*message)){
        log_debug(logger_.get(), "<- {} {}", channel->remote_peer_id(), envelope_type(*message));
    }
    if(on_message_) on_message_(channel->remote_peer_id(), *message);
}

void ChannelRegistry::handle_closed(const std::shared_ptr<PeerChannel>& channel, const std::string& reason){
    if(!is_current(channel)) return;
    const std::string peer_id = channel->remote_peer_id();
    auto it = entries_.find(peer_id);
    const bool was_open = it->second.opened;
    if(it->second.connect_timer) it->second.connect_timer->cancel();
    entries_.erase(it);

    if(reason.empty() && was_open){
        log_info(logger_.get(), "Channel to {} closed", peer_id);
        if(on_close_) on_close_(peer_id);
    } else {
        std::string why = reason.empty() ? std::string("closed before opening") : reason;
        log_warn(logger_.get(), "Channel to {} failed: {}", peer_id, why);
        if(on_error_) on_error_(peer_id, why, was_open);
    }
    release_drain_waiters();
}

void ChannelRegistry::handle_connect_timeout(const std::shared_ptr<PeerChannel>& channel){
    if(!is_current(channel) || channel->state() != ChannelState::Connecting) return;
    const std::string peer_id = channel->remote_peer_id();
    log_warn(logger_.get(), "Connection to {} timed out after {} ms", peer_id, options_.connect_timeout.count());
    entries_.erase(peer_id);
    channel->close();
    if(on_error_) on_error_(peer_id, "connect timeout", false);
}

bool ChannelRegistry::send_to_one(const std::string& peer_id, const Envelope& message){
    auto it = entries_.find(peer_id);
    if(it == entries_.end() || !it->second.channel->is_open()) return false;
    it->second.channel->send(encode_envelope(message));
    return true;
}

std::size_t ChannelRegistry::send_to_all_except(const std::string& excluded_peer_id, const Envelope& message){
    Frame frame;
    std::size_t sent = 0;
    for(auto& kv : entries_){
        if(kv.first == excluded_peer_id) continue;
        if(!kv.second.channel->is_open()) continue;
        if(!frame) frame = encode_envelope(message);
        kv.second.channel->send(frame);
        ++sent;
    }
    if(transfer_debug_ || !std::holds_alternative<ChunkMessage>(message)){
        log_debug(logger_.get(), "-> {} to {} peer(s)", envelope_type(message), sent);
    }
    return sent;
}

void ChannelRegistry::close(const std::string& peer_id){
    auto it = entries_.find(peer_id);
    if(it == entries_.end()) return;
    auto channel = it->second.channel;
    if(it->second.connect_timer) it->second.connect_timer->cancel();
    entries_.erase(it);
    channel->close();
    log_info(logger_.get(), "Closed channel to {}", peer_id);
    release_drain_waiters();
}

void ChannelRegistry::close_all(){
    auto entries = std::move(entries_);
    entries_.clear();
    for(auto& kv : entries){
        if(kv.second.connect_timer) kv.second.connect_timer->cancel();
        kv.second.channel->close();
    }
    if(!entries.empty()){
        log_info(logger_.get(), "Closed {} channel(s)", entries.size());
    }
    release_drain_waiters();
}

bool ChannelRegistry::congested() const {
    for(const auto& kv : entries_){
        const auto& channel = kv.second.channel;
        if(channel->is_open() && channel->queued_bytes() > options_.send_queue_limit) return true;
    }
    return false;
}

void ChannelRegistry::when_drained(std::function<void()> callback){
    if(!callback) return;
    if(!congested()){
        asio::post(io_, std::move(callback));
        return;
    }
    drain_waiters_.push_back(std::move(callback));
}

void ChannelRegistry::release_drain_waiters(){
    if(drain_waiters_.empty() || congested()) return;
    auto waiters = std::move(drain_waiters_);
    drain_waiters_.clear();
    for(auto& waiter : waiters){
        asio::post(io_, std::move(waiter));
    }
}

std::vector<std::string> ChannelRegistry::open_peer_ids() const {
    std::vector<std::string> ids;
    for(const auto& kv : entries_){
        if(kv.second.channel->is_open()) ids.push_back(kv.first);
    }
    return ids;
}

bool ChannelRegistry::has(const std::string& peer_id) const {
    return entries_.count(peer_id) > 0;
}

std::optional<ChannelState> ChannelRegistry::state(const std::string& peer_id) const {
    auto it = entries_.find(peer_id);
    if(it == entries_.end()) return std::nullopt;
    return it->second.channel->state();
}

std::size_t ChannelRegistry::open_count() const {
    std::size_t n = 0;
    for(const auto& kv : entries_){
        if(kv.second.channel->is_open()) ++n;
    }
    return n;
}
