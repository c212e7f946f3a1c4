#include "membership_engine.hpp"

#include <algorithm>

#include "settings_manager.hpp"

const char* membership_state_name(MembershipState state){
    switch(state){
        case MembershipState::Uninitialized: return "uninitialized";
        case MembershipState::Joining: return "joining";
        case MembershipState::Joined: return "joined";
        case MembershipState::Left: return "left";
    }
    return "unknown";
}

MembershipEngine::MembershipEngine(std::shared_ptr<ChannelRegistry> channels,
                                   std::shared_ptr<Signaling> signaling,
                                   std::shared_ptr<DiscoveryService> discovery,
                                   std::shared_ptr<Logger> logger)
: channels_(std::move(channels)),
  signaling_(std::move(signaling)),
  discovery_(std::move(discovery)),
  logger_(std::move(logger))
{
}

void MembershipEngine::set_status(const std::string& status){
    status_ = status;
    log_info(logger_.get(), "Status: {}", status);
    if(on_status_) on_status_(status);
}

void MembershipEngine::roster_changed(){
    if(on_roster_) on_roster_(roster_);
}

std::optional<RoomUser> MembershipEngine::find_member(const std::string& peer_id) const {
    auto it = std::find_if(roster_.begin(), roster_.end(),
                           [&](const RoomUser& u){ return u.peer_id == peer_id; });
    if(it == roster_.end()) return std::nullopt;
    return *it;
}

bool MembershipEngine::upsert(const RoomUser& user, bool replace_name){
    if(user.peer_id.empty() || user.peer_id == self_.peer_id) return false;
    auto it = std::find_if(roster_.begin(), roster_.end(),
                           [&](const RoomUser& u){ return u.peer_id == user.peer_id; });
    if(it == roster_.end()){
        roster_.push_back(user);
        log_info(logger_.get(), "{} ({}) is in the room", user.name, user.peer_id);
        return true;
    }
    if(replace_name && it->name != user.name){
        it->name = user.name;
        return true;
    }
    return false;
}

bool MembershipEngine::remove(const std::string& peer_id){
    auto it = std::find_if(roster_.begin(), roster_.end(),
                           [&](const RoomUser& u){ return u.peer_id == peer_id; });
    if(it == roster_.end()) return false;
    log_info(logger_.get(), "{} ({}) left the room", it->name, peer_id);
    roster_.erase(it);
    return true;
}

void MembershipEngine::join(const std::string& room, const std::string& display_name){
    if(active()){
        log_warn(logger_.get(), "Already in room {}", room_);
        return;
    }
    auto name = SettingsManager::trim_copy(display_name);
    if(name.empty()){
        set_status("Name required");
        return;
    }
    if(!signaling_->ready() || signaling_->local_peer_id().empty()){
        set_status("Not ready");
        return;
    }

    room_ = room;
    self_ = RoomUser{signaling_->local_peer_id(), name};
    roster_.clear();
    state_ = MembershipState::Joining;
    const auto generation = ++generation_;
    set_status("Joining room...");

    std::weak_ptr<MembershipEngine> weak = weak_from_this();
    discovery_->register_self(room_, self_, [weak, generation](const DiscoveryResult& posted){
        auto self = weak.lock();
        if(!self) return;
        if(!posted.ok){
            self->fail_join(generation, posted.error);
            return;
        }
        self->discovery_->fetch_peers(self->room_, [weak, generation](const DiscoveryResult& fetched){
            auto self = weak.lock();
            if(!self) return;
            if(!fetched.ok){
                self->fail_join(generation, fetched.error);
                return;
            }
            self->finish_join(generation, fetched);
        });
    });
}

void MembershipEngine::fail_join(uint64_t generation, const std::string& why){
    if(generation != generation_ || state_ != MembershipState::Joining) return;
    log_error(logger_.get(), "Joining room {} failed: {}", room_, why);
    state_ = MembershipState::Uninitialized;
    set_status("Failed to join room");
}

void MembershipEngine::finish_join(uint64_t generation, const DiscoveryResult& result){
    if(generation != generation_ || state_ != MembershipState::Joining) return;
    for(const auto& peer : result.peers){
        upsert(peer, false);
    }
    state_ = MembershipState::Joined;
    roster_changed();
    auto dialled = reconcile();
    log_info(logger_.get(), "Joined room {} as {} ({} other participant(s), {} dial(s))",
             room_, self_.peer_id, roster_.size(), dialled);
    set_status("Joined room");
}

std::size_t MembershipEngine::reconcile(){
    if(!active()) return 0;
    std::size_t dialled = 0;
    for(const auto& member : roster_){
        if(channels_->has(member.peer_id)) continue;
        channels_->open(member.peer_id);
        ++dialled;
    }
    return dialled;
}

void MembershipEngine::leave(){
    if(!active()){
        log_debug(logger_.get(), "Leave ignored in state {}", membership_state_name(state_));
        return;
    }
    auto sent = channels_->send_to_all_except("", make_user_left(self_.peer_id));
    log_info(logger_.get(), "Announced departure to {} peer(s)", sent);

    discovery_->remove_self(room_, self_.peer_id, [logger = logger_, room = room_](const DiscoveryResult& result){
        if(result.ok) log_debug(logger.get(), "Deregistered from room {}", room);
        else log_debug(logger.get(), "Deregistration from room {} failed: {}", room, result.error);
    });

    channels_->close_all();
    roster_.clear();
    state_ = MembershipState::Left;
    ++generation_;
    roster_changed();
    set_status("Left room");
    if(on_left_) on_left_();
}

bool MembershipEngine::accept_incoming(const std::shared_ptr<PeerChannel>& channel){
    if(!active()){
        log_info(logger_.get(), "Refusing channel from {} while {}", channel->remote_peer_id(),
                 membership_state_name(state_));
        return false;
    }
    return channels_->adopt(channel);
}

void MembershipEngine::handle_channel_open(const std::string& peer_id){
    if(!active()){
        channels_->close(peer_id);
        return;
    }
    std::vector<RoomUser> snapshot;
    snapshot.push_back(self_);
    for(const auto& member : roster_){
        if(member.peer_id != peer_id) snapshot.push_back(member);
    }
    channels_->send_to_one(peer_id, make_join(self_));
    channels_->send_to_one(peer_id, make_user_list(std::move(snapshot)));
}

void MembershipEngine::handle_channel_closed(const std::string& peer_id, const std::string& reason, bool was_open){
    if(!active()) return;
    auto member = find_member(peer_id);
    bool changed = remove(peer_id);

    if(was_open){
        auto sent = channels_->send_to_all_except(peer_id, make_user_left(peer_id));
        log_info(logger_.get(), "Lost {}{}, told {} peer(s)", peer_id,
                 reason.empty() ? std::string() : " (" + reason + ")", sent);
    } else {
        set_status("Connection to " + (member ? member->name : peer_id) + " failed");
    }
    if(changed) roster_changed();
}

bool MembershipEngine::handle_message(const std::string& from_peer_id, const Envelope& message){
    if(auto join = std::get_if<JoinMessage>(&message)){
        if(!active()) return true;
        RoomUser user{join->peer_id.empty() ? from_peer_id : join->peer_id, join->name};
        if(upsert(user, false)) roster_changed();
        return true;
    }
    if(auto list = std::get_if<UserListMessage>(&message)){
        if(!active()) return true;
        bool changed = false;
        for(const auto& user : list->users){
            changed = upsert(user, true) || changed;
        }
        if(changed) roster_changed();
        reconcile();
        return true;
    }
    if(auto joined = std::get_if<UserJoinedMessage>(&message)){
        if(!active()) return true;
        if(upsert(joined->user, false)) roster_changed();
        if(joined->user.peer_id != self_.peer_id && !joined->user.peer_id.empty() &&
           !channels_->has(joined->user.peer_id)){
            channels_->open(joined->user.peer_id);
        }
        return true;
    }
    if(auto left = std::get_if<UserLeftMessage>(&message)){
        if(!active()) return true;
        if(left->peer_id == self_.peer_id) return true;
        bool changed = remove(left->peer_id);
        channels_->close(left->peer_id);
        if(changed) roster_changed();
        return true;
    }
    return false;
}

void MembershipEngine::handle_session(bool ready, const std::string& reason){
    if(!ready){
        session_lost_ = true;
        log_warn(logger_.get(), "Signaling session down: {}", reason);
        set_status("Disconnected. Attempting to reconnect...");
        return;
    }
    if(session_lost_ || state_ == MembershipState::Uninitialized){
        session_lost_ = false;
        if(!active()) set_status("Ready to join room");
        else set_status(state_ == MembershipState::Joined ? "Joined room" : "Joining room...");
    }
}
