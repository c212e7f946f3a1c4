#include "room_session.hpp"

RoomSession::RoomSession(std::shared_ptr<Signaling> signaling,
                         std::shared_ptr<DiscoveryService> discovery,
                         std::shared_ptr<Logger> logger)
: signaling_(std::move(signaling)),
  discovery_(std::move(discovery)),
  logger_(std::move(logger))
{
}

std::shared_ptr<RoomSession> RoomSession::create(asio::io_context& io,
                                                 std::shared_ptr<Signaling> signaling,
                                                 std::shared_ptr<DiscoveryService> discovery,
                                                 Options options,
                                                 std::shared_ptr<Logger> logger,
                                                 TransferEngine::Clock clock){
    std::shared_ptr<RoomSession> session(new RoomSession(std::move(signaling), std::move(discovery), std::move(logger)));
    session->channels_ = std::make_shared<ChannelRegistry>(io, session->signaling_, options.channels, session->logger_);
    session->membership_ = std::make_shared<MembershipEngine>(session->channels_, session->signaling_,
                                                              session->discovery_, session->logger_);
    session->transfers_ = std::make_shared<TransferEngine>(io, session->channels_, options.transfer,
                                                           session->logger_, std::move(clock));
    session->channels_->set_transfer_debug(options.transfer.transfer_debug);
    session->wire();
    return session;
}

void RoomSession::wire(){
    std::weak_ptr<MembershipEngine> membership = membership_;
    std::weak_ptr<TransferEngine> transfers = transfers_;
    std::weak_ptr<RoomSession> weak_self = weak_from_this();

    signaling_->set_incoming_handler([membership](std::shared_ptr<PeerChannel> channel){
        auto m = membership.lock();
        return m && m->accept_incoming(channel);
    });
    signaling_->set_session_handler([membership](bool ready, const std::string& reason){
        if(auto m = membership.lock()) m->handle_session(ready, reason);
    });

    channels_->set_open_callback([membership](const std::string& peer_id){
        if(auto m = membership.lock()) m->handle_channel_open(peer_id);
    });
    channels_->set_close_callback([membership](const std::string& peer_id){
        if(auto m = membership.lock()) m->handle_channel_closed(peer_id, "", true);
    });
    channels_->set_error_callback([membership](const std::string& peer_id, const std::string& reason, bool was_open){
        if(auto m = membership.lock()) m->handle_channel_closed(peer_id, reason, was_open);
    });
    channels_->set_message_callback([membership, transfers](const std::string& peer_id, const Envelope& message){
        auto m = membership.lock();
        auto t = transfers.lock();
        if(!m || !t) return;
        if(m->handle_message(peer_id, message)) return;
        if(!m->active()) return;
        t->handle_message(peer_id, message);
    });

    membership_->set_status_callback([weak_self](const std::string& status){
        if(auto self = weak_self.lock()) self->publish_status(status);
    });
    membership_->set_left_callback([transfers](){
        if(auto t = transfers.lock()) t->clear_history();
    });
    transfers_->set_status_callback([weak_self](const std::string& status){
        if(auto self = weak_self.lock()) self->publish_status(status);
    });
}

void RoomSession::publish_status(const std::string& status){
    status_ = status;
    if(on_status_) on_status_(status);
}

void RoomSession::start(){
    if(started_) return;
    signaling_->start();
    started_ = true;
}

void RoomSession::stop(){
    if(!started_) return;
    started_ = false;
    if(membership_->active()) membership_->leave();
    signaling_->stop();
}

void RoomSession::join(const std::string& room, const std::string& display_name){
    membership_->join(room, display_name);
    if(membership_->active()){
        transfers_->set_identity(membership_->self());
    }
}

void RoomSession::leave(){
    membership_->leave();
}

std::optional<std::string> RoomSession::send_file(const std::filesystem::path& path){
    if(!membership_->active()){
        publish_status("Join a room first");
        return std::nullopt;
    }
    return transfers_->send_file(path);
}

std::optional<std::string> RoomSession::send_bytes(const std::string& name,
                                                   std::vector<std::uint8_t> bytes,
                                                   const std::string& mime_type){
    if(!membership_->active()){
        publish_status("Join a room first");
        return std::nullopt;
    }
    return transfers_->send(name, std::make_shared<MemoryByteSource>(std::move(bytes)), mime_type);
}

bool RoomSession::resend(const std::string& file_id){
    if(!membership_->active()){
        publish_status("Join a room first");
        return false;
    }
    return transfers_->resend(file_id);
}

void RoomSession::set_transfer_debug(bool enabled){
    channels_->set_transfer_debug(enabled);
    transfers_->set_transfer_debug(enabled);
}
