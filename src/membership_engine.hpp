#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "channel_registry.hpp"
#include "discovery_client.hpp"
#include "log.hpp"
#include "peer_channel.hpp"
#include "protocol.hpp"

enum class MembershipState { Uninitialized, Joining, Joined, Left };

const char* membership_state_name(MembershipState state);

// Room roster plus the join/announce/leave protocol. Opens a channel to
// every roster member it is not yet connected to, which drives the room
// towards a full mesh.
class MembershipEngine : public std::enable_shared_from_this<MembershipEngine> {
public:
    using StatusCallback = std::function<void(const std::string& status)>;
    using RosterCallback = std::function<void(const std::vector<RoomUser>& roster)>;
    using LeftCallback = std::function<void()>;

    MembershipEngine(std::shared_ptr<ChannelRegistry> channels,
                     std::shared_ptr<Signaling> signaling,
                     std::shared_ptr<DiscoveryService> discovery,
                     std::shared_ptr<Logger> logger = nullptr);

    // Registers with the registry, fetches the roster and dials every member.
    void join(const std::string& room, const std::string& display_name);
    void leave();

    // Incoming channel offered by the signaling layer; false rejects it.
    bool accept_incoming(const std::shared_ptr<PeerChannel>& channel);

    void handle_channel_open(const std::string& peer_id);
    void handle_channel_closed(const std::string& peer_id, const std::string& reason, bool was_open);
    // Returns true when the message belonged to the membership protocol.
    bool handle_message(const std::string& from_peer_id, const Envelope& message);
    void handle_session(bool ready, const std::string& reason);

    // Opens a channel to every roster member without one.
    std::size_t reconcile();

    MembershipState state() const { return state_; }
    bool joined() const { return state_ == MembershipState::Joined; }
    bool active() const { return state_ == MembershipState::Joining || state_ == MembershipState::Joined; }
    const std::vector<RoomUser>& roster() const { return roster_; }
    std::optional<RoomUser> find_member(const std::string& peer_id) const;
    const RoomUser& self() const { return self_; }
    const std::string& room() const { return room_; }
    const std::string& status() const { return status_; }

    void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }
    void set_roster_callback(RosterCallback cb) { on_roster_ = std::move(cb); }
    void set_left_callback(LeftCallback cb) { on_left_ = std::move(cb); }

private:
    void set_status(const std::string& status);
    void finish_join(uint64_t generation, const DiscoveryResult& result);
    void fail_join(uint64_t generation, const std::string& why);
    // Returns true when the roster changed.
    bool upsert(const RoomUser& user, bool replace_name);
    bool remove(const std::string& peer_id);
    void roster_changed();

    std::shared_ptr<ChannelRegistry> channels_;
    std::shared_ptr<Signaling> signaling_;
    std::shared_ptr<DiscoveryService> discovery_;
    std::shared_ptr<Logger> logger_;

    MembershipState state_ = MembershipState::Uninitialized;
    uint64_t generation_ = 0;
    std::string room_;
    RoomUser self_;
    std::vector<RoomUser> roster_;
    std::string status_;
    bool session_lost_ = false;

    StatusCallback on_status_;
    RosterCallback on_roster_;
    LeftCallback on_left_;
};
