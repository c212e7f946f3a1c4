#pragma once
#include <asio.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "channel_registry.hpp"
#include "discovery_client.hpp"
#include "log.hpp"
#include "membership_engine.hpp"
#include "peer_channel.hpp"
#include "transfer_engine.hpp"

// One participant: channel registry, membership and transfer engines wired
// to a signaling layer and a discovery service. Lives on one io_context.
class RoomSession : public std::enable_shared_from_this<RoomSession> {
public:
    struct Options {
        ChannelRegistry::Options channels;
        TransferEngine::Options transfer;
    };

    using StatusCallback = std::function<void(const std::string&)>;

    static std::shared_ptr<RoomSession> create(asio::io_context& io,
                                               std::shared_ptr<Signaling> signaling,
                                               std::shared_ptr<DiscoveryService> discovery,
                                               Options options,
                                               std::shared_ptr<Logger> logger = nullptr,
                                               TransferEngine::Clock clock = nullptr);

    // Starts the signaling session. Errors from the signaling layer propagate.
    void start();
    // Leaves the room if needed and stops the signaling session.
    void stop();

    void join(const std::string& room, const std::string& display_name);
    void leave();

    std::optional<std::string> send_file(const std::filesystem::path& path);
    std::optional<std::string> send_bytes(const std::string& name,
                                          std::vector<std::uint8_t> bytes,
                                          const std::string& mime_type = "");
    bool resend(const std::string& file_id);

    const std::string& peer_id() const { return signaling_->local_peer_id(); }
    const std::string& status() const { return status_; }

    std::shared_ptr<Signaling> signaling() const { return signaling_; }
    std::shared_ptr<ChannelRegistry> channels() const { return channels_; }
    std::shared_ptr<MembershipEngine> membership() const { return membership_; }
    std::shared_ptr<TransferEngine> transfers() const { return transfers_; }
    std::shared_ptr<Logger> logger() const { return logger_; }

    void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }
    void set_transfer_debug(bool enabled);

private:
    RoomSession(std::shared_ptr<Signaling> signaling,
                std::shared_ptr<DiscoveryService> discovery,
                std::shared_ptr<Logger> logger);

    void wire();
    void publish_status(const std::string& status);

    std::shared_ptr<Signaling> signaling_;
    std::shared_ptr<DiscoveryService> discovery_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<ChannelRegistry> channels_;
    std::shared_ptr<MembershipEngine> membership_;
    std::shared_ptr<TransferEngine> transfers_;
    std::string status_;
    bool started_ = false;
    StatusCallback on_status_;
};
