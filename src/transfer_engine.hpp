#pragma once
#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "channel_registry.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Readable content of an outgoing file.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual uint64_t size() const = 0;
    // Reads up to max_bytes starting at offset into out. False on failure.
    virtual bool read(uint64_t offset, std::size_t max_bytes, std::vector<std::uint8_t>& out, std::string& error) = 0;
};

class FileByteSource : public ByteSource {
public:
    // nullptr when the file cannot be opened; error says why.
    static std::shared_ptr<FileByteSource> open(const std::filesystem::path& path, std::string& error);

    uint64_t size() const override { return size_; }
    bool read(uint64_t offset, std::size_t max_bytes, std::vector<std::uint8_t>& out, std::string& error) override;

    const std::filesystem::path& path() const { return path_; }

private:
    FileByteSource(std::filesystem::path path, uint64_t size);

    std::filesystem::path path_;
    uint64_t size_ = 0;
    std::ifstream in_;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    uint64_t size() const override { return data_.size(); }
    bool read(uint64_t offset, std::size_t max_bytes, std::vector<std::uint8_t>& out, std::string& error) override;

private:
    std::vector<std::uint8_t> data_;
};

enum class OutgoingState { Idle, Announcing, Streaming, Completed, Aborted };
enum class IncomingState { Receiving, Sealed };

const char* outgoing_state_name(OutgoingState state);
const char* incoming_state_name(IncomingState state);

struct OutgoingTransfer {
    TransferMetadata metadata;
    std::shared_ptr<ByteSource> source;
    OutgoingState state = OutgoingState::Idle;
    uint64_t sent_bytes = 0;
    double percent = 0.0;
    int64_t created_at = 0;
    int64_t completed_at = 0;  // 0 until the first completed run
    unsigned resend_count = 0;
};

struct IncomingTransfer {
    TransferMetadata metadata;
    std::string from_peer_id;
    IncomingState state = IncomingState::Receiving;
    std::vector<std::vector<std::uint8_t>> chunks;
    uint64_t received_bytes = 0;
    double percent = 0.0;
    int64_t created_at = 0;
    int64_t completed_at = 0;
    std::vector<std::uint8_t> artifact;  // filled when sealed
};

struct HistoryEntry {
    enum class Direction { Sent, Received };
    Direction direction = Direction::Sent;
    TransferMetadata metadata;
    std::string state;
    double percent = 0.0;
    bool completed = false;
    int64_t timestamp = 0;
};

// Chunked file transfer over the channel registry. Outgoing files are
// streamed one at a time in request order, one chunk per posted handler.
class TransferEngine : public std::enable_shared_from_this<TransferEngine> {
public:
    struct Options {
        std::size_t chunk_size = kDefaultChunkSize;
        bool transfer_debug = false;
    };

    using Clock = std::function<int64_t()>;
    using IncomingCallback = std::function<void(const IncomingTransfer&)>;
    // sent_bytes counts the current run, which differs from the entry for a resend
    using OutgoingProgressCallback = std::function<void(const OutgoingTransfer&, uint64_t sent_bytes)>;
    using OutgoingCallback = std::function<void(const OutgoingTransfer&)>;
    using StatusCallback = std::function<void(const std::string&)>;

    TransferEngine(asio::io_context& io,
                   std::shared_ptr<ChannelRegistry> channels,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr,
                   Clock clock = nullptr);

    void set_identity(const RoomUser& self) { self_ = self; }
    const RoomUser& identity() const { return self_; }

    // Queues a file for every open channel. Returns the file id, or nullopt
    // when nobody is connected.
    std::optional<std::string> send(const std::string& name,
                                    std::shared_ptr<ByteSource> source,
                                    const std::string& mime_type = "");
    std::optional<std::string> send_file(const std::filesystem::path& path);
    // Streams a previously sent file again under the same id.
    bool resend(const std::string& file_id);

    // Returns true when the message belonged to the transfer protocol.
    bool handle_message(const std::string& from_peer_id, const Envelope& message);

    std::vector<HistoryEntry> history() const;
    const OutgoingTransfer* outgoing(const std::string& file_id) const;
    const IncomingTransfer* incoming(const std::string& file_id) const;
    // Writes a sealed artifact into dir; out_path receives the file written.
    bool save_incoming(const std::string& file_id,
                       const std::filesystem::path& dir,
                       std::filesystem::path& out_path,
                       std::string& error) const;
    void clear_history();

    bool busy() const { return active_.has_value() || !queue_.empty(); }
    std::size_t queued() const { return queue_.size(); }
    const Options& options() const { return options_; }
    void set_transfer_debug(bool enabled) { options_.transfer_debug = enabled; }

    void set_incoming_progress_callback(IncomingCallback cb) { on_incoming_progress_ = std::move(cb); }
    void set_incoming_complete_callback(IncomingCallback cb) { on_incoming_complete_ = std::move(cb); }
    void set_outgoing_progress_callback(OutgoingProgressCallback cb) { on_outgoing_progress_ = std::move(cb); }
    void set_outgoing_finished_callback(OutgoingCallback cb) { on_outgoing_finished_ = std::move(cb); }
    void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }

private:
    struct Job {
        std::string file_id;
        bool resend = false;
    };

    struct ActiveStream {
        Job job;
        uint64_t offset = 0;
        uint64_t index = 0;
        uint64_t total_chunks = 0;
    };

    void set_status(const std::string& status);
    void pump();
    void start_stream(const Job& job);
    void schedule_step();
    void step(uint64_t generation);
    void finish_stream(OutgoingTransfer& transfer, bool ok);

    void handle_metadata(const std::string& from_peer_id, const TransferMetadata& metadata);
    void handle_chunk(const ChunkMessage& chunk);
    void handle_end(const std::string& file_id);
    void restart_incoming(IncomingTransfer& transfer);

    asio::io_context& io_;
    std::shared_ptr<ChannelRegistry> channels_;
    Options options_;
    std::shared_ptr<Logger> logger_;
    Clock clock_;
    RoomUser self_;

    std::map<std::string, OutgoingTransfer> outgoing_;
    std::map<std::string, IncomingTransfer> incoming_;
    std::deque<Job> queue_;
    std::optional<ActiveStream> active_;
    uint64_t generation_ = 0;
    bool step_pending_ = false;

    IncomingCallback on_incoming_progress_;
    IncomingCallback on_incoming_complete_;
    OutgoingProgressCallback on_outgoing_progress_;
    OutgoingCallback on_outgoing_finished_;
    StatusCallback on_status_;
};
