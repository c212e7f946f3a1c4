#include "transfer_engine.hpp"

#include <algorithm>

#include "utils.hpp"

namespace fs = std::filesystem;

const char* outgoing_state_name(OutgoingState state){
    switch(state){
        case OutgoingState::Idle: return "idle";
        case OutgoingState::Announcing: return "announcing";
        case OutgoingState::Streaming: return "streaming";
        case OutgoingState::Completed: return "completed";
        case OutgoingState::Aborted: return "aborted";
    }
    return "unknown";
}

const char* incoming_state_name(IncomingState state){
    switch(state){
        case IncomingState::Receiving: return "receiving";
        case IncomingState::Sealed: return "sealed";
    }
    return "unknown";
}

// ---- byte sources ----------------------------------------------------------

FileByteSource::FileByteSource(fs::path path, uint64_t size)
: path_(std::move(path)), size_(size)
{
}

std::shared_ptr<FileByteSource> FileByteSource::open(const fs::path& path, std::string& error){
    std::error_code ec;
    if(!fs::is_regular_file(path, ec)){
        error = ec ? ec.message() : "not a regular file";
        return nullptr;
    }
    auto size = fs::file_size(path, ec);
    if(ec){
        error = ec.message();
        return nullptr;
    }
    std::shared_ptr<FileByteSource> source(new FileByteSource(path, size));
    source->in_.open(path, std::ios::binary);
    if(!source->in_){
        error = "cannot open for reading";
        return nullptr;
    }
    return source;
}

bool FileByteSource::read(uint64_t offset, std::size_t max_bytes, std::vector<std::uint8_t>& out, std::string& error){
    if(offset > size_){
        error = "offset past end of file";
        return false;
    }
    auto n = static_cast<std::size_t>(std::min<uint64_t>(max_bytes, size_ - offset));
    out.resize(n);
    if(n == 0) return true;
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset));
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(n));
    if(static_cast<std::size_t>(in_.gcount()) != n){
        error = "short read from " + path_.string();
        return false;
    }
    return true;
}

bool MemoryByteSource::read(uint64_t offset, std::size_t max_bytes, std::vector<std::uint8_t>& out, std::string& error){
    if(offset > data_.size()){
        error = "offset past end of buffer";
        return false;
    }
    auto n = static_cast<std::size_t>(std::min<uint64_t>(max_bytes, data_.size() - offset));
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset),
               data_.begin() + static_cast<std::ptrdiff_t>(offset + n));
    return true;
}

// ---- TransferEngine --------------------------------------------------------

TransferEngine::TransferEngine(asio::io_context& io,
                               std::shared_ptr<ChannelRegistry> channels,
                               Options options,
                               std::shared_ptr<Logger> logger,
                               Clock clock)
: io_(io),
  channels_(std::move(channels)),
  options_(options),
  logger_(std::move(logger)),
  clock_(clock ? std::move(clock) : Clock(unix_millis_now))
{
    if(options_.chunk_size == 0) options_.chunk_size = kDefaultChunkSize;
}

void TransferEngine::set_status(const std::string& status){
    log_info(logger_.get(), "Status: {}", status);
    if(on_status_) on_status_(status);
}

std::optional<std::string> TransferEngine::send(const std::string& name,
                                                std::shared_ptr<ByteSource> source,
                                                const std::string& mime_type){
    if(!source) return std::nullopt;
    if(channels_->open_count() == 0){
        set_status("No other users in the room");
        return std::nullopt;
    }

    auto now = clock_();
    auto file_id = make_file_id(self_.peer_id, now, name);
    for(int64_t bump = 1; outgoing_.count(file_id); ++bump){
        file_id = make_file_id(self_.peer_id, now + bump, name);
    }

    OutgoingTransfer transfer;
    transfer.metadata.file_id = file_id;
    transfer.metadata.name = name;
    transfer.metadata.size = source->size();
    transfer.metadata.mime_type = mime_type.empty() ? guess_mime_type(name) : mime_type;
    transfer.metadata.sender_id = self_.peer_id;
    transfer.metadata.sender_name = self_.name;
    transfer.source = std::move(source);
    transfer.created_at = now;
    outgoing_.emplace(file_id, std::move(transfer));

    queue_.push_back(Job{file_id, false});
    log_info(logger_.get(), "Queued {} ({}) as {}", name, format_bytes(outgoing_.at(file_id).metadata.size), file_id);
    pump();
    return file_id;
}

std::optional<std::string> TransferEngine::send_file(const fs::path& path){
    std::string error;
    auto source = FileByteSource::open(path, error);
    if(!source){
        log_error(logger_.get(), "Cannot send {}: {}", path.string(), error);
        set_status("Failed to read file");
        return std::nullopt;
    }
    return send(path.filename().string(), source);
}

bool TransferEngine::resend(const std::string& file_id){
    auto it = outgoing_.find(file_id);
    if(it == outgoing_.end()){
        log_warn(logger_.get(), "No sent file {}", file_id);
        return false;
    }
    bool pending = (active_ && active_->job.file_id == file_id) ||
                   std::any_of(queue_.begin(), queue_.end(), [&](const Job& j){ return j.file_id == file_id; });
    if(pending){
        log_info(logger_.get(), "{} is already queued", file_id);
        return false;
    }
    if(channels_->open_count() == 0){
        set_status("No other users in the room");
        return false;
    }
    queue_.push_back(Job{file_id, it->second.state == OutgoingState::Completed});
    pump();
    return true;
}

void TransferEngine::pump(){
    while(!active_ && !queue_.empty()){
        auto job = queue_.front();
        queue_.pop_front();
        start_stream(job);
    }
}

void TransferEngine::start_stream(const Job& job){
    auto it = outgoing_.find(job.file_id);
    if(it == outgoing_.end()) return;
    auto& transfer = it->second;

    transfer.state = OutgoingState::Announcing;
    auto fanout = channels_->send_to_all_except("", make_metadata(transfer.metadata));
    if(!job.resend){
        transfer.sent_bytes = 0;
        transfer.percent = 0.0;
    }
    transfer.state = OutgoingState::Streaming;

    const auto size = transfer.metadata.size;
    ActiveStream stream;
    stream.job = job;
    stream.total_chunks = (size + options_.chunk_size - 1) / options_.chunk_size;
    active_ = stream;
    log_info(logger_.get(), "{} {} ({}) to {} peer(s)", job.resend ? "Resending" : "Sending",
             transfer.metadata.name, format_bytes(size), fanout);
    schedule_step();
}

void TransferEngine::schedule_step(){
    if(step_pending_) return;
    step_pending_ = true;
    std::weak_ptr<TransferEngine> weak = weak_from_this();
    const auto generation = generation_;
    auto run = [weak, generation](){
        auto self = weak.lock();
        if(!self) return;
        self->step_pending_ = false;
        self->step(generation);
    };
    if(channels_->congested()){
        if(options_.transfer_debug) log_debug(logger_.get(), "Send queues full, waiting to drain");
        channels_->when_drained(std::move(run));
    } else {
        asio::post(io_, std::move(run));
    }
}

void TransferEngine::step(uint64_t generation){
    if(generation != generation_ || !active_) return;
    if(channels_->congested()){
        schedule_step();
        return;
    }
    auto it = outgoing_.find(active_->job.file_id);
    if(it == outgoing_.end()){
        active_.reset();
        pump();
        return;
    }
    auto& transfer = it->second;
    const auto size = transfer.metadata.size;

    if(active_->offset >= size){
        finish_stream(transfer, true);
        return;
    }

    std::vector<std::uint8_t> buffer;
    std::string error;
    if(!transfer.source->read(active_->offset, options_.chunk_size, buffer, error) || buffer.empty()){
        log_error(logger_.get(), "Reading {} at offset {} failed: {}", transfer.metadata.name, active_->offset,
                  error.empty() ? std::string("no data") : error);
        finish_stream(transfer, false);
        return;
    }

    const auto n = buffer.size();
    const auto index = active_->index;
    channels_->send_to_all_except("", make_chunk(transfer.metadata.file_id, std::move(buffer), index, active_->total_chunks));
    active_->offset += n;
    active_->index += 1;
    if(!active_->job.resend){
        transfer.sent_bytes = active_->offset;
        if(active_->offset < size){
            transfer.percent = static_cast<double>(active_->offset) / static_cast<double>(size) * 100.0;
        }
    }
    if(options_.transfer_debug){
        log_debug(logger_.get(), "chunk {}/{} of {} ({} bytes)", index + 1, active_->total_chunks,
                  transfer.metadata.file_id, n);
    }
    if(on_outgoing_progress_) on_outgoing_progress_(transfer, active_->offset);
    schedule_step();
}

void TransferEngine::finish_stream(OutgoingTransfer& transfer, bool ok){
    const auto job = active_->job;
    active_.reset();

    if(ok){
        auto fanout = channels_->send_to_all_except("", make_end(transfer.metadata.file_id));
        transfer.state = OutgoingState::Completed;
        transfer.sent_bytes = transfer.metadata.size;
        transfer.percent = 100.0;
        if(transfer.completed_at == 0) transfer.completed_at = clock_();
        if(job.resend) ++transfer.resend_count;
        log_info(logger_.get(), "{} {} to {} peer(s)", job.resend ? "Resent" : "Sent", transfer.metadata.name, fanout);
    } else {
        if(!job.resend) transfer.state = OutgoingState::Aborted;
        set_status("Failed to read file");
    }
    if(on_outgoing_finished_) on_outgoing_finished_(transfer);
    pump();
}

bool TransferEngine::handle_message(const std::string& from_peer_id, const Envelope& message){
    if(auto metadata = std::get_if<MetadataMessage>(&message)){
        handle_metadata(from_peer_id, metadata->metadata);
        return true;
    }
    if(auto chunk = std::get_if<ChunkMessage>(&message)){
        handle_chunk(*chunk);
        return true;
    }
    if(auto end = std::get_if<EndMessage>(&message)){
        handle_end(end->file_id);
        return true;
    }
    return false;
}

void TransferEngine::handle_metadata(const std::string& from_peer_id, const TransferMetadata& metadata){
    if(metadata.file_id.empty()) return;
    auto existing = incoming_.find(metadata.file_id);
    if(existing != incoming_.end()){
        if(existing->second.state == IncomingState::Sealed){
            log_debug(logger_.get(), "Ignoring repeated metadata for {}", metadata.file_id);
        } else {
            restart_incoming(existing->second);
        }
        return;
    }
    IncomingTransfer transfer;
    transfer.metadata = metadata;
    transfer.from_peer_id = from_peer_id;
    transfer.created_at = clock_();
    incoming_.emplace(metadata.file_id, std::move(transfer));
    log_info(logger_.get(), "Receiving {} ({}) from {}", metadata.name, format_bytes(metadata.size),
             metadata.sender_name.empty() ? from_peer_id : metadata.sender_name);
}

void TransferEngine::handle_chunk(const ChunkMessage& chunk){
    auto it = incoming_.find(chunk.file_id);
    if(it == incoming_.end() || it->second.state == IncomingState::Sealed){
        if(options_.transfer_debug) log_debug(logger_.get(), "Dropping chunk for {}", chunk.file_id);
        return;
    }
    auto& transfer = it->second;
    if(chunk.index == 0 && !transfer.chunks.empty()){
        restart_incoming(transfer);
    }
    const auto size = transfer.metadata.size;
    if(transfer.received_bytes + chunk.payload.size() > size){
        log_warn(logger_.get(), "Chunk {} of {} overruns the announced size, dropped", chunk.index, chunk.file_id);
        return;
    }
    transfer.received_bytes += chunk.payload.size();
    transfer.chunks.push_back(chunk.payload);
    if(options_.transfer_debug){
        log_debug(logger_.get(), "chunk {}/{} of {} ({} bytes)", chunk.index + 1, chunk.total_chunks,
                  chunk.file_id, chunk.payload.size());
    }
    // the completing chunk leaves percent alone: 100 is reserved for the seal
    if(transfer.received_bytes < size){
        auto percent = static_cast<double>(transfer.received_bytes) / static_cast<double>(size) * 100.0;
        if(percent > transfer.percent){
            transfer.percent = percent;
            if(on_incoming_progress_) on_incoming_progress_(transfer);
        }
    }
}

// A resent stream begins again at chunk 0. Percent keeps its high-water mark.
void TransferEngine::restart_incoming(IncomingTransfer& transfer){
    log_info(logger_.get(), "Restarting {} after {} of {} bytes", transfer.metadata.file_id,
             transfer.received_bytes, transfer.metadata.size);
    transfer.chunks.clear();
    transfer.received_bytes = 0;
}

void TransferEngine::handle_end(const std::string& file_id){
    auto it = incoming_.find(file_id);
    if(it == incoming_.end() || it->second.state == IncomingState::Sealed){
        log_debug(logger_.get(), "Dropping end for {}", file_id);
        return;
    }
    auto& transfer = it->second;
    if(transfer.received_bytes != transfer.metadata.size){
        log_warn(logger_.get(), "{} ended with {} of {} bytes", file_id, transfer.received_bytes, transfer.metadata.size);
    }
    transfer.artifact.clear();
    transfer.artifact.reserve(static_cast<std::size_t>(transfer.received_bytes));
    for(const auto& part : transfer.chunks){
        transfer.artifact.insert(transfer.artifact.end(), part.begin(), part.end());
    }
    transfer.chunks.clear();
    transfer.chunks.shrink_to_fit();
    transfer.state = IncomingState::Sealed;
    transfer.percent = 100.0;
    transfer.completed_at = clock_();
    log_info(logger_.get(), "Received {} ({}) sha256 {}", transfer.metadata.name,
             format_bytes(transfer.artifact.size()), sha256_hex(transfer.artifact));
    if(on_incoming_complete_) on_incoming_complete_(transfer);
}

std::vector<HistoryEntry> TransferEngine::history() const {
    std::vector<HistoryEntry> entries;
    for(const auto& kv : outgoing_){
        const auto& t = kv.second;
        HistoryEntry e;
        e.direction = HistoryEntry::Direction::Sent;
        e.metadata = t.metadata;
        e.state = outgoing_state_name(t.state);
        e.percent = t.percent;
        e.completed = t.state == OutgoingState::Completed;
        e.timestamp = t.completed_at != 0 ? t.completed_at : t.created_at;
        entries.push_back(std::move(e));
    }
    for(const auto& kv : incoming_){
        const auto& t = kv.second;
        HistoryEntry e;
        e.direction = HistoryEntry::Direction::Received;
        e.metadata = t.metadata;
        e.state = incoming_state_name(t.state);
        e.percent = t.percent;
        e.completed = t.state == IncomingState::Sealed;
        e.timestamp = t.completed_at != 0 ? t.completed_at : t.created_at;
        entries.push_back(std::move(e));
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const HistoryEntry& a, const HistoryEntry& b){ return a.timestamp > b.timestamp; });
    return entries;
}

const OutgoingTransfer* TransferEngine::outgoing(const std::string& file_id) const {
    auto it = outgoing_.find(file_id);
    return it == outgoing_.end() ? nullptr : &it->second;
}

const IncomingTransfer* TransferEngine::incoming(const std::string& file_id) const {
    auto it = incoming_.find(file_id);
    return it == incoming_.end() ? nullptr : &it->second;
}

bool TransferEngine::save_incoming(const std::string& file_id,
                                   const fs::path& dir,
                                   fs::path& out_path,
                                   std::string& error) const {
    auto transfer = incoming(file_id);
    if(!transfer){
        error = "unknown file id";
        return false;
    }
    if(transfer->state != IncomingState::Sealed){
        error = "transfer still in progress";
        return false;
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if(ec){
        error = ec.message();
        return false;
    }

    auto name = fs::path(transfer->metadata.name).filename();
    if(name.empty() || name == "." || name == "..") name = "download";
    auto candidate = dir / name;
    for(int n = 1; fs::exists(candidate, ec); ++n){
        candidate = dir / (name.stem().string() + " (" + std::to_string(n) + ")" + name.extension().string());
    }

    std::ofstream out(candidate, std::ios::binary | std::ios::trunc);
    if(!out){
        error = "cannot open " + candidate.string();
        return false;
    }
    out.write(reinterpret_cast<const char*>(transfer->artifact.data()),
              static_cast<std::streamsize>(transfer->artifact.size()));
    if(!out){
        error = "write failed for " + candidate.string();
        return false;
    }
    out_path = candidate;
    return true;
}

void TransferEngine::clear_history(){
    ++generation_;
    active_.reset();
    queue_.clear();
    outgoing_.clear();
    incoming_.clear();
}
