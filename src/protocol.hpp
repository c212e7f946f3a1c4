#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// protocol.hpp
inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;
inline constexpr std::size_t kMaxFrameSize = 1024 * 1024;

struct RoomUser {
  std::string peer_id;
  std::string name;
};

inline bool operator==(const RoomUser& a, const RoomUser& b) {
  return a.peer_id == b.peer_id && a.name == b.name;
}

struct TransferMetadata {
  std::string file_id;
  std::string name;
  uint64_t size = 0;
  std::string mime_type;
  std::string sender_id;
  std::string sender_name;
};

struct JoinMessage {
  std::string name;
  std::string peer_id;
};

struct UserListMessage {
  std::vector<RoomUser> users;
};

struct UserJoinedMessage {
  RoomUser user;
};

struct UserLeftMessage {
  std::string peer_id;
};

struct MetadataMessage {
  TransferMetadata metadata;
};

struct ChunkMessage {
  std::string file_id;
  std::vector<std::uint8_t> payload;
  uint64_t index = 0;
  uint64_t total_chunks = 0;
};

struct EndMessage {
  std::string file_id;
};

using Envelope = std::variant<JoinMessage,
                              UserListMessage,
                              UserJoinedMessage,
                              UserLeftMessage,
                              MetadataMessage,
                              ChunkMessage,
                              EndMessage>;

// Encoded envelope, shared between every channel of a broadcast.
using Frame = std::shared_ptr<const std::vector<std::uint8_t>>;

const char* envelope_type(const Envelope& envelope);

nlohmann::json envelope_to_json(const Envelope& envelope);
std::optional<Envelope> envelope_from_json(const nlohmann::json& j, std::string& error);

Frame encode_envelope(const Envelope& envelope);
std::optional<Envelope> decode_envelope(const std::vector<std::uint8_t>& bytes, std::string& error);

Envelope make_join(const RoomUser& self);
Envelope make_user_list(std::vector<RoomUser> users);
Envelope make_user_joined(const RoomUser& user);
Envelope make_user_left(const std::string& peer_id);
Envelope make_metadata(const TransferMetadata& metadata);
Envelope make_chunk(const std::string& file_id,
                    std::vector<std::uint8_t> payload,
                    uint64_t index,
                    uint64_t total_chunks);
Envelope make_end(const std::string& file_id);
