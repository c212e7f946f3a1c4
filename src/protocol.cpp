#include "protocol.hpp"

#include <type_traits>

using json = nlohmann::json;

namespace {

template<class> inline constexpr bool kAlwaysFalse = false;

json user_to_json(const RoomUser& user) {
  return json{{"peerId", user.peer_id}, {"name", user.name}};
}

// Absent fields read as empty; present ones must be strings.
bool optional_string(const json& j, const char* key, std::string& out) {
  out.clear();
  auto it = j.find(key);
  if(it == j.end()) return true;
  if(!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

bool user_from_json(const json& j, RoomUser& out) {
  if(!j.is_object()) return false;
  if(!optional_string(j, "peerId", out.peer_id) || !optional_string(j, "name", out.name)) return false;
  return !out.peer_id.empty();
}

bool require_string(const json& j, const char* key, std::string& out, std::string& error) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) {
    error = std::string("missing string field '") + key + "'";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool require_unsigned(const json& j, const char* key, uint64_t& out, std::string& error) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_number_unsigned()) {
    error = std::string("field '") + key + "' is not an unsigned integer";
    return false;
  }
  out = it->get<uint64_t>();
  return true;
}

} // namespace

const char* envelope_type(const Envelope& envelope) {
  return std::visit([](const auto& msg) -> const char* {
    using T = std::decay_t<decltype(msg)>;
    if constexpr (std::is_same_v<T, JoinMessage>) return "join";
    else if constexpr (std::is_same_v<T, UserListMessage>) return "user-list";
    else if constexpr (std::is_same_v<T, UserJoinedMessage>) return "user-joined";
    else if constexpr (std::is_same_v<T, UserLeftMessage>) return "user-left";
    else if constexpr (std::is_same_v<T, MetadataMessage>) return "metadata";
    else if constexpr (std::is_same_v<T, ChunkMessage>) return "chunk";
    else if constexpr (std::is_same_v<T, EndMessage>) return "end";
    else static_assert(kAlwaysFalse<T>, "unhandled envelope alternative");
  }, envelope);
}

json envelope_to_json(const Envelope& envelope) {
  json j;
  j["type"] = envelope_type(envelope);
  std::visit([&j](const auto& msg) {
    using T = std::decay_t<decltype(msg)>;
    if constexpr (std::is_same_v<T, JoinMessage>) {
      j["payload"] = json{{"name", msg.name}, {"peerId", msg.peer_id}};
    } else if constexpr (std::is_same_v<T, UserListMessage>) {
      json arr = json::array();
      for(const auto& user : msg.users) arr.push_back(user_to_json(user));
      j["payload"] = std::move(arr);
    } else if constexpr (std::is_same_v<T, UserJoinedMessage>) {
      j["payload"] = user_to_json(msg.user);
    } else if constexpr (std::is_same_v<T, UserLeftMessage>) {
      j["payload"] = json{{"peerId", msg.peer_id}};
    } else if constexpr (std::is_same_v<T, MetadataMessage>) {
      const auto& m = msg.metadata;
      j["payload"] = json{{"name", m.name},
                          {"size", m.size},
                          {"type", m.mime_type},
                          {"senderId", m.sender_id},
                          {"senderName", m.sender_name},
                          {"fileId", m.file_id}};
    } else if constexpr (std::is_same_v<T, ChunkMessage>) {
      j["payload"] = json::binary(msg.payload);
      j["fileId"] = msg.file_id;
      j["index"] = msg.index;
      j["totalChunks"] = msg.total_chunks;
    } else if constexpr (std::is_same_v<T, EndMessage>) {
      j["payload"] = json{{"fileId", msg.file_id}};
    }
  }, envelope);
  return j;
}

std::optional<Envelope> envelope_from_json(const json& j, std::string& error) {
  if(!j.is_object()) {
    error = "envelope is not an object";
    return std::nullopt;
  }
  std::string type;
  if(!require_string(j, "type", type, error)) return std::nullopt;
  auto payload_it = j.find("payload");
  if(payload_it == j.end()) {
    error = "envelope '" + type + "' has no payload";
    return std::nullopt;
  }
  const json& payload = *payload_it;

  if(type == "join") {
    JoinMessage msg;
    if(!payload.is_object() ||
       !require_string(payload, "peerId", msg.peer_id, error) ||
       !require_string(payload, "name", msg.name, error)) {
      if(error.empty()) error = "join payload is not an object";
      return std::nullopt;
    }
    return Envelope{std::move(msg)};
  }
  if(type == "user-list") {
    if(!payload.is_array()) {
      error = "user-list payload is not an array";
      return std::nullopt;
    }
    UserListMessage msg;
    for(const auto& item : payload) {
      RoomUser user;
      if(user_from_json(item, user)) msg.users.push_back(std::move(user));
    }
    return Envelope{std::move(msg)};
  }
  if(type == "user-joined") {
    UserJoinedMessage msg;
    if(!user_from_json(payload, msg.user)) {
      error = "user-joined payload lacks peerId";
      return std::nullopt;
    }
    return Envelope{std::move(msg)};
  }
  if(type == "user-left") {
    UserLeftMessage msg;
    if(!payload.is_object() || !require_string(payload, "peerId", msg.peer_id, error)) {
      if(error.empty()) error = "user-left payload is not an object";
      return std::nullopt;
    }
    return Envelope{std::move(msg)};
  }
  if(type == "metadata") {
    MetadataMessage msg;
    auto& m = msg.metadata;
    if(!payload.is_object() ||
       !require_string(payload, "fileId", m.file_id, error) ||
       !require_string(payload, "name", m.name, error)) {
      if(error.empty()) error = "metadata payload is not an object";
      return std::nullopt;
    }
    if(!require_unsigned(payload, "size", m.size, error)) return std::nullopt;
    if(!optional_string(payload, "type", m.mime_type) ||
       !optional_string(payload, "senderId", m.sender_id) ||
       !optional_string(payload, "senderName", m.sender_name)) {
      error = "metadata sender or type is not a string";
      return std::nullopt;
    }
    return Envelope{std::move(msg)};
  }
  if(type == "chunk") {
    ChunkMessage msg;
    if(!require_string(j, "fileId", msg.file_id, error)) return std::nullopt;
    if(!payload.is_binary()) {
      error = "chunk payload is not binary";
      return std::nullopt;
    }
    const auto& bytes = payload.get_binary();
    msg.payload.assign(bytes.begin(), bytes.end());
    if(!require_unsigned(j, "index", msg.index, error) ||
       !require_unsigned(j, "totalChunks", msg.total_chunks, error)) {
      return std::nullopt;
    }
    return Envelope{std::move(msg)};
  }
  if(type == "end") {
    EndMessage msg;
    if(!payload.is_object() || !require_string(payload, "fileId", msg.file_id, error)) {
      if(error.empty()) error = "end payload is not an object";
      return std::nullopt;
    }
    return Envelope{std::move(msg)};
  }

  error = "unknown message type '" + type + "'";
  return std::nullopt;
}

Frame encode_envelope(const Envelope& envelope) {
  return std::make_shared<const std::vector<std::uint8_t>>(json::to_msgpack(envelope_to_json(envelope)));
}

std::optional<Envelope> decode_envelope(const std::vector<std::uint8_t>& bytes, std::string& error) {
  json j = json::from_msgpack(bytes, true, false);
  if(j.is_discarded()) {
    error = "malformed msgpack frame";
    return std::nullopt;
  }
  try {
    return envelope_from_json(j, error);
  } catch(const json::exception& e) {
    error = std::string("malformed envelope: ") + e.what();
    return std::nullopt;
  }
}

Envelope make_join(const RoomUser& self) {
  return JoinMessage{self.name, self.peer_id};
}

Envelope make_user_list(std::vector<RoomUser> users) {
  return UserListMessage{std::move(users)};
}

Envelope make_user_joined(const RoomUser& user) {
  return UserJoinedMessage{user};
}

Envelope make_user_left(const std::string& peer_id) {
  return UserLeftMessage{peer_id};
}

Envelope make_metadata(const TransferMetadata& metadata) {
  return MetadataMessage{metadata};
}

Envelope make_chunk(const std::string& file_id,
                    std::vector<std::uint8_t> payload,
                    uint64_t index,
                    uint64_t total_chunks) {
  return ChunkMessage{file_id, std::move(payload), index, total_chunks};
}

Envelope make_end(const std::string& file_id) {
  return EndMessage{file_id};
}
