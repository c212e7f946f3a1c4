#include "command_line_parser.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

using namespace roomdrop::test;

namespace {

std::optional<Envelope> roundtrip(const Envelope& envelope) {
  auto frame = encode_envelope(envelope);
  std::string error;
  return decode_envelope(*frame, error);
}

std::optional<Envelope> decode_json(const nlohmann::json& j, std::string& error) {
  auto bytes = nlohmann::json::to_msgpack(j);
  return decode_envelope(bytes, error);
}

bool test_user_list_keeps_order(TestContext&) {
  auto decoded = roundtrip(make_user_list({{"p3", "Carol"}, {"p1", "Alice"}, {"p2", "Bob"}}));
  ROOMDROP_CHECK(decoded.has_value());
  auto list = std::get_if<UserListMessage>(&*decoded);
  ROOMDROP_CHECK(list != nullptr);
  ROOMDROP_CHECK(list->users.size() == 3);
  ROOMDROP_CHECK(list->users[0].peer_id == "p3");
  ROOMDROP_CHECK(list->users[1].name == "Alice");
  ROOMDROP_CHECK(list->users[2].peer_id == "p2");
  return true;
}

bool test_chunk_carries_binary_payload(TestContext&) {
  std::vector<std::uint8_t> payload = {0x00, 0xff, 0x10, 0x00, 0x7f};
  auto decoded = roundtrip(make_chunk("p1_1_a.bin", payload, 3, 9));
  ROOMDROP_CHECK(decoded.has_value());
  auto chunk = std::get_if<ChunkMessage>(&*decoded);
  ROOMDROP_CHECK(chunk != nullptr);
  ROOMDROP_CHECK(chunk->file_id == "p1_1_a.bin");
  ROOMDROP_CHECK(chunk->payload == payload);
  ROOMDROP_CHECK(chunk->index == 3);
  ROOMDROP_CHECK(chunk->total_chunks == 9);

  auto j = envelope_to_json(make_chunk("f", payload, 0, 1));
  ROOMDROP_CHECK(j.at("type") == "chunk");
  ROOMDROP_CHECK(j.at("payload").is_binary());
  ROOMDROP_CHECK(j.at("fileId") == "f");
  return true;
}

bool test_metadata_fields(TestContext&) {
  TransferMetadata meta;
  meta.file_id = "p1_1700000000000_notes.txt";
  meta.name = "notes.txt";
  meta.size = 150000;
  meta.mime_type = "text/plain";
  meta.sender_id = "p1";
  meta.sender_name = "Alice";
  auto j = envelope_to_json(make_metadata(meta));
  ROOMDROP_CHECK(j.at("type") == "metadata");
  ROOMDROP_CHECK(j.at("payload").at("senderName") == "Alice");
  ROOMDROP_CHECK(j.at("payload").at("type") == "text/plain");

  auto decoded = roundtrip(make_metadata(meta));
  ROOMDROP_CHECK(decoded.has_value());
  auto m = std::get_if<MetadataMessage>(&*decoded);
  ROOMDROP_CHECK(m != nullptr);
  ROOMDROP_CHECK(m->metadata.size == 150000);
  ROOMDROP_CHECK(m->metadata.file_id == meta.file_id);
  ROOMDROP_CHECK(m->metadata.sender_id == "p1");
  return true;
}

bool test_membership_messages(TestContext&) {
  auto join = roundtrip(make_join({"p9", "Zed"}));
  ROOMDROP_CHECK(join && std::get_if<JoinMessage>(&*join) && std::get<JoinMessage>(*join).peer_id == "p9");
  auto joined = roundtrip(make_user_joined({"p4", "Dana"}));
  ROOMDROP_CHECK(joined && std::get<UserJoinedMessage>(*joined).user.name == "Dana");
  auto left = roundtrip(make_user_left("p4"));
  ROOMDROP_CHECK(left && std::get<UserLeftMessage>(*left).peer_id == "p4");
  auto end = roundtrip(make_end("p1_2_x"));
  ROOMDROP_CHECK(end && std::get<EndMessage>(*end).file_id == "p1_2_x");
  ROOMDROP_CHECK(std::string(envelope_type(*left)) == "user-left");
  return true;
}

bool test_malformed_frames_rejected(TestContext&) {
  std::string error;
  std::vector<std::uint8_t> garbage = {0xc1, 0x00, 0x13};
  ROOMDROP_CHECK(!decode_envelope(garbage, error));
  ROOMDROP_CHECK(!error.empty());

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "shout"}, {"payload", {{"x", 1}}}}, error));
  ROOMDROP_CHECK(error.find("unknown message type") != std::string::npos);

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "metadata"},
                               {"payload", {{"fileId", "f"}, {"name", "n"}, {"size", -5}}}}, error));
  ROOMDROP_CHECK(error.find("size") != std::string::npos);

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "chunk"}, {"fileId", "f"}, {"payload", "text"}}, error));

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "join"}}, error));

  error.clear();
  ROOMDROP_CHECK(!decode_json(nlohmann::json::array({1, 2}), error));

  // fields of the wrong type are dropped, never thrown
  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", 7}, {"payload", nlohmann::json::object()}}, error));
  ROOMDROP_CHECK(error.find("type") != std::string::npos);

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "chunk"}, {"fileId", "f"}, {"index", "0"}, {"totalChunks", 1},
                               {"payload", nlohmann::json::binary({1, 2, 3})}}, error));
  ROOMDROP_CHECK(error.find("index") != std::string::npos);

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "chunk"}, {"fileId", "f"}, {"index", 0},
                               {"payload", nlohmann::json::binary({1, 2, 3})}}, error));
  ROOMDROP_CHECK(error.find("totalChunks") != std::string::npos);

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "metadata"},
                               {"payload", {{"fileId", "f"}, {"name", "n"}, {"size", 3}, {"senderId", 12}}}}, error));

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "join"}, {"payload", {{"peerId", 5}, {"name", "x"}}}}, error));

  error.clear();
  ROOMDROP_CHECK(!decode_json({{"type", "user-joined"}, {"payload", {{"peerId", "p1"}, {"name", false}}}}, error));

  // a bad entry in a user list is skipped, the rest survive
  error.clear();
  auto list = decode_json({{"type", "user-list"},
                           {"payload", nlohmann::json::array({{{"peerId", 5}, {"name", "x"}},
                                                              {{"peerId", "p2"}, {"name", "Bob"}}})}}, error);
  ROOMDROP_CHECK(list.has_value());
  const auto& users = std::get<UserListMessage>(*list).users;
  ROOMDROP_CHECK(users.size() == 1);
  ROOMDROP_CHECK(users[0].peer_id == "p2");
  return true;
}

bool test_settings_validation(TestContext&) {
  SettingsManager settings;
  std::string error;
  ROOMDROP_CHECK(settings.get<int>("chunk_size") == 65536);
  ROOMDROP_CHECK(!settings.set_from_string("chunk_size", "12", error));
  ROOMDROP_CHECK(!error.empty());
  ROOMDROP_CHECK(settings.get<int>("chunk_size") == 65536);
  ROOMDROP_CHECK(!settings.set_from_string("listen_port", "80x", error));
  ROOMDROP_CHECK(settings.set_from_string("transfer_debug", "on", error));
  ROOMDROP_CHECK(settings.get<bool>("transfer_debug"));
  ROOMDROP_CHECK(!settings.set_from_string("auto_join", "maybe", error));

  auto resolved = settings.resolve_key("display_name");
  ROOMDROP_CHECK(resolved && *resolved == "name");
  ROOMDROP_CHECK(!settings.resolve_key("no_such_thing"));

  SettingsManager registry(REGISTRY_SETTINGS_SPECIFICATION);
  ROOMDROP_CHECK(registry.get<int>("listen_port") == 8080);
  ROOMDROP_CHECK(registry.get<int>("sweep_interval_seconds") == 300);
  ROOMDROP_CHECK(!registry.has("room"));
  return true;
}

bool test_settings_persist(TestContext&) {
  auto dir = std::filesystem::temp_directory_path() / "roomdrop_protocol_runner";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::string error;

  SettingsManager settings;
  settings.set_settings_path(dir / ".config" / "settings.json");
  ROOMDROP_CHECK(settings.set_from_string("room", "lobby", error));
  ROOMDROP_CHECK(settings.set_from_string("help", "true", error));
  ROOMDROP_CHECK(settings.save());

  SettingsManager reloaded;
  reloaded.set_settings_path(dir / ".config" / "settings.json");
  ROOMDROP_CHECK(reloaded.load());
  ROOMDROP_CHECK(reloaded.get<std::string>("room") == "lobby");
  ROOMDROP_CHECK(!reloaded.help_requested());
  std::filesystem::remove_all(dir, ec);
  return true;
}

bool test_command_line(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("roomdrop", "test", {"room", "name", "discovery_url"});
  std::string error;

  std::vector<std::string> args = {"roomdrop", "lobby", "Alice", "--chunk_size=16384", "-v", "--lp", "4555"};
  std::vector<char*> argv;
  for(auto& a : args) argv.push_back(a.data());
  ROOMDROP_CHECK(parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error));
  ROOMDROP_CHECK(settings.get<std::string>("room") == "lobby");
  ROOMDROP_CHECK(settings.get<std::string>("name") == "Alice");
  ROOMDROP_CHECK(settings.get<int>("chunk_size") == 16384);
  ROOMDROP_CHECK(settings.get<bool>("verbose"));
  ROOMDROP_CHECK(settings.get<int>("listen_port") == 4555);

  std::vector<std::string> bad = {"roomdrop", "--bogus", "1"};
  std::vector<char*> bad_argv;
  for(auto& a : bad) bad_argv.push_back(a.data());
  ROOMDROP_CHECK(!parser.parse(static_cast<int>(bad_argv.size()), bad_argv.data(), settings, error));
  ROOMDROP_CHECK(error.find("--bogus") != std::string::npos);

  std::vector<std::string> extra = {"roomdrop", "a", "b", "http://h:1", "surplus"};
  std::vector<char*> extra_argv;
  for(auto& a : extra) extra_argv.push_back(a.data());
  ROOMDROP_CHECK(!parser.parse(static_cast<int>(extra_argv.size()), extra_argv.data(), settings, error));
  return true;
}

bool test_utils(TestContext&) {
  ROOMDROP_CHECK(sha256_hex(std::string("abc")) ==
                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  ROOMDROP_CHECK(format_percent(65536.0 / 150000.0 * 100.0) == "43.69%");
  ROOMDROP_CHECK(format_bytes(512) == "512 B");
  ROOMDROP_CHECK(format_bytes(1536) == "1.50 KB");
  ROOMDROP_CHECK(guess_mime_type("Photo.JPG") == "image/jpeg");
  ROOMDROP_CHECK(guess_mime_type("README") == "application/octet-stream");
  ROOMDROP_CHECK(make_file_id("p1", 1700000000000, "a.txt") == "p1_1700000000000_a.txt");
  ROOMDROP_CHECK(percent_encode("team room/1") == "team%20room%2F1");
  ROOMDROP_CHECK(percent_decode("team%20room%2F1") == "team room/1");
  ROOMDROP_CHECK(percent_decode("100%") == "100%");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"user_list_keeps_order", test_user_list_keeps_order},
    {"chunk_carries_binary_payload", test_chunk_carries_binary_payload},
    {"metadata_fields", test_metadata_fields},
    {"membership_messages", test_membership_messages},
    {"malformed_frames_rejected", test_malformed_frames_rejected},
    {"settings_validation", test_settings_validation},
    {"settings_persist", test_settings_persist},
    {"command_line", test_command_line},
    {"utils", test_utils},
  };
  return run_test_cases("protocol", std::move(tests), argc, argv);
}
