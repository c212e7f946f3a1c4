#include "registry_store.hpp"

#include <algorithm>

#include "utils.hpp"

nlohmann::json registry_entries_to_json(const std::vector<RegistryEntry>& entries) {
  nlohmann::json peers = nlohmann::json::array();
  for(const auto& e : entries) {
    peers.push_back({{"peerId", e.peer_id}, {"name", e.name}, {"updatedAt", e.updated_at}});
  }
  return peers;
}

InMemoryRegistryStore::InMemoryRegistryStore(std::chrono::milliseconds ttl, Clock clock)
  : ttl_(ttl), clock_(clock ? std::move(clock) : Clock(unix_millis_now)) {}

std::vector<RegistryEntry> InMemoryRegistryStore::snapshot_locked(const std::string& room) const {
  auto it = rooms_.find(room);
  if(it == rooms_.end()) return {};
  return it->second;
}

std::size_t InMemoryRegistryStore::sweep_locked(const std::string& room, int64_t now) {
  auto it = rooms_.find(room);
  if(it == rooms_.end()) return 0;
  auto& entries = it->second;
  const auto before = entries.size();
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const RegistryEntry& e){ return now - e.updated_at > ttl_.count(); }),
                entries.end());
  const auto pruned = before - entries.size();
  if(entries.empty()) rooms_.erase(it);
  return pruned;
}

std::vector<RegistryEntry> InMemoryRegistryStore::get(const std::string& room) {
  std::lock_guard lg(m_);
  sweep_locked(room, clock_());
  return snapshot_locked(room);
}

std::vector<RegistryEntry> InMemoryRegistryStore::put(const std::string& room,
                                                      const std::string& peer_id,
                                                      const std::string& name) {
  std::lock_guard lg(m_);
  auto& entries = rooms_[room];
  auto now = clock_();
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const RegistryEntry& e){ return e.peer_id == peer_id; });
  if(it != entries.end()) {
    it->name = name;
    it->updated_at = now;
  } else {
    entries.push_back(RegistryEntry{peer_id, name, now});
  }
  return entries;
}

std::vector<RegistryEntry> InMemoryRegistryStore::remove(const std::string& room, const std::string& peer_id) {
  std::lock_guard lg(m_);
  auto it = rooms_.find(room);
  if(it == rooms_.end()) return {};
  auto& entries = it->second;
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const RegistryEntry& e){ return e.peer_id == peer_id; }),
                entries.end());
  if(entries.empty()) {
    rooms_.erase(it);
    return {};
  }
  return entries;
}

std::size_t InMemoryRegistryStore::sweep(const std::string& room) {
  std::lock_guard lg(m_);
  return sweep_locked(room, clock_());
}

std::size_t InMemoryRegistryStore::sweep_all() {
  std::lock_guard lg(m_);
  auto now = clock_();
  std::vector<std::string> rooms;
  for(const auto& kv : rooms_) rooms.push_back(kv.first);
  std::size_t pruned = 0;
  for(const auto& room : rooms) pruned += sweep_locked(room, now);
  return pruned;
}

std::size_t InMemoryRegistryStore::room_count() const {
  std::lock_guard lg(m_);
  return rooms_.size();
}
