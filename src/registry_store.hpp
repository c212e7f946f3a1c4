#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct RegistryEntry {
  std::string peer_id;
  std::string name;
  int64_t updated_at = 0; // unix millis of the last put
};

nlohmann::json registry_entries_to_json(const std::vector<RegistryEntry>& entries);

// Storage behind the discovery registry. Every call returns the room's
// entries after the operation, in first-registration order.
class RegistryStore {
public:
  virtual ~RegistryStore() = default;

  // Sweeps stale entries of the room before reading.
  virtual std::vector<RegistryEntry> get(const std::string& room) = 0;
  // Inserts or refreshes; an existing entry keeps its position.
  virtual std::vector<RegistryEntry> put(const std::string& room,
                                         const std::string& peer_id,
                                         const std::string& name) = 0;
  virtual std::vector<RegistryEntry> remove(const std::string& room, const std::string& peer_id) = 0;
  // Returns the number of entries pruned.
  virtual std::size_t sweep(const std::string& room) = 0;
};

class InMemoryRegistryStore : public RegistryStore {
public:
  using Clock = std::function<int64_t()>;

  explicit InMemoryRegistryStore(std::chrono::milliseconds ttl = std::chrono::hours(1),
                                 Clock clock = nullptr);

  std::vector<RegistryEntry> get(const std::string& room) override;
  std::vector<RegistryEntry> put(const std::string& room,
                                 const std::string& peer_id,
                                 const std::string& name) override;
  std::vector<RegistryEntry> remove(const std::string& room, const std::string& peer_id) override;
  std::size_t sweep(const std::string& room) override;

  std::size_t sweep_all();
  std::size_t room_count() const;

private:
  std::size_t sweep_locked(const std::string& room, int64_t now);
  std::vector<RegistryEntry> snapshot_locked(const std::string& room) const;

  std::chrono::milliseconds ttl_;
  Clock clock_;
  mutable std::mutex m_;
  std::map<std::string, std::vector<RegistryEntry>> rooms_;
};
