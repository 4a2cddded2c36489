#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "discovery.hpp"
#include "log.hpp"

// Owns the discovery backends and the live peer map.
class DiscoveryManager {
public:
  struct Options {
    std::string self_id;
    bool persist_peers = true;
    std::filesystem::path peers_path;
    std::size_t max_stored_peers = 100;
  };

  DiscoveryManager(Options options, std::shared_ptr<Logger> logger);
  ~DiscoveryManager();

  DiscoveryManager(const DiscoveryManager&) = delete;
  DiscoveryManager& operator=(const DiscoveryManager&) = delete;

  // Replaces any backend already registered under the name.
  void add_backend(const std::string& name, std::shared_ptr<DiscoveryBackend> backend);
  std::shared_ptr<DiscoveryBackend> backend(const std::string& name) const;
  std::vector<std::string> backend_names() const;
  std::vector<std::string> running_backends() const;

  // A backend that fails to start is logged and skipped.
  void start();
  void stop();
  bool running() const;

  void on_peer_discovered(PeerDiscoveredCallback callback);
  // Entry point for backends. Runs the callback on the calling thread.
  void handle_peer_discovered(const PeerDescriptor& peer);
  PeerDiscoveredCallback reporter();

  std::vector<PeerDescriptor> peers() const;
  std::optional<PeerDescriptor> peer(const std::string& id) const;
  std::size_t peer_count() const;

  bool save_known_peers() const;
  bool load_known_peers();

private:
  void evict_locked();

  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex backends_mutex_;
  std::map<std::string, std::shared_ptr<DiscoveryBackend>> backends_;
  std::set<std::string> running_;
  std::shared_ptr<Context> ctx_;

  mutable std::mutex peers_mutex_;
  std::map<std::string, PeerDescriptor> peers_;

  mutable std::mutex callback_mutex_;
  PeerDiscoveredCallback callback_;

  mutable std::mutex save_mutex_;
};
