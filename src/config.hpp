#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

class SettingsManager;

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Typed view over the settings table, with paths resolved against data_dir.
struct SyncConfig {
  std::filesystem::path data_dir;
  std::string peer_id;
  std::string listen_ip = "0.0.0.0";
  uint16_t listen_port = 0;
  std::string advertise_ip;
  std::string device_name;
  std::string device_type = "desktop";

  std::string discovery_method = "mdns";
  bool sync_over_internet = false;
  std::vector<std::string> bootstrap_peers;
  std::vector<std::string> manual_peers;
  bool persist_peers = true;
  std::filesystem::path peers_path;
  std::filesystem::path paired_devices_path;
  std::filesystem::path identity_path;
  std::size_t max_stored_peers = 100;
  std::string mdns_service = "clipsync";
  uint16_t mdns_port = 5353;
  std::chrono::seconds dht_lookup_interval{300};

  std::chrono::seconds pairing_timeout{300};
  std::chrono::seconds pairing_request_timeout{30};

  std::string transport = "mqtt";
  std::string broker_url = "tcp://localhost:1883";
  std::string client_id;
  std::string username;
  std::string password;
  std::string topic_prefix = "clipsync";
  int qos = 1;
  std::chrono::seconds keepalive{60};
  std::chrono::seconds reconnect_delay{5};
  std::vector<std::string> groups{"default"};

  std::string log_file;
  bool verbose = false;

  bool mdns_enabled() const;
  bool dht_enabled() const;

  // Throws ConfigError describing the first invalid field.
  void validate() const;

  // Relative paths resolve against base_dir.
  static SyncConfig from_settings(const SettingsManager& settings,
                                  const std::filesystem::path& base_dir = std::filesystem::current_path());
};
