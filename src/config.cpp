#include "config.hpp"

#include <nlohmann/json.hpp>

#include "message.hpp"
#include "settings_manager.hpp"

namespace {

std::vector<std::string> string_list(const nlohmann::json& value, const std::string& key) {
  std::vector<std::string> out;
  if(value.is_null()) return out;
  if(value.is_string()) {
    // a single address given on the command line
    if(!value.get<std::string>().empty()) out.push_back(value.get<std::string>());
    return out;
  }
  if(!value.is_array()) {
    throw ConfigError("Setting '" + key + "' must be a list of strings");
  }
  for(const auto& item : value) {
    if(!item.is_string()) {
      throw ConfigError("Setting '" + key + "' must be a list of strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

uint16_t port_from(int value, const std::string& key) {
  if(value < 0 || value > 65535) {
    throw ConfigError("Invalid " + key + " '" + std::to_string(value) + "'");
  }
  return static_cast<uint16_t>(value);
}

} // namespace

bool SyncConfig::mdns_enabled() const {
  return discovery_method.empty() || discovery_method == "mdns" || discovery_method == "all";
}

bool SyncConfig::dht_enabled() const {
  return discovery_method == "dht" || discovery_method == "all" || sync_over_internet;
}

void SyncConfig::validate() const {
  if(!discovery_method.empty() && discovery_method != "mdns" && discovery_method != "dht" &&
     discovery_method != "manual" && discovery_method != "all") {
    throw ConfigError("Unknown discovery_method '" + discovery_method + "' (expected mdns, dht, manual or all)");
  }
  if(max_stored_peers == 0) {
    throw ConfigError("max_stored_peers must be positive");
  }
  if(pairing_timeout.count() < 0) {
    throw ConfigError("pairing_timeout must not be negative");
  }
  if(pairing_request_timeout.count() <= 0) {
    throw ConfigError("pairing_request_timeout must be positive");
  }
  if(dht_lookup_interval.count() <= 0) {
    throw ConfigError("dht_lookup_interval must be positive");
  }
  if(!transport.empty()) {
    if(broker_url.empty()) {
      throw ConfigError("broker_url must be set when a transport is configured");
    }
    if(qos < 0 || qos > 1) {
      throw ConfigError("qos must be 0 or 1");
    }
    if(keepalive.count() <= 0 || keepalive.count() > 65535) {
      throw ConfigError("keepalive must be between 1 and 65535 seconds");
    }
    if(reconnect_delay.count() <= 0) {
      throw ConfigError("reconnect_delay must be positive");
    }
    if(!password.empty() && username.empty()) {
      throw ConfigError("password requires a username");
    }
    if(!is_valid_topic_segment(topic_prefix)) {
      throw ConfigError("topic_prefix '" + topic_prefix + "' must be one non-empty topic level without '/', '+' or '#'");
    }
    for(const auto& group : groups) {
      if(!group.empty() && !is_valid_topic_segment(group)) {
        throw ConfigError("Invalid group name '" + group + "'");
      }
    }
  }
}

SyncConfig SyncConfig::from_settings(const SettingsManager& settings,
                                     const std::filesystem::path& base_dir) {
  SyncConfig cfg;
  auto data_dir = settings.get<std::string>("data_dir");
  cfg.data_dir = data_dir.empty()
    ? base_dir / ".clipsync"
    : base_dir / std::filesystem::path(data_dir);

  cfg.peer_id = settings.get<std::string>("peer_id");
  cfg.listen_ip = settings.get<std::string>("listen_ip");
  cfg.listen_port = port_from(settings.get<int>("listen_port"), "listen_port");
  cfg.advertise_ip = settings.get<std::string>("advertise_ip");
  cfg.device_name = settings.get<std::string>("device_name");
  cfg.device_type = settings.get<std::string>("device_type");

  cfg.discovery_method = SettingsManager::to_lower(settings.get<std::string>("discovery_method"));
  cfg.sync_over_internet = settings.get<bool>("sync_over_internet");
  cfg.bootstrap_peers = string_list(settings.get<nlohmann::json>("bootstrap_peers"), "bootstrap_peers");
  cfg.manual_peers = string_list(settings.get<nlohmann::json>("manual_peers"), "manual_peers");
  cfg.persist_peers = settings.get<bool>("persist_peers");

  auto peers_path = settings.get<std::string>("peers_path");
  cfg.peers_path = peers_path.empty() ? cfg.data_dir / "peers.json" : base_dir / std::filesystem::path(peers_path);
  auto paired_path = settings.get<std::string>("paired_devices_path");
  cfg.paired_devices_path = paired_path.empty()
    ? cfg.data_dir / "paired_devices.json"
    : base_dir / std::filesystem::path(paired_path);
  cfg.identity_path = cfg.data_dir / "identity.json";

  int max_peers = settings.get<int>("max_stored_peers");
  cfg.max_stored_peers = max_peers > 0 ? static_cast<std::size_t>(max_peers) : 0;
  cfg.mdns_service = settings.get<std::string>("mdns_service");
  cfg.mdns_port = port_from(settings.get<int>("mdns_port"), "mdns_port");
  cfg.dht_lookup_interval = std::chrono::seconds(settings.get<int>("dht_lookup_interval"));

  cfg.pairing_timeout = std::chrono::seconds(settings.get<int>("pairing_timeout"));
  cfg.pairing_request_timeout = std::chrono::seconds(settings.get<int>("pairing_request_timeout"));

  cfg.transport = SettingsManager::to_lower(settings.get<std::string>("transport"));
  cfg.broker_url = settings.get<std::string>("broker_url");
  cfg.client_id = settings.get<std::string>("client_id");
  cfg.username = settings.get<std::string>("username");
  cfg.password = settings.get<std::string>("password");
  cfg.topic_prefix = settings.get<std::string>("topic_prefix");
  cfg.qos = settings.get<int>("qos");
  cfg.keepalive = std::chrono::seconds(settings.get<int>("keepalive"));
  cfg.reconnect_delay = std::chrono::seconds(settings.get<int>("reconnect_delay"));
  cfg.groups = string_list(settings.get<nlohmann::json>("groups"), "groups");

  cfg.log_file = settings.get<std::string>("log_file");
  cfg.verbose = settings.get<bool>("verbose");
  return cfg;
}
