#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "log.hpp"
#include "pairing.hpp"
#include "transport.hpp"

class DiscoveryManager;
class ManualDiscovery;
class SettingsManager;
class TcpPeerHost;

using ContentHandler = std::function<void(const ClipboardContent&, const Message&)>;

// Wires the peer host, discovery, pairing and the group transport
// together for one device.
class ClipSyncNode {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::chrono::seconds peer_save_interval{300};
    bool install_signal_handlers = false;
  };

  ClipSyncNode(std::shared_ptr<SettingsManager> settings, Options options);
  ~ClipSyncNode();

  ClipSyncNode(const ClipSyncNode&) = delete;
  ClipSyncNode& operator=(const ClipSyncNode&) = delete;

  // Resolves configuration and identity and loads persisted peers and
  // paired devices without touching the network. Throws ConfigError.
  void load_state();

  void start();
  void run();
  void start_background();
  void stop();

  PairingResult pair_with(const std::string& address);
  std::string enable_pairing(PairingRequestHandler handler);
  void disable_pairing();

  // Throws TransportError when no transport is configured or connected.
  void send_content(const ClipboardContent& content, const std::string& group = std::string());
  void add_content_handler(ContentHandler handler);
  void join_group(const std::string& group);
  void leave_group(const std::string& group);

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t connected_peers = 0;
    std::size_t paired_devices = 0;
    std::vector<std::string> groups;
    std::vector<std::string> discovery_backends;
    bool transport_connected = false;
  };

  Stats stats() const;

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const SyncConfig& config() const { return config_; }
  const std::string& peer_id() const { return peer_id_; }
  uint16_t listen_port() const;
  std::string address() const;

  TcpPeerHost* peer_host() const { return host_.get(); }
  DiscoveryManager* discovery() const { return discovery_.get(); }
  PairingManager* pairing() const { return pairing_.get(); }
  TransportClient* transport() const { return transport_.get(); }

private:
  void ensure_workspace() const;
  void add_discovery_backends();
  void start_transport();
  void on_message(const Message& message);
  void on_peer_discovered(const PeerDescriptor& peer);
  void schedule_peer_save();
  void require_state() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  SyncConfig config_;
  std::string peer_id_;
  bool loaded_ = false;
  bool started_ = false;

  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::steady_timer> save_timer_;
  std::unique_ptr<asio::signal_set> signals_;
  std::thread io_thread_;

  std::unique_ptr<TcpPeerHost> host_;
  std::unique_ptr<DiscoveryManager> discovery_;
  std::unique_ptr<PairingManager> pairing_;
  std::shared_ptr<ManualDiscovery> manual_;
  TransportRegistry transports_;
  std::unique_ptr<TransportClient> transport_;

  mutable std::mutex handlers_mutex_;
  std::vector<ContentHandler> content_handlers_;
};
