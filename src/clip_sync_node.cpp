#include "clip_sync_node.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <fstream>
#include <set>
#include <stdexcept>
#include <unistd.h>

#include "discovery_manager.hpp"
#include "manual_discovery.hpp"
#include "settings_manager.hpp"
#include "tcp_peer_host.hpp"
#include "utils.hpp"

namespace {

std::string host_name() {
  char buf[256] = {0};
  if(gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "clipsync-device";
  }
  return buf;
}

// Reads the persisted peer id, creating one on first run.
std::string load_or_create_peer_id(const SyncConfig& config, Logger& logger) {
  if(!config.peer_id.empty()) return config.peer_id;

  std::error_code ec;
  if(std::filesystem::exists(config.identity_path, ec)) {
    try {
      std::ifstream in(config.identity_path);
      auto doc = nlohmann::json::parse(in);
      auto id = doc.value("peer_id", "");
      if(!id.empty()) return id;
      logger.warn("Identity file {} has no peer_id, creating a new identity", config.identity_path.string());
    } catch(const std::exception& e) {
      logger.warn("Unreadable identity file {}: {}", config.identity_path.string(), e.what());
    }
  }

  auto id = "cs-" + random_hex(16);
  if(config.identity_path.has_parent_path()) {
    std::filesystem::create_directories(config.identity_path.parent_path(), ec);
  }
  std::ofstream out(config.identity_path, std::ios::trunc);
  if(out) {
    out << nlohmann::json{{"peer_id", id}, {"created", format_rfc3339(utc_now())}}.dump(2);
  }
  if(!out) {
    logger.warn("Unable to persist identity to {}", config.identity_path.string());
  } else {
    logger.info("Created new identity {}", id);
  }
  return id;
}

} // namespace

ClipSyncNode::ClipSyncNode(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("clipsync")) {
  if(options_.peer_save_interval.count() <= 0) {
    options_.peer_save_interval = std::chrono::seconds(300);
  }
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  register_builtin_transports(transports_);
}

ClipSyncNode::~ClipSyncNode() {
  stop();
}

void ClipSyncNode::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
}

void ClipSyncNode::require_state() const {
  if(!loaded_) throw std::logic_error("node state is not loaded");
}

void ClipSyncNode::load_state() {
  if(loaded_) return;
  ensure_workspace();

  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "clipsync.json");
  }
  config_ = SyncConfig::from_settings(*settings_, options_.workspace_root);
  config_.validate();
  init(config_.verbose, config_.log_file);

  peer_id_ = load_or_create_peer_id(config_, *logger_);
  logger_->set_name(short_id(peer_id_, 11));
  if(config_.device_name.empty()) config_.device_name = host_name();

  TcpPeerHost::Options host_options;
  host_options.peer_id = peer_id_;
  host_options.listen_ip = config_.listen_ip;
  host_options.listen_port = config_.listen_port;
  host_options.advertise_ip = config_.advertise_ip;
  host_ = std::make_unique<TcpPeerHost>(host_options, logger_->child("host"));

  DiscoveryManager::Options discovery_options;
  discovery_options.self_id = peer_id_;
  discovery_options.persist_peers = config_.persist_peers;
  discovery_options.peers_path = config_.peers_path;
  discovery_options.max_stored_peers = config_.max_stored_peers;
  discovery_ = std::make_unique<DiscoveryManager>(discovery_options, logger_->child("discovery"));
  discovery_->load_known_peers();

  PairingManager::Options pairing_options;
  pairing_options.device_name = config_.device_name;
  pairing_options.device_type = config_.device_type;
  pairing_options.registry_path = config_.paired_devices_path;
  pairing_options.persist = true;
  pairing_options.auto_disable = config_.pairing_timeout;
  pairing_options.request_timeout = config_.pairing_request_timeout;
  pairing_ = std::make_unique<PairingManager>(*host_, pairing_options, logger_->child("pairing"));
  pairing_->load_paired_devices();

  loaded_ = true;
}

void ClipSyncNode::start() {
  if(started_) return;
  load_state();

  host_->start();
  pairing_->start();

  discovery_->on_peer_discovered([this](const PeerDescriptor& peer){ on_peer_discovered(peer); });
  add_discovery_backends();
  discovery_->start();

  start_transport();

  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
  save_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_peer_save();
  if(options_.install_signal_handlers) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signo){
      if(ec) return;
      logger_->info("Received signal {}, shutting down", signo);
      work_.reset();
      io_.stop();
    });
  }
  started_ = true;
  logger_->info("Node {} ({}) ready at {}", config_.device_name, peer_id_, address());
}

void ClipSyncNode::add_discovery_backends() {
  ManualOptions manual_options;
  std::set<std::string> seen;
  for(const auto& a : config_.manual_peers) {
    if(seen.insert(a).second) manual_options.addresses.push_back(a);
  }
  for(const auto& device : pairing_->paired_devices()) {
    for(const auto& a : device.addresses) {
      if(seen.insert(a).second) manual_options.addresses.push_back(a);
    }
  }
  manual_ = std::make_shared<ManualDiscovery>(*host_, discovery_->reporter(), manual_options,
                                              logger_->child("manual"));
  discovery_->add_backend("manual", manual_);
  pairing_->set_peer_registrar(manual_.get());

  if(config_.mdns_enabled()) {
    MdnsOptions mdns;
    mdns.service_tag = config_.mdns_service;
    mdns.port = config_.mdns_port;
    discovery_->add_backend("mdns", make_discovery_backend(mdns, *host_, discovery_->reporter(), logger_));
  }
  if(config_.dht_enabled()) {
    DhtOptions dht;
    dht.bootstrap_peers = config_.bootstrap_peers;
    dht.lookup_interval = config_.dht_lookup_interval;
    discovery_->add_backend("dht", make_discovery_backend(dht, *host_, discovery_->reporter(), logger_));
  }
}

void ClipSyncNode::start_transport() {
  if(config_.transport.empty()) {
    logger_->info("No transport configured, group sync disabled");
    return;
  }
  TransportOptions options;
  options.broker_url = config_.broker_url;
  options.client_id = config_.client_id.empty() ? peer_id_ : config_.client_id;
  options.username = config_.username;
  options.password = config_.password;
  options.topic_prefix = config_.topic_prefix;
  options.qos = config_.qos;
  options.keepalive = config_.keepalive;
  options.reconnect_delay = config_.reconnect_delay;
  options.device_id = peer_id_;

  transport_ = transports_.create(config_.transport, options, logger_->child(config_.transport));
  transport_->add_handler([this](const Message& message){ on_message(message); });
  for(const auto& group : config_.groups) {
    transport_->join_group(group);
  }
  try {
    transport_->connect();
  } catch(const TransportError& e) {
    logger_->warn("Transport not connected yet: {}", e.what());
  }
}

void ClipSyncNode::schedule_peer_save() {
  if(!save_timer_) return;
  save_timer_->expires_after(options_.peer_save_interval);
  save_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    if(discovery_) discovery_->save_known_peers();
    schedule_peer_save();
  });
}

void ClipSyncNode::on_peer_discovered(const PeerDescriptor& peer) {
  logger_->debug("Discovered {} ({})", peer.name, peer.id);
  if(pairing_ && pairing_->is_paired(peer.id)) {
    pairing_->touch(peer.id, peer.addrs);
  }
}

void ClipSyncNode::on_message(const Message& message) {
  if(!message.is_content()) {
    logger_->debug("Control message {} from {}", to_string(message.type()), message.source());
    return;
  }
  auto content = message.clipboard_content();
  if(!content) {
    logger_->warn("Content message {} from {} has no clipboard payload", message.id(), message.source());
    return;
  }
  std::vector<ContentHandler> handlers;
  {
    std::lock_guard lg(handlers_mutex_);
    handlers = content_handlers_;
  }
  for(const auto& handler : handlers) {
    handler(*content, message);
  }
}

void ClipSyncNode::run() {
  if(!started_) start();
  io_.run();
}

void ClipSyncNode::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void ClipSyncNode::stop() {
  if(!started_) return;
  started_ = false;

  if(save_timer_) {
    std::error_code ec;
    save_timer_->cancel(ec);
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  save_timer_.reset();
  signals_.reset();
  io_.restart();

  if(transport_) transport_->disconnect();
  discovery_->stop();
  discovery_->save_known_peers();
  pairing_->shutdown();
  host_->stop();
  logger_->info("Node stopped");
}

PairingResult ClipSyncNode::pair_with(const std::string& address) {
  require_state();
  return pairing_->request_pairing(address);
}

std::string ClipSyncNode::enable_pairing(PairingRequestHandler handler) {
  require_state();
  return pairing_->enable_pairing(std::move(handler));
}

void ClipSyncNode::disable_pairing() {
  if(pairing_) pairing_->disable_pairing();
}

void ClipSyncNode::send_content(const ClipboardContent& content, const std::string& group) {
  if(!transport_) throw TransportError("no transport configured");
  transport_->send(Message::content(content, peer_id_, group));
}

void ClipSyncNode::add_content_handler(ContentHandler handler) {
  std::lock_guard lg(handlers_mutex_);
  content_handlers_.push_back(std::move(handler));
}

void ClipSyncNode::join_group(const std::string& group) {
  if(!transport_) throw TransportError("no transport configured");
  transport_->join_group(group);
}

void ClipSyncNode::leave_group(const std::string& group) {
  if(!transport_) throw TransportError("no transport configured");
  transport_->leave_group(group);
}

uint16_t ClipSyncNode::listen_port() const {
  return host_ ? host_->listen_port() : 0;
}

std::string ClipSyncNode::address() const {
  if(!host_) return std::string();
  auto addrs = host_->listen_addresses();
  return addrs.empty() ? peer_id_ : addrs.front().to_string();
}

ClipSyncNode::Stats ClipSyncNode::stats() const {
  Stats s;
  if(discovery_) {
    auto peers = discovery_->peers();
    s.known_peers = peers.size();
    if(host_) {
      for(const auto& p : peers) {
        if(host_->is_connected(p.id)) s.connected_peers++;
      }
    }
    s.discovery_backends = discovery_->running_backends();
  }
  if(pairing_) s.paired_devices = pairing_->paired_devices().size();
  if(transport_) {
    s.groups = transport_->list_groups();
    s.transport_connected = transport_->is_connected();
  }
  return s;
}

LogListenerHandle ClipSyncNode::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void ClipSyncNode::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

