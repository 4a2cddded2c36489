#include "discovery_manager.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

DiscoveryManager::DiscoveryManager(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")) {}

DiscoveryManager::~DiscoveryManager() {
  stop();
}

void DiscoveryManager::add_backend(const std::string& name, std::shared_ptr<DiscoveryBackend> backend) {
  if(!backend) return;
  std::lock_guard lg(backends_mutex_);
  backends_[name] = std::move(backend);
  logger_->debug("Registered discovery backend {}", name);
}

std::shared_ptr<DiscoveryBackend> DiscoveryManager::backend(const std::string& name) const {
  std::lock_guard lg(backends_mutex_);
  auto it = backends_.find(name);
  return it == backends_.end() ? nullptr : it->second;
}

std::vector<std::string> DiscoveryManager::backend_names() const {
  std::lock_guard lg(backends_mutex_);
  std::vector<std::string> out;
  for(const auto& entry : backends_) out.push_back(entry.first);
  return out;
}

std::vector<std::string> DiscoveryManager::running_backends() const {
  std::lock_guard lg(backends_mutex_);
  return std::vector<std::string>(running_.begin(), running_.end());
}

bool DiscoveryManager::running() const {
  std::lock_guard lg(backends_mutex_);
  return ctx_ != nullptr;
}

void DiscoveryManager::start() {
  std::map<std::string, std::shared_ptr<DiscoveryBackend>> backends;
  std::shared_ptr<Context> ctx;
  {
    std::lock_guard lg(backends_mutex_);
    if(ctx_) return;
    ctx_ = Context::background();
    ctx = ctx_;
    backends = backends_;
  }

  for(const auto& [name, backend] : backends) {
    try {
      backend->start(ctx->child());
      std::lock_guard lg(backends_mutex_);
      running_.insert(name);
      logger_->info("Started discovery backend {}", name);
    } catch(const std::exception& e) {
      logger_->error("Failed to start discovery backend {}: {}", name, e.what());
    }
  }
}

void DiscoveryManager::stop() {
  std::vector<std::pair<std::string, std::shared_ptr<DiscoveryBackend>>> to_stop;
  std::shared_ptr<Context> ctx;
  {
    std::lock_guard lg(backends_mutex_);
    if(!ctx_) return;
    ctx.swap(ctx_);
    for(const auto& name : running_) {
      auto it = backends_.find(name);
      if(it != backends_.end()) to_stop.emplace_back(name, it->second);
    }
    running_.clear();
  }
  ctx->cancel();
  for(auto& [name, backend] : to_stop) {
    try {
      backend->stop();
      logger_->info("Stopped discovery backend {}", name);
    } catch(const std::exception& e) {
      logger_->error("Failed to stop discovery backend {}: {}", name, e.what());
    }
  }
}

void DiscoveryManager::on_peer_discovered(PeerDiscoveredCallback callback) {
  std::lock_guard lg(callback_mutex_);
  callback_ = std::move(callback);
}

PeerDiscoveredCallback DiscoveryManager::reporter() {
  return [this](const PeerDescriptor& peer){ handle_peer_discovered(peer); };
}

void DiscoveryManager::handle_peer_discovered(const PeerDescriptor& sighting) {
  if(sighting.id.empty() || sighting.id == options_.self_id) return;

  PeerDescriptor merged;
  {
    std::lock_guard lg(peers_mutex_);
    auto it = peers_.find(sighting.id);
    if(it == peers_.end()) {
      merged = sighting;
      logger_->info("Discovered peer {} ({})", sighting.id, sighting.name);
    } else {
      merged = it->second;
      if(!sighting.name.empty()) merged.name = sighting.name;
      if(!sighting.addrs.empty()) merged.addrs = sighting.addrs;
      if(!sighting.device_type.empty()) merged.device_type = sighting.device_type;
      if(!sighting.version.empty()) merged.version = sighting.version;
      if(!sighting.groups.empty()) merged.groups = sighting.groups;
      for(const auto& [key, value] : sighting.capabilities) {
        merged.capabilities[key] = value;
      }
    }
    merged.last_seen = sighting.last_seen == TimePoint{} ? utc_now() : sighting.last_seen;
    peers_[merged.id] = merged;
    evict_locked();
  }

  PeerDiscoveredCallback callback;
  {
    std::lock_guard lg(callback_mutex_);
    callback = callback_;
  }
  if(callback) {
    callback(merged);
  }
}

void DiscoveryManager::evict_locked() {
  while(options_.max_stored_peers > 0 && peers_.size() > options_.max_stored_peers) {
    auto oldest = std::min_element(peers_.begin(), peers_.end(),
      [](const auto& a, const auto& b){ return a.second.last_seen < b.second.last_seen; });
    logger_->debug("Evicting least recently seen peer {}", oldest->first);
    peers_.erase(oldest);
  }
}

std::vector<PeerDescriptor> DiscoveryManager::peers() const {
  std::lock_guard lg(peers_mutex_);
  std::vector<PeerDescriptor> out;
  out.reserve(peers_.size());
  for(const auto& entry : peers_) out.push_back(entry.second);
  return out;
}

std::optional<PeerDescriptor> DiscoveryManager::peer(const std::string& id) const {
  std::lock_guard lg(peers_mutex_);
  auto it = peers_.find(id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::size_t DiscoveryManager::peer_count() const {
  std::lock_guard lg(peers_mutex_);
  return peers_.size();
}

bool DiscoveryManager::save_known_peers() const {
  if(!options_.persist_peers || options_.peers_path.empty()) return false;

  nlohmann::json doc = nlohmann::json::object();
  {
    std::lock_guard lg(peers_mutex_);
    for(const auto& [id, peer] : peers_) doc[id] = peer;
  }

  std::lock_guard lg(save_mutex_);
  const auto& path = options_.peers_path;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      logger_->warn("Unable to write known peers to {}", tmp.string());
      return false;
    }
    out << doc.dump(2);
    if(!out) {
      logger_->warn("Failed writing known peers to {}", tmp.string());
      return false;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if(ec) {
    logger_->warn("Unable to replace {}: {}", path.string(), ec.message());
    return false;
  }
  logger_->debug("Saved {} known peers to {}", doc.size(), path.string());
  return true;
}

bool DiscoveryManager::load_known_peers() {
  if(!options_.persist_peers || options_.peers_path.empty()) return false;
  const auto& path = options_.peers_path;
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) {
    logger_->debug("No known peers file at {}", path.string());
    return true;
  }
  std::ifstream in(path);
  if(!in) {
    logger_->warn("Unable to read known peers from {}", path.string());
    return false;
  }
  std::map<std::string, PeerDescriptor> loaded;
  try {
    nlohmann::json doc;
    in >> doc;
    if(!doc.is_object()) throw std::runtime_error("expected an object keyed by peer id");
    for(const auto& item : doc.items()) {
      auto peer = item.value().get<PeerDescriptor>();
      if(peer.id.empty()) peer.id = item.key();
      if(peer.id == options_.self_id) continue;
      loaded[peer.id] = std::move(peer);
    }
  } catch(const std::exception& e) {
    logger_->warn("Ignoring unreadable known peers file {}: {}", path.string(), e.what());
    return false;
  }

  std::lock_guard lg(peers_mutex_);
  for(auto& [id, peer] : loaded) {
    auto it = peers_.find(id);
    if(it == peers_.end() || it->second.last_seen < peer.last_seen) {
      peers_[id] = std::move(peer);
    }
  }
  evict_locked();
  logger_->info("Loaded {} known peers from {}", loaded.size(), path.string());
  return true;
}
