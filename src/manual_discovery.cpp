#include "manual_discovery.hpp"

#include <algorithm>

ManualDiscovery::ManualDiscovery(PeerHost& host,
                                 PeerDiscoveredCallback report,
                                 ManualOptions options,
                                 std::shared_ptr<Logger> logger)
  : host_(host),
    report_(std::move(report)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("manual")) {
  for(const auto& text : options_.addresses) {
    try {
      addresses_.push_back(validate(text));
    } catch(const std::invalid_argument& e) {
      logger_->warn("Ignoring manual peer '{}': {}", text, e.what());
    }
  }
}

ManualDiscovery::~ManualDiscovery() {
  stop();
}

PeerAddress ManualDiscovery::validate(const std::string& address) const {
  auto parsed = PeerAddress::parse(address);
  if(!parsed.peer_id.empty() && parsed.peer_id == host_.id()) {
    throw std::invalid_argument("cannot add self as peer");
  }
  return parsed;
}

void ManualDiscovery::start(std::shared_ptr<Context> ctx) {
  std::vector<PeerAddress> targets;
  {
    std::lock_guard lg(m_);
    if(ctx_) return;
    ctx_ = std::move(ctx);
    targets = addresses_;
  }
  logger_->info("Manual discovery connecting to {} known addresses", targets.size());
  for(const auto& address : targets) {
    launch_connect(address);
  }
}

void ManualDiscovery::stop() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard lg(m_);
    if(!ctx_) return;
    ctx_->cancel();
    ctx_.reset();
    pending.swap(pending_);
  }
  for(auto& f : pending) {
    if(f.valid()) f.wait();
  }
}

void ManualDiscovery::add_peer(const std::string& address) {
  auto parsed = validate(address);
  bool running = false;
  {
    std::lock_guard lg(m_);
    auto it = std::find_if(addresses_.begin(), addresses_.end(),
                           [&](const PeerAddress& a){ return a.same_endpoint(parsed); });
    if(it != addresses_.end()) {
      *it = parsed;
    } else {
      addresses_.push_back(parsed);
    }
    running = ctx_ != nullptr;
  }
  logger_->info("Manually adding peer {}", parsed.to_string());
  if(running) {
    launch_connect(parsed);
  }
}

bool ManualDiscovery::remove_peer(const std::string& peer_id) {
  std::lock_guard lg(m_);
  auto before = addresses_.size();
  addresses_.erase(std::remove_if(addresses_.begin(), addresses_.end(),
                                  [&](const PeerAddress& a){ return a.peer_id == peer_id; }),
                   addresses_.end());
  bool removed = addresses_.size() != before;
  if(removed) logger_->info("Manually removed peer {}", peer_id);
  return removed;
}

std::vector<std::string> ManualDiscovery::addresses() const {
  std::lock_guard lg(m_);
  std::vector<std::string> out;
  for(const auto& a : addresses_) out.push_back(a.to_string());
  return out;
}

void ManualDiscovery::wait_idle() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard lg(m_);
    pending.swap(pending_);
  }
  for(auto& f : pending) {
    if(f.valid()) f.wait();
  }
}

void ManualDiscovery::launch_connect(const PeerAddress& address) {
  std::lock_guard lg(m_);
  if(!ctx_) return;
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [](std::future<void>& f){
                                  return !f.valid() ||
                                    f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                }),
                 pending_.end());
  pending_.push_back(std::async(std::launch::async, [this, address, ctx = ctx_]{
    connect_one(address, *ctx);
  }));
}

void ManualDiscovery::connect_one(const PeerAddress& address, const Context& ctx) {
  try {
    auto peer_id = host_.connect(address, options_.connect_timeout, ctx);
    if(peer_id == host_.id() || ctx.cancelled()) return;

    PeerDescriptor peer;
    peer.id = peer_id;
    peer.name = "Manual-Peer-" + short_id(peer_id);
    peer.addrs = {address.with_peer_id(peer_id).to_string()};
    peer.last_seen = utc_now();
    peer.capabilities["discovery"] = "manual";
    peer.device_type = "unknown";
    logger_->info("Connected to manual peer {}", peer_id);
    if(report_) report_(peer);
  } catch(const std::exception& e) {
    if(ctx.cancelled()) {
      logger_->debug("Connection to manual peer {} abandoned: {}", address.to_string(), e.what());
      return;
    }
    logger_->warn("Failed to connect to manual peer {}: {}", address.to_string(), e.what());
  }
}
