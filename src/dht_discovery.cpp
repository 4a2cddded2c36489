#include "dht_discovery.hpp"

#include <future>
#include <vector>

namespace {

KademliaNode::Options node_options(const DhtOptions& options) {
  KademliaNode::Options out;
  out.rpc_timeout = options.rpc_timeout;
  return out;
}

} // namespace

DhtDiscovery::DhtDiscovery(PeerHost& host,
                           PeerDiscoveredCallback report,
                           DhtOptions options,
                           std::shared_ptr<Logger> logger)
  : host_(host),
    report_(std::move(report)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("dht")),
    rendezvous_(NodeId::hash_of(options_.rendezvous)),
    node_(host, node_options(options_), logger_) {}

DhtDiscovery::~DhtDiscovery() {
  stop();
}

void DhtDiscovery::start(std::shared_ptr<Context> ctx) {
  {
    std::lock_guard lg(m_);
    if(ctx_) return;
    ctx_ = ctx;
    connect_pool_ = std::make_unique<asio::thread_pool>(4);
  }
  node_.start();
  connect_bootstrap_peers();

  try {
    node_.bootstrap(KademliaNode::Clock::now() + options_.bootstrap_timeout);
  } catch(const std::exception& e) {
    logger_->warn("DHT bootstrap failed: {}", e.what());
  }

  loop_ = std::thread([this, ctx]{ run_loop(ctx); });
  logger_->info("DHT discovery started, rendezvous {}", options_.rendezvous);
}

void DhtDiscovery::stop() {
  std::unique_ptr<asio::thread_pool> pool;
  {
    std::lock_guard lg(m_);
    if(!ctx_) return;
    ctx_->cancel();
    ctx_.reset();
    pool = std::move(connect_pool_);
  }
  if(loop_.joinable()) loop_.join();
  if(pool) {
    pool->stop();
    pool->join();
  }
  node_.stop();
  logger_->info("DHT discovery stopped");
}

void DhtDiscovery::connect_bootstrap_peers() {
  std::shared_ptr<Context> ctx;
  {
    std::lock_guard lg(m_);
    ctx = ctx_;
  }
  if(!ctx) return;
  std::vector<std::future<void>> attempts;
  for(const auto& text : options_.bootstrap_peers) {
    attempts.push_back(std::async(std::launch::async, [this, text, ctx]{
      try {
        auto address = PeerAddress::parse(text);
        auto peer_id = host_.connect(address, options_.bootstrap_timeout, *ctx);
        if(peer_id == host_.id()) return;
        std::vector<std::string> addrs;
        for(const auto& a : host_.addresses_of(peer_id)) addrs.push_back(a.to_string());
        node_.add_contact(Contact::make(peer_id, std::move(addrs)));
        logger_->info("Connected to bootstrap peer {}", peer_id);
      } catch(const std::exception& e) {
        logger_->warn("Failed to connect to bootstrap peer {}: {}", text, e.what());
      }
    }));
  }
  for(auto& f : attempts) f.wait();
}

std::size_t DhtDiscovery::lookup_once() {
  try {
    auto stored = node_.provide(rendezvous_, KademliaNode::Clock::now() + options_.lookup_timeout);
    logger_->debug("Advertised on {} DHT nodes", stored);
  } catch(const std::exception& e) {
    logger_->warn("Failed to advertise on DHT: {}", e.what());
  }

  auto providers = node_.find_providers(rendezvous_, options_.max_providers,
                                        KademliaNode::Clock::now() + options_.lookup_timeout);
  std::size_t reported = 0;
  for(const auto& provider : providers) {
    if(provider.peer_id == host_.id()) continue;

    PeerDescriptor peer;
    peer.id = provider.peer_id;
    peer.name = "DHT-Peer-" + short_id(provider.peer_id);
    peer.addrs = provider.addrs;
    peer.last_seen = utc_now();
    peer.capabilities["discovery"] = "dht";
    peer.device_type = "unknown";
    if(report_) report_(peer);
    reported++;
    connect_in_background(peer);
  }
  logger_->debug("DHT lookup found {} peers", reported);
  return reported;
}

void DhtDiscovery::run_loop(std::shared_ptr<Context> ctx) {
  while(!ctx->cancelled()) {
    auto expired = node_.expire_providers();
    if(expired > 0) logger_->debug("Expired {} DHT provider records", expired);
    try {
      lookup_once();
    } catch(const std::exception& e) {
      logger_->warn("DHT lookup failed: {}", e.what());
    }
    if(ctx->wait_for(options_.lookup_interval)) break;
  }
}

void DhtDiscovery::connect_in_background(const PeerDescriptor& peer) {
  std::lock_guard lg(m_);
  if(!connect_pool_ || !ctx_ || host_.is_connected(peer.id)) return;
  asio::post(*connect_pool_, [this, peer, ctx = ctx_]{
    for(const auto& text : peer.addrs) {
      if(ctx->cancelled()) return;
      try {
        host_.connect(PeerAddress::parse(text).with_peer_id(peer.id), options_.connect_timeout, *ctx);
        logger_->debug("Connected to DHT peer {}", peer.id);
        return;
      } catch(const std::exception& e) {
        logger_->debug("Failed to connect to DHT peer {} at {}: {}", peer.id, text, e.what());
      }
    }
  });
}
