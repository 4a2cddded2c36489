#include "kademlia.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <set>
#include <stdexcept>

#include "utils.hpp"

using json = nlohmann::json;

namespace {

std::chrono::milliseconds bounded(std::chrono::milliseconds limit,
                                  KademliaNode::Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - KademliaNode::Clock::now());
  if(left.count() < 1) left = std::chrono::milliseconds(1);
  return std::min(limit, left);
}

int hex_value(char c) {
  if(c >= '0' && c <= '9') return c - '0';
  if(c >= 'a' && c <= 'f') return c - 'a' + 10;
  if(c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

NodeId NodeId::hash_of(const std::string& text) {
  NodeId out;
  auto digest = sha256_bytes(text);
  std::copy(digest.begin(), digest.begin() + kNodeIdBytes, out.bytes.begin());
  return out;
}

NodeId NodeId::from_hex(const std::string& hex) {
  if(hex.size() != kNodeIdBytes * 2) {
    throw std::invalid_argument("node id must be " + std::to_string(kNodeIdBytes * 2) + " hex characters");
  }
  NodeId out;
  for(std::size_t i = 0; i < kNodeIdBytes; ++i) {
    int hi = hex_value(hex[2 * i]);
    int lo = hex_value(hex[2 * i + 1]);
    if(hi < 0 || lo < 0) throw std::invalid_argument("node id is not hex");
    out.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

std::string NodeId::hex() const {
  return hex_from_bytes(std::vector<unsigned char>(bytes.begin(), bytes.end()));
}

bool closer_by_xor(const NodeId& a, const NodeId& b, const NodeId& target) {
  for(std::size_t i = 0; i < kNodeIdBytes; i++) {
    uint8_t xa = a.bytes[i] ^ target.bytes[i];
    uint8_t xb = b.bytes[i] ^ target.bytes[i];
    if(xa != xb) return xa < xb;
  }
  return false;
}

std::size_t common_prefix_length(const NodeId& a, const NodeId& b) {
  std::size_t d = 0;
  for(std::size_t i = 0; i < kNodeIdBytes; i++) {
    uint8_t x = a.bytes[i] ^ b.bytes[i];
    if(!x) { d += 8; continue; }
    while((x & 0x80) == 0) { d++; x <<= 1; }
    break;
  }
  return d;
}

Contact Contact::make(const std::string& peer_id, std::vector<std::string> addrs) {
  Contact c;
  c.peer_id = peer_id;
  c.id = NodeId::hash_of(peer_id);
  c.addrs = std::move(addrs);
  c.last_seen = std::chrono::steady_clock::now();
  return c;
}

// ---- routing table ---------------------------------------------------------

RoutingTable::RoutingTable(NodeId self, std::size_t k)
  : self_(self), k_(k), buckets_(kNodeIdBits) {}

std::size_t RoutingTable::bucket_index(const NodeId& id) const {
  return std::min(common_prefix_length(self_, id), kNodeIdBits - 1);
}

std::optional<Contact> RoutingTable::update(const Contact& contact) {
  std::lock_guard lg(mtx_);
  auto& bucket = buckets_[bucket_index(contact.id)];
  for(auto it = bucket.begin(); it != bucket.end(); ++it) {
    if(it->peer_id != contact.peer_id) continue;
    Contact refreshed = *it;
    if(!contact.addrs.empty()) refreshed.addrs = contact.addrs;
    refreshed.last_seen = std::chrono::steady_clock::now();
    bucket.erase(it);
    bucket.push_back(std::move(refreshed));
    return std::nullopt;
  }
  if(bucket.size() < k_) {
    Contact fresh = contact;
    fresh.last_seen = std::chrono::steady_clock::now();
    bucket.push_back(std::move(fresh));
    return std::nullopt;
  }
  return bucket.front();
}

void RoutingTable::replace(const std::string& stale_peer_id, const Contact& contact) {
  std::lock_guard lg(mtx_);
  auto& bucket = buckets_[bucket_index(contact.id)];
  bucket.erase(std::remove_if(bucket.begin(), bucket.end(),
                              [&](const Contact& c){ return c.peer_id == stale_peer_id; }),
               bucket.end());
  if(bucket.size() < k_) {
    Contact fresh = contact;
    fresh.last_seen = std::chrono::steady_clock::now();
    bucket.push_back(std::move(fresh));
  }
}

void RoutingTable::remove(const std::string& peer_id) {
  std::lock_guard lg(mtx_);
  auto& bucket = buckets_[bucket_index(NodeId::hash_of(peer_id))];
  bucket.erase(std::remove_if(bucket.begin(), bucket.end(),
                              [&](const Contact& c){ return c.peer_id == peer_id; }),
               bucket.end());
}

std::vector<Contact> RoutingTable::nearest(const NodeId& target, std::size_t limit) const {
  std::vector<Contact> all;
  {
    std::lock_guard lg(mtx_);
    for(const auto& bucket : buckets_) {
      all.insert(all.end(), bucket.begin(), bucket.end());
    }
  }
  std::sort(all.begin(), all.end(), [&](const Contact& a, const Contact& b){
    return closer_by_xor(a.id, b.id, target);
  });
  if(all.size() > limit) all.resize(limit);
  return all;
}

std::size_t RoutingTable::size() const {
  std::lock_guard lg(mtx_);
  std::size_t n = 0;
  for(const auto& bucket : buckets_) n += bucket.size();
  return n;
}

// ---- node ------------------------------------------------------------------

KademliaNode::KademliaNode(PeerHost& host, Options options, std::shared_ptr<Logger> logger)
  : host_(host),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("kad")),
    self_(NodeId::hash_of(host.id())),
    table_(self_, options.k) {}

KademliaNode::~KademliaNode() {
  stop();
}

void KademliaNode::start() {
  if(started_) return;
  started_ = true;
  host_.set_stream_handler(kProtocol, [this](std::shared_ptr<Stream> stream){
    handle_stream(std::move(stream));
  });
}

void KademliaNode::stop() {
  if(!started_) return;
  started_ = false;
  host_.remove_stream_handler(kProtocol);
}

Contact KademliaNode::self_contact() const {
  std::vector<std::string> addrs;
  for(const auto& a : host_.listen_addresses()) addrs.push_back(a.to_string());
  return Contact::make(host_.id(), std::move(addrs));
}

json KademliaNode::contacts_to_json(const std::vector<Contact>& contacts) const {
  json out = json::array();
  for(const auto& c : contacts) {
    out.push_back({{"id", c.peer_id}, {"addrs", c.addrs}});
  }
  return out;
}

std::vector<Contact> KademliaNode::contacts_from_json(const json& list) const {
  std::vector<Contact> out;
  if(!list.is_array()) return out;
  for(const auto& entry : list) {
    if(!entry.is_object() || !entry.contains("id") || !entry.at("id").is_string()) continue;
    std::vector<std::string> addrs;
    if(entry.contains("addrs") && entry.at("addrs").is_array()) {
      for(const auto& a : entry.at("addrs")) {
        if(a.is_string()) addrs.push_back(a.get<std::string>());
      }
    }
    auto id = entry.at("id").get<std::string>();
    if(id.empty()) continue;
    out.push_back(Contact::make(id, std::move(addrs)));
  }
  return out;
}

void KademliaNode::add_contact(const Contact& contact) {
  if(contact.peer_id.empty() || contact.peer_id == host_.id()) return;
  auto stale = table_.update(contact);
  if(stale && !ping(*stale)) {
    logger_->debug("Replacing unresponsive contact {} with {}", stale->peer_id, contact.peer_id);
    table_.replace(stale->peer_id, contact);
  }
}

bool KademliaNode::ping(const Contact& contact) {
  try {
    rpc(contact, json{{"type", "PING"}}, Clock::now() + options_.rpc_timeout);
    return true;
  } catch(const std::exception& e) {
    logger_->debug("Ping {} failed: {}", contact.peer_id, e.what());
    return false;
  }
}

json KademliaNode::rpc(const Contact& to, const json& request, Clock::time_point deadline) {
  std::vector<PeerAddress> addrs;
  for(const auto& text : to.addrs) {
    try {
      addrs.push_back(PeerAddress::parse(text));
    } catch(const std::invalid_argument&) {
      // unusable address from a remote table
    }
  }
  host_.add_addresses(to.peer_id, addrs);

  auto timeout = bounded(options_.rpc_timeout, deadline);
  auto stream = host_.open_stream(to.peer_id, kProtocol, timeout);
  stream->write_line(request.dump());
  auto line = stream->read_line(bounded(options_.rpc_timeout, deadline));
  stream->close();
  auto reply = json::parse(line);
  if(reply.contains("error")) {
    throw std::runtime_error("remote error: " + reply.at("error").dump());
  }
  return reply;
}

void KademliaNode::handle_stream(std::shared_ptr<Stream> stream) {
  try {
    auto request = json::parse(stream->read_line(options_.rpc_timeout));
    std::vector<std::string> addrs;
    for(const auto& a : host_.addresses_of(stream->remote_peer_id())) addrs.push_back(a.to_string());
    auto from = Contact::make(stream->remote_peer_id(), std::move(addrs));
    stream->write_line(handle_request(from, request).dump());
    stream->close();
    add_contact(from);
  } catch(const std::exception& e) {
    logger_->debug("DHT request from {} failed: {}", stream->remote_peer_id(), e.what());
    stream->close();
  }
}

json KademliaNode::handle_request(const Contact& from, const json& request) {
  auto type = request.value("type", "");
  if(type == "PING") {
    return json{{"ok", true}};
  }
  if(type == "FIND_NODE" || type == "GET_PROVIDERS") {
    auto key = NodeId::from_hex(request.value("key", ""));
    auto closer = table_.nearest(key, options_.k + 1);
    closer.erase(std::remove_if(closer.begin(), closer.end(),
                                [&](const Contact& c){ return c.peer_id == from.peer_id; }),
                 closer.end());
    if(closer.size() > options_.k) closer.resize(options_.k);
    json reply{{"closer", contacts_to_json(closer)}};
    if(type == "GET_PROVIDERS") {
      reply["providers"] = contacts_to_json(local_providers(key, options_.k));
    }
    return reply;
  }
  if(type == "ADD_PROVIDER") {
    auto key = NodeId::from_hex(request.value("key", ""));
    auto providers = contacts_from_json(json::array({request.value("provider", json::object())}));
    if(providers.empty() || providers.front().peer_id != from.peer_id) {
      return json{{"error", "provider record must name the sender"}};
    }
    auto provider = providers.front();
    if(provider.addrs.empty()) provider.addrs = from.addrs;
    if(!store_provider(key, provider)) {
      return json{{"error", "provider store is full"}};
    }
    return json{{"ok", true}};
  }
  return json{{"error", "unknown request type '" + type + "'"}};
}

bool KademliaNode::store_provider(const NodeId& key, const Contact& provider) {
  std::lock_guard lg(providers_mutex_);
  auto now = Clock::now();
  auto hex = key.hex();
  if(providers_.count(hex) == 0 && providers_.size() >= options_.max_provider_keys) {
    expire_providers_locked(now);
    if(providers_.size() >= options_.max_provider_keys) {
      logger_->debug("Provider store full, dropping record for key {}", short_id(hex));
      return false;
    }
  }
  auto& records = providers_[hex];
  if(records.count(provider.peer_id) == 0 && records.size() >= options_.max_providers_per_key) {
    // Replace the record closest to expiry.
    auto oldest = std::min_element(records.begin(), records.end(), [](const auto& a, const auto& b){
      return a.second.expires < b.second.expires;
    });
    records.erase(oldest);
  }
  records[provider.peer_id] = ProviderRecord{provider, now + options_.provider_ttl};
  return true;
}

std::size_t KademliaNode::expire_providers_locked(Clock::time_point now) {
  std::size_t removed = 0;
  for(auto key = providers_.begin(); key != providers_.end();) {
    auto& records = key->second;
    for(auto rec = records.begin(); rec != records.end();) {
      if(rec->second.expires <= now) {
        rec = records.erase(rec);
        removed++;
      } else {
        ++rec;
      }
    }
    key = records.empty() ? providers_.erase(key) : std::next(key);
  }
  return removed;
}

std::size_t KademliaNode::expire_providers() {
  std::lock_guard lg(providers_mutex_);
  return expire_providers_locked(Clock::now());
}

std::size_t KademliaNode::provider_record_count() const {
  std::lock_guard lg(providers_mutex_);
  std::size_t count = 0;
  for(const auto& entry : providers_) count += entry.second.size();
  return count;
}

std::vector<Contact> KademliaNode::local_providers(const NodeId& key, std::size_t max) {
  std::lock_guard lg(providers_mutex_);
  std::vector<Contact> out;
  auto it = providers_.find(key.hex());
  if(it == providers_.end()) return out;
  auto now = Clock::now();
  for(auto rec = it->second.begin(); rec != it->second.end();) {
    if(rec->second.expires <= now) {
      rec = it->second.erase(rec);
      continue;
    }
    if(out.size() < max) out.push_back(rec->second.contact);
    ++rec;
  }
  return out;
}

template<typename OnReply>
std::vector<Contact> KademliaNode::iterate(const NodeId& target,
                                           const json& request,
                                           Clock::time_point deadline,
                                           OnReply on_reply) {
  auto by_distance = [&](const Contact& a, const Contact& b){ return closer_by_xor(a.id, b.id, target); };
  std::vector<Contact> shortlist = table_.nearest(target, options_.k);
  std::set<std::string> queried;
  std::set<std::string> failed;

  while(Clock::now() < deadline) {
    std::vector<Contact> batch;
    for(const auto& c : shortlist) {
      if(batch.size() >= options_.alpha) break;
      if(!queried.count(c.peer_id)) batch.push_back(c);
    }
    if(batch.empty()) break;

    std::vector<std::future<std::optional<json>>> replies;
    for(const auto& c : batch) {
      queried.insert(c.peer_id);
      replies.push_back(std::async(std::launch::async, [this, c, &request, deadline]() -> std::optional<json> {
        try {
          return rpc(c, request, deadline);
        } catch(const std::exception& e) {
          logger_->debug("DHT {} to {} failed: {}", request.value("type", ""), c.peer_id, e.what());
          return std::nullopt;
        }
      }));
    }

    bool done = false;
    for(std::size_t i = 0; i < batch.size(); ++i) {
      auto reply = replies[i].get();
      if(!reply) {
        failed.insert(batch[i].peer_id);
        table_.remove(batch[i].peer_id);
        continue;
      }
      add_contact(batch[i]);
      if(on_reply(batch[i], *reply)) done = true;
      for(auto& c : contacts_from_json(reply->value("closer", json::array()))) {
        if(c.peer_id == host_.id() || failed.count(c.peer_id)) continue;
        bool known = std::any_of(shortlist.begin(), shortlist.end(),
                                 [&](const Contact& s){ return s.peer_id == c.peer_id; });
        if(!known) shortlist.push_back(std::move(c));
      }
    }
    shortlist.erase(std::remove_if(shortlist.begin(), shortlist.end(),
                                   [&](const Contact& c){ return failed.count(c.peer_id) > 0; }),
                    shortlist.end());
    std::sort(shortlist.begin(), shortlist.end(), by_distance);
    if(shortlist.size() > options_.k) shortlist.resize(options_.k);
    if(done) break;
  }
  return shortlist;
}

void KademliaNode::bootstrap(Clock::time_point deadline) {
  if(table_.size() == 0) {
    throw std::runtime_error("routing table is empty");
  }
  auto found = find_closest(self_, deadline);
  if(table_.size() == 0) {
    throw std::runtime_error("no bootstrap contact answered");
  }
  logger_->info("DHT bootstrap complete: {} contacts, {} close peers", table_.size(), found.size());
}

std::vector<Contact> KademliaNode::find_closest(const NodeId& target, Clock::time_point deadline) {
  return iterate(target, json{{"type", "FIND_NODE"}, {"key", target.hex()}}, deadline,
                 [](const Contact&, const json&){ return false; });
}

std::size_t KademliaNode::provide(const NodeId& key, Clock::time_point deadline) {
  auto me = self_contact();
  if(!store_provider(key, me)) {
    logger_->debug("Local provider store full, not keeping own record for {}", key.hex());
  }
  auto closest = find_closest(key, deadline);
  json request{{"type", "ADD_PROVIDER"},
               {"key", key.hex()},
               {"provider", {{"id", me.peer_id}, {"addrs", me.addrs}}}};
  std::vector<std::future<bool>> acks;
  for(const auto& c : closest) {
    acks.push_back(std::async(std::launch::async, [this, c, &request, deadline]{
      try {
        rpc(c, request, deadline);
        return true;
      } catch(const std::exception& e) {
        logger_->debug("ADD_PROVIDER to {} failed: {}", c.peer_id, e.what());
        return false;
      }
    }));
  }
  std::size_t stored = 0;
  for(auto& f : acks) {
    if(f.get()) stored++;
  }
  return stored;
}

std::vector<Contact> KademliaNode::find_providers(const NodeId& key,
                                                  std::size_t max,
                                                  Clock::time_point deadline) {
  std::map<std::string, Contact> found;
  for(auto& c : local_providers(key, max)) found.emplace(c.peer_id, std::move(c));
  if(found.size() < max) {
    iterate(key, json{{"type", "GET_PROVIDERS"}, {"key", key.hex()}}, deadline,
            [&](const Contact&, const json& reply){
              for(auto& p : contacts_from_json(reply.value("providers", json::array()))) {
                if(found.size() >= max) break;
                found.emplace(p.peer_id, std::move(p));
              }
              return found.size() >= max;
            });
  }
  std::vector<Contact> out;
  for(auto& entry : found) out.push_back(std::move(entry.second));
  return out;
}
