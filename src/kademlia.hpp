#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "peer_host.hpp"

constexpr std::size_t kNodeIdBytes = 32;
constexpr std::size_t kNodeIdBits = kNodeIdBytes * 8;

struct NodeId {
  std::array<uint8_t, kNodeIdBytes> bytes{};

  // SHA-256 of the peer id or key text.
  static NodeId hash_of(const std::string& text);
  // Throws std::invalid_argument.
  static NodeId from_hex(const std::string& hex);
  std::string hex() const;

  bool operator==(const NodeId& other) const { return bytes == other.bytes; }
  bool operator!=(const NodeId& other) const { return bytes != other.bytes; }
};

// True when a is strictly closer to target than b by XOR metric.
bool closer_by_xor(const NodeId& a, const NodeId& b, const NodeId& target);
std::size_t common_prefix_length(const NodeId& a, const NodeId& b);

struct Contact {
  std::string peer_id;
  NodeId id;
  std::vector<std::string> addrs;
  std::chrono::steady_clock::time_point last_seen{};

  static Contact make(const std::string& peer_id, std::vector<std::string> addrs);
};

class RoutingTable {
public:
  explicit RoutingTable(NodeId self, std::size_t k = 20);

  // Moves a known contact to the tail of its bucket or appends a new one.
  // When the bucket is full, returns its least recently seen contact so the
  // caller can ping it before calling replace().
  std::optional<Contact> update(const Contact& contact);
  void replace(const std::string& stale_peer_id, const Contact& contact);
  void remove(const std::string& peer_id);

  std::vector<Contact> nearest(const NodeId& target, std::size_t limit) const;
  std::size_t size() const;
  std::size_t k() const { return k_; }

private:
  std::size_t bucket_index(const NodeId& id) const;

  NodeId self_;
  std::size_t k_;
  mutable std::mutex mtx_;
  std::vector<std::deque<Contact>> buckets_;
};

// Kademlia node speaking JSON RPCs over PeerHost streams.
class KademliaNode {
public:
  static constexpr const char* kProtocol = "/clipsync/kad/1.0.0";

  struct Options {
    std::size_t k = 20;
    std::size_t alpha = 3;
    std::chrono::milliseconds rpc_timeout{10000};
    std::chrono::seconds provider_ttl{24 * 3600};
    std::size_t max_provider_keys = 1024;
    std::size_t max_providers_per_key = 64;
  };

  using Clock = std::chrono::steady_clock;

  KademliaNode(PeerHost& host, Options options, std::shared_ptr<Logger> logger);
  ~KademliaNode();

  void start();
  void stop();

  const NodeId& self_id() const { return self_; }
  std::size_t routing_table_size() const { return table_.size(); }

  void add_contact(const Contact& contact);
  bool ping(const Contact& contact);

  // Throws std::runtime_error when no contact answers.
  void bootstrap(Clock::time_point deadline);
  std::vector<Contact> find_closest(const NodeId& target, Clock::time_point deadline);
  // Announces this node as a provider of key. Returns the number of remote
  // nodes that stored the record.
  std::size_t provide(const NodeId& key, Clock::time_point deadline);
  std::vector<Contact> find_providers(const NodeId& key, std::size_t max, Clock::time_point deadline);

  // Drops expired provider records. Returns how many were removed.
  std::size_t expire_providers();
  std::size_t provider_record_count() const;

private:
  struct ProviderRecord {
    Contact contact;
    Clock::time_point expires;
  };

  nlohmann::json rpc(const Contact& to, const nlohmann::json& request, Clock::time_point deadline);
  void handle_stream(std::shared_ptr<Stream> stream);
  nlohmann::json handle_request(const Contact& from, const nlohmann::json& request);

  // False when the store is full and the record was not kept.
  bool store_provider(const NodeId& key, const Contact& provider);
  std::size_t expire_providers_locked(Clock::time_point now);
  std::vector<Contact> local_providers(const NodeId& key, std::size_t max);

  Contact self_contact() const;
  nlohmann::json contacts_to_json(const std::vector<Contact>& contacts) const;
  std::vector<Contact> contacts_from_json(const nlohmann::json& list) const;

  template<typename OnReply>
  std::vector<Contact> iterate(const NodeId& target,
                               const nlohmann::json& request,
                               Clock::time_point deadline,
                               OnReply on_reply);

  PeerHost& host_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  NodeId self_;
  RoutingTable table_;

  mutable std::mutex providers_mutex_;
  std::map<std::string, std::map<std::string, ProviderRecord>> providers_;
  bool started_ = false;
};
