#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "context.hpp"
#include "log.hpp"
#include "types.hpp"

class PeerHost;

using PeerDiscoveredCallback = std::function<void(const PeerDescriptor&)>;

// One independently failable source of peer sightings.
class DiscoveryBackend {
public:
  virtual ~DiscoveryBackend() = default;

  // Throws on failure. Background work must exit once ctx is cancelled.
  virtual void start(std::shared_ptr<Context> ctx) = 0;
  // Idempotent.
  virtual void stop() = 0;
  virtual std::string name() const = 0;
};

// Capability of backends that accept addresses at runtime.
class PeerRegistrar {
public:
  virtual ~PeerRegistrar() = default;
  // Throws std::invalid_argument for bad or self addresses.
  virtual void add_peer(const std::string& address) = 0;
  virtual bool remove_peer(const std::string& peer_id) = 0;
};

struct MdnsOptions {
  std::string service_tag = "clipsync";
  std::string multicast_group = "224.0.0.251";
  uint16_t port = 5353;
  uint32_t ttl = 120;
  std::chrono::milliseconds connect_timeout{15000};
};

struct DhtOptions {
  std::vector<std::string> bootstrap_peers;
  std::string rendezvous = "/clipsync/peers/v1";
  std::chrono::milliseconds lookup_interval{std::chrono::minutes(5)};
  std::chrono::milliseconds lookup_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds bootstrap_timeout{std::chrono::seconds(20)};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(15)};
  std::chrono::milliseconds rpc_timeout{std::chrono::seconds(10)};
  std::size_t max_providers = 100;
};

struct ManualOptions {
  std::vector<std::string> addresses;
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
};

using BackendOptions = std::variant<MdnsOptions, DhtOptions, ManualOptions>;

std::string backend_name(const BackendOptions& options);

std::shared_ptr<DiscoveryBackend> make_discovery_backend(const BackendOptions& options,
                                                         PeerHost& host,
                                                         PeerDiscoveredCallback report,
                                                         std::shared_ptr<Logger> logger);
