#pragma once

#include <asio.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "discovery.hpp"
#include "kademlia.hpp"
#include "peer_host.hpp"

// Wide-area discovery through providers of one rendezvous key.
class DhtDiscovery : public DiscoveryBackend {
public:
  DhtDiscovery(PeerHost& host,
               PeerDiscoveredCallback report,
               DhtOptions options,
               std::shared_ptr<Logger> logger);
  ~DhtDiscovery() override;

  void start(std::shared_ptr<Context> ctx) override;
  void stop() override;
  std::string name() const override { return "dht"; }

  // Re-announces this device and reports every provider found.
  // Returns the number of peers reported.
  std::size_t lookup_once();

  const NodeId& rendezvous_key() const { return rendezvous_; }
  KademliaNode& node() { return node_; }

private:
  void connect_bootstrap_peers();
  void run_loop(std::shared_ptr<Context> ctx);
  void connect_in_background(const PeerDescriptor& peer);

  PeerHost& host_;
  PeerDiscoveredCallback report_;
  DhtOptions options_;
  std::shared_ptr<Logger> logger_;
  NodeId rendezvous_;
  KademliaNode node_;

  std::mutex m_;
  std::shared_ptr<Context> ctx_;
  std::thread loop_;
  std::unique_ptr<asio::thread_pool> connect_pool_;
};
