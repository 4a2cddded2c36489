#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "discovery.hpp"
#include "peer_host.hpp"

// Caller-managed address list, typically seeded from paired devices.
class ManualDiscovery : public DiscoveryBackend, public PeerRegistrar {
public:
  ManualDiscovery(PeerHost& host,
                  PeerDiscoveredCallback report,
                  ManualOptions options,
                  std::shared_ptr<Logger> logger);
  ~ManualDiscovery() override;

  void start(std::shared_ptr<Context> ctx) override;
  void stop() override;
  std::string name() const override { return "manual"; }

  // Stores the address and, when running, connects in the background.
  void add_peer(const std::string& address) override;
  bool remove_peer(const std::string& peer_id) override;

  std::vector<std::string> addresses() const;
  // Blocks until every connection attempt started so far has finished.
  void wait_idle();

private:
  PeerAddress validate(const std::string& address) const;
  void launch_connect(const PeerAddress& address);
  void connect_one(const PeerAddress& address, const Context& ctx);

  PeerHost& host_;
  PeerDiscoveredCallback report_;
  ManualOptions options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::vector<PeerAddress> addresses_;
  std::shared_ptr<Context> ctx_;
  std::vector<std::future<void>> pending_;
};
