#include "discovery.hpp"

#include "dht_discovery.hpp"
#include "manual_discovery.hpp"
#include "mdns.hpp"

namespace {

struct BackendFactory {
  PeerHost& host;
  PeerDiscoveredCallback report;
  std::shared_ptr<Logger> logger;

  std::shared_ptr<DiscoveryBackend> operator()(const MdnsOptions& o) const {
    return std::make_shared<MdnsDiscovery>(host, report, o, logger);
  }
  std::shared_ptr<DiscoveryBackend> operator()(const DhtOptions& o) const {
    return std::make_shared<DhtDiscovery>(host, report, o, logger);
  }
  std::shared_ptr<DiscoveryBackend> operator()(const ManualOptions& o) const {
    return std::make_shared<ManualDiscovery>(host, report, o, logger);
  }
};

struct BackendName {
  std::string operator()(const MdnsOptions&) const { return "mdns"; }
  std::string operator()(const DhtOptions&) const { return "dht"; }
  std::string operator()(const ManualOptions&) const { return "manual"; }
};

} // namespace

std::string backend_name(const BackendOptions& options) {
  return std::visit(BackendName{}, options);
}

std::shared_ptr<DiscoveryBackend> make_discovery_backend(const BackendOptions& options,
                                                         PeerHost& host,
                                                         PeerDiscoveredCallback report,
                                                         std::shared_ptr<Logger> logger) {
  auto name = backend_name(options);
  auto child = logger ? logger->child(name) : std::make_shared<Logger>(name);
  return std::visit(BackendFactory{host, std::move(report), std::move(child)}, options);
}
