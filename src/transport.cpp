#include "transport.hpp"

#include "mqtt_transport.hpp"

void TransportRegistry::register_transport(const std::string& name, TransportFactory factory) {
  std::lock_guard lg(m_);
  factories_[name] = std::move(factory);
}

bool TransportRegistry::has(const std::string& name) const {
  std::lock_guard lg(m_);
  return factories_.count(name) > 0;
}

std::vector<std::string> TransportRegistry::names() const {
  std::lock_guard lg(m_);
  std::vector<std::string> out;
  for(const auto& entry : factories_) out.push_back(entry.first);
  return out;
}

std::unique_ptr<TransportClient> TransportRegistry::create(const std::string& name,
                                                           const TransportOptions& options,
                                                           std::shared_ptr<Logger> logger) const {
  TransportFactory factory;
  {
    std::lock_guard lg(m_);
    auto it = factories_.find(name);
    if(it == factories_.end()) throw TransportError("unknown transport '" + name + "'");
    factory = it->second;
  }
  return factory(options, std::move(logger));
}

void register_builtin_transports(TransportRegistry& registry) {
  registry.register_transport("mqtt", [](const TransportOptions& options, std::shared_ptr<Logger> logger) {
    return std::make_unique<MqttTransport>(options, std::move(logger));
  });
}
