#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "message.hpp"

class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using MessageHandler = std::function<void(const Message&)>;

struct TransportOptions {
  std::string broker_url = "tcp://localhost:1883";
  std::string client_id;
  std::string username;
  std::string password;
  std::string topic_prefix = "clipsync";
  int qos = 1;
  std::chrono::seconds keepalive{60};
  std::chrono::milliseconds reconnect_delay{std::chrono::seconds(5)};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds ack_timeout{std::chrono::seconds(10)};
  // Messages whose source is this id are not delivered locally.
  std::string device_id;
};

// Group-scoped publish/subscribe client.
class TransportClient {
public:
  virtual ~TransportClient() = default;

  // Throws TransportError. A failed attempt keeps retrying in the background
  // until disconnect(). Joined groups are resubscribed on every connect.
  virtual void connect() = 0;
  virtual void disconnect() = 0;
  virtual bool is_connected() const = 0;

  // Joining a joined group and leaving an unknown one are no-ops.
  // Throws TransportError when the broker refuses the change.
  virtual void join_group(const std::string& group) = 0;
  virtual void leave_group(const std::string& group) = 0;
  virtual std::vector<std::string> list_groups() const = 0;

  // Throws TransportError when not connected or the publish fails.
  virtual void send(const Message& message) = 0;
  virtual void add_handler(MessageHandler handler) = 0;

  virtual std::string name() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<TransportClient>(const TransportOptions&,
                                                                         std::shared_ptr<Logger>)>;

class TransportRegistry {
public:
  void register_transport(const std::string& name, TransportFactory factory);
  bool has(const std::string& name) const;
  std::vector<std::string> names() const;

  // Throws TransportError for unknown names.
  std::unique_ptr<TransportClient> create(const std::string& name,
                                          const TransportOptions& options,
                                          std::shared_ptr<Logger> logger) const;

private:
  mutable std::mutex m_;
  std::map<std::string, TransportFactory> factories_;
};

void register_builtin_transports(TransportRegistry& registry);
