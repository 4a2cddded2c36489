#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "mqtt_codec.hpp"
#include "transport.hpp"

// MQTT 3.1.1 client. Socket work runs on a private io thread; every
// registered handler has its own strand on a shared pool.
class MqttTransport : public TransportClient {
public:
  struct BrokerEndpoint {
    std::string host;
    uint16_t port = 1883;
  };

  // Accepts tcp://, mqtt:// or bare host[:port]. Throws TransportError.
  static BrokerEndpoint parse_broker_url(const std::string& url);

  MqttTransport(TransportOptions options, std::shared_ptr<Logger> logger);
  ~MqttTransport() override;

  MqttTransport(const MqttTransport&) = delete;
  MqttTransport& operator=(const MqttTransport&) = delete;

  void connect() override;
  void disconnect() override;
  bool is_connected() const override { return connected_; }

  void join_group(const std::string& group) override;
  void leave_group(const std::string& group) override;
  std::vector<std::string> list_groups() const override;

  void send(const Message& message) override;
  void add_handler(MessageHandler handler) override;

  std::string name() const override { return "mqtt"; }

  std::size_t reconnect_count() const { return reconnects_; }

private:
  using tcp = asio::ip::tcp;
  using Strand = asio::strand<asio::thread_pool::executor_type>;

  struct HandlerSlot {
    MessageHandler fn;
    Strand strand;
  };

  // io thread only
  void start_session();
  void fail_session(uint64_t session, const std::string& reason);
  void schedule_reconnect();
  void read_loop(uint64_t session);
  void on_packet(uint64_t session, const MqttPacket& packet);
  void write_packet(const MqttPacket& packet);
  void write_bytes(std::vector<unsigned char> bytes);
  void do_write(uint64_t session);
  void arm_keepalive(uint64_t session);
  void resubscribe();
  void deliver(const MqttPacket& publish);

  // Sends a packet and blocks for its acknowledgement. Throws TransportError.
  MqttPacket exchange(MqttPacket packet);
  void fail_pending(const std::string& reason);
  std::vector<std::pair<std::string, uint8_t>> filters_for(const std::string& group) const;
  uint8_t qos() const;

  TransportOptions options_;
  std::shared_ptr<Logger> logger_;
  BrokerEndpoint broker_;

  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  tcp::resolver resolver_;
  std::unique_ptr<tcp::socket> socket_;
  asio::steady_timer reconnect_timer_;
  asio::steady_timer keepalive_timer_;
  std::deque<std::vector<unsigned char>> write_queue_;
  std::vector<unsigned char> read_buf_;
  std::array<unsigned char, 4096> chunk_{};
  uint64_t session_ = 0;
  bool awaiting_pingresp_ = false;
  asio::thread_pool handler_pool_;
  std::thread io_thread_;

  std::atomic<bool> connected_{false};
  std::atomic<std::size_t> reconnects_{0};

  mutable std::mutex m_;
  bool want_connected_ = false;
  std::set<std::string> groups_;
  std::vector<HandlerSlot> handlers_;
  std::map<uint16_t, std::shared_ptr<std::promise<MqttPacket>>> pending_acks_;
  std::shared_ptr<std::promise<void>> connack_;
  uint16_t last_packet_id_ = 0;
};
