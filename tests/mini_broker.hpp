#pragma once

#include "mqtt_codec.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace clipsync::test {

// Single-threaded MQTT 3.1.1 broker for loopback tests. Supports QoS 0/1
// routing, wildcard subscriptions and optional username/password checks.
class MiniBroker {
public:
  using tcp = asio::ip::tcp;

  MiniBroker() : work_(asio::make_work_guard(io_)) {
    thread_ = std::thread([this]{ io_.run(); });
  }

  ~MiniBroker() {
    stop();
    work_.reset();
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  MiniBroker(const MiniBroker&) = delete;
  MiniBroker& operator=(const MiniBroker&) = delete;

  // Listens on 127.0.0.1. Port 0 picks an ephemeral port the first time
  // and reuses it on restart.
  uint16_t start(uint16_t port = 0) {
    std::promise<uint16_t> bound;
    auto result = bound.get_future();
    asio::post(io_, [this, port, &bound]{
      try {
        auto acceptor = std::make_unique<tcp::acceptor>(io_);
        tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port ? port : port_);
        acceptor->open(endpoint.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(endpoint);
        acceptor->listen();
        port_ = acceptor->local_endpoint().port();
        acceptor_ = std::move(acceptor);
        do_accept();
        bound.set_value(port_);
      } catch(...) {
        bound.set_exception(std::current_exception());
      }
    });
    return result.get();
  }

  // Closes the listener and every client connection.
  void stop() {
    run_sync([this]{
      if(acceptor_) {
        std::error_code ec;
        acceptor_->close(ec);
        acceptor_.reset();
      }
      drop_clients_locked();
    });
  }

  // Closes client connections but keeps listening.
  void drop_clients() {
    run_sync([this]{ drop_clients_locked(); });
  }

  uint16_t port() const { return port_; }
  std::string url() const { return "tcp://127.0.0.1:" + std::to_string(port_); }

  void require_credentials(std::string username, std::string password) {
    std::lock_guard lg(m_);
    username_ = std::move(username);
    password_ = std::move(password);
  }

  // Subscriptions to filters starting with this prefix get a SUBACK failure.
  void refuse_filters(std::string prefix) {
    std::lock_guard lg(m_);
    refused_prefix_ = std::move(prefix);
  }

  std::size_t connect_count() const {
    std::lock_guard lg(m_);
    return connects_;
  }

  std::vector<std::string> published_topics() const {
    std::lock_guard lg(m_);
    return published_;
  }

  std::set<std::string> subscriptions_of(const std::string& client_id) const {
    std::lock_guard lg(m_);
    std::set<std::string> out;
    for(const auto& session : sessions_) {
      if(session->client_id == client_id) out.insert(session->filters.begin(), session->filters.end());
    }
    return out;
  }

  std::vector<std::string> connected_clients() const {
    std::lock_guard lg(m_);
    std::vector<std::string> out;
    for(const auto& session : sessions_) {
      if(session->connected) out.push_back(session->client_id);
    }
    return out;
  }

private:
  struct Session : std::enable_shared_from_this<Session> {
    explicit Session(tcp::socket s) : socket(std::move(s)) {}

    tcp::socket socket;
    std::array<unsigned char, 4096> chunk{};
    std::vector<unsigned char> buffer;
    std::deque<std::vector<unsigned char>> outbox;
    std::string client_id;
    std::set<std::string> filters;
    bool connected = false;
    uint16_t next_id = 0;
  };

  template<typename Fn>
  void run_sync(Fn fn) {
    std::promise<void> done;
    auto finished = done.get_future();
    asio::post(io_, [&]{
      fn();
      done.set_value();
    });
    finished.wait();
  }

  void drop_clients_locked() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
      std::lock_guard lg(m_);
      sessions.swap(sessions_);
    }
    for(auto& s : sessions) {
      std::error_code ec;
      s->socket.shutdown(tcp::socket::shutdown_both, ec);
      s->socket.close(ec);
    }
  }

  void do_accept() {
    if(!acceptor_) return;
    acceptor_->async_accept([this](const std::error_code& ec, tcp::socket socket){
      if(ec) return;
      auto session = std::make_shared<Session>(std::move(socket));
      {
        std::lock_guard lg(m_);
        sessions_.push_back(session);
      }
      do_read(session);
      do_accept();
    });
  }

  void do_read(const std::shared_ptr<Session>& session) {
    session->socket.async_read_some(asio::buffer(session->chunk),
      [this, session](const std::error_code& ec, std::size_t n){
        if(ec) {
          close(session);
          return;
        }
        session->buffer.insert(session->buffer.end(), session->chunk.begin(), session->chunk.begin() + n);
        try {
          while(true) {
            MqttPacket packet;
            std::size_t consumed = 0;
            if(mqtt_decode(session->buffer.data(), session->buffer.size(), packet, consumed) ==
               MqttDecodeStatus::Incomplete) {
              break;
            }
            session->buffer.erase(session->buffer.begin(), session->buffer.begin() + consumed);
            if(!handle(session, packet)) {
              close(session);
              return;
            }
          }
        } catch(const MqttProtocolError&) {
          close(session);
          return;
        }
        do_read(session);
      });
  }

  bool handle(const std::shared_ptr<Session>& session, const MqttPacket& packet) {
    switch(packet.type) {
      case MqttPacketType::Connect: {
        MqttPacket ack;
        ack.type = MqttPacketType::Connack;
        {
          std::lock_guard lg(m_);
          connects_++;
          bool auth_ok = username_.empty() ||
                         (packet.username == username_ && packet.password == password_);
          ack.return_code = auth_ok ? 0 : 5;
          session->client_id = packet.client_id;
          session->connected = auth_ok;
        }
        // A refused client closes the connection itself after reading the CONNACK.
        send(session, ack);
        return true;
      }
      case MqttPacketType::Subscribe: {
        MqttPacket ack;
        ack.type = MqttPacketType::Suback;
        ack.packet_id = packet.packet_id;
        std::lock_guard lg(m_);
        for(const auto& [filter, qos] : packet.subscriptions) {
          if(!refused_prefix_.empty() && filter.rfind(refused_prefix_, 0) == 0) {
            ack.granted.push_back(kMqttSubackFailure);
            continue;
          }
          session->filters.insert(filter);
          ack.granted.push_back(std::min<uint8_t>(qos, 1));
        }
        send(session, ack);
        return true;
      }
      case MqttPacketType::Unsubscribe: {
        {
          std::lock_guard lg(m_);
          for(const auto& entry : packet.subscriptions) session->filters.erase(entry.first);
        }
        MqttPacket ack;
        ack.type = MqttPacketType::Unsuback;
        ack.packet_id = packet.packet_id;
        send(session, ack);
        return true;
      }
      case MqttPacketType::Publish: {
        if(packet.qos == 1) {
          MqttPacket ack;
          ack.type = MqttPacketType::Puback;
          ack.packet_id = packet.packet_id;
          send(session, ack);
        }
        route(packet);
        return true;
      }
      case MqttPacketType::Pingreq: {
        MqttPacket pong;
        pong.type = MqttPacketType::Pingresp;
        send(session, pong);
        return true;
      }
      case MqttPacketType::Puback:
        return true;
      case MqttPacketType::Disconnect:
        return false;
      default:
        return false;
    }
  }

  void route(const MqttPacket& publish) {
    std::vector<std::shared_ptr<Session>> targets;
    {
      std::lock_guard lg(m_);
      published_.push_back(publish.topic);
      for(const auto& s : sessions_) {
        bool match = std::any_of(s->filters.begin(), s->filters.end(),
          [&](const std::string& f){ return mqtt_topic_matches(f, publish.topic); });
        if(match && s->connected) targets.push_back(s);
      }
    }
    for(auto& s : targets) {
      MqttPacket out = publish;
      out.dup = false;
      out.retain = false;
      if(out.qos > 0) {
        if(++s->next_id == 0) ++s->next_id;
        out.packet_id = s->next_id;
      }
      send(s, out);
    }
  }

  void send(const std::shared_ptr<Session>& session, const MqttPacket& packet) {
    bool idle = session->outbox.empty();
    session->outbox.push_back(mqtt_encode(packet));
    if(idle) do_write(session);
  }

  void do_write(const std::shared_ptr<Session>& session) {
    asio::async_write(session->socket, asio::buffer(session->outbox.front()),
      [this, session](const std::error_code& ec, std::size_t){
        if(ec) {
          close(session);
          return;
        }
        session->outbox.pop_front();
        if(!session->outbox.empty()) do_write(session);
      });
  }

  void close(const std::shared_ptr<Session>& session) {
    std::error_code ec;
    session->socket.close(ec);
    std::lock_guard lg(m_);
    sessions_.erase(std::remove(sessions_.begin(), sessions_.end(), session), sessions_.end());
  }

  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  uint16_t port_ = 0;

  mutable std::mutex m_;
  std::vector<std::shared_ptr<Session>> sessions_;
  std::vector<std::string> published_;
  std::string username_;
  std::string password_;
  std::string refused_prefix_;
  std::size_t connects_ = 0;
};

} // namespace clipsync::test
