#include "mqtt_transport.hpp"

#include <algorithm>

namespace {

// Encodes on the calling thread so oversized packets fail the caller.
std::vector<unsigned char> encode_for_caller(const MqttPacket& packet) {
  try {
    return mqtt_encode(packet);
  } catch(const MqttProtocolError& e) {
    throw TransportError("cannot encode " + to_string(packet.type) + ": " + e.what());
  }
}

std::string checked_group(const std::string& group) {
  const std::string name = group.empty() ? kDefaultGroup : group;
  if(!is_valid_topic_segment(name)) {
    throw TransportError("invalid group name '" + name + "'");
  }
  return name;
}

} // namespace

MqttTransport::BrokerEndpoint MqttTransport::parse_broker_url(const std::string& url) {
  std::string rest = url;
  auto scheme_end = rest.find("://");
  if(scheme_end != std::string::npos) {
    auto scheme = rest.substr(0, scheme_end);
    if(scheme != "tcp" && scheme != "mqtt") {
      throw TransportError("unsupported broker scheme '" + scheme + "'");
    }
    rest = rest.substr(scheme_end + 3);
  }
  while(!rest.empty() && rest.back() == '/') rest.pop_back();
  if(rest.empty()) throw TransportError("broker url '" + url + "' has no host");

  BrokerEndpoint out;
  std::string port_text;
  if(rest.front() == '[') {
    auto close = rest.find(']');
    if(close == std::string::npos) throw TransportError("bad broker url '" + url + "'");
    out.host = rest.substr(1, close - 1);
    if(close + 1 < rest.size() && rest[close + 1] == ':') port_text = rest.substr(close + 2);
  } else {
    auto colon = rest.rfind(':');
    if(colon == std::string::npos) {
      out.host = rest;
    } else {
      out.host = rest.substr(0, colon);
      port_text = rest.substr(colon + 1);
    }
  }
  if(!port_text.empty()) {
    try {
      auto port = std::stoul(port_text);
      if(port == 0 || port > 65535) throw std::out_of_range("port");
      out.port = static_cast<uint16_t>(port);
    } catch(const std::exception&) {
      throw TransportError("bad broker port in '" + url + "'");
    }
  }
  if(out.host.empty()) throw TransportError("broker url '" + url + "' has no host");
  return out;
}

MqttTransport::MqttTransport(TransportOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("mqtt")),
    broker_(parse_broker_url(options_.broker_url)),
    work_(io_.get_executor()),
    resolver_(io_),
    reconnect_timer_(io_),
    keepalive_timer_(io_),
    handler_pool_(2) {
  if(!is_valid_topic_segment(options_.topic_prefix)) {
    throw TransportError("invalid topic prefix '" + options_.topic_prefix + "'");
  }
  if(options_.client_id.empty()) options_.client_id = "clipsync-" + random_hex(6);
  io_thread_ = std::thread([this]{ io_.run(); });
}

MqttTransport::~MqttTransport() {
  disconnect();
  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) io_thread_.join();
  handler_pool_.join();
}

uint8_t MqttTransport::qos() const {
  return static_cast<uint8_t>(std::clamp(options_.qos, 0, 1));
}

std::vector<std::pair<std::string, uint8_t>> MqttTransport::filters_for(const std::string& group) const {
  return {{content_filter(options_.topic_prefix, group), qos()},
          {control_filter(options_.topic_prefix, group), qos()}};
}

// ---- lifecycle -------------------------------------------------------------

void MqttTransport::connect() {
  if(connected_) return;
  std::future<void> ready;
  {
    std::lock_guard lg(m_);
    want_connected_ = true;
    connack_ = std::make_shared<std::promise<void>>();
    ready = connack_->get_future();
  }
  logger_->info("Connecting to broker {}:{} as {}", broker_.host, broker_.port, options_.client_id);
  asio::post(io_, [this]{ start_session(); });

  if(ready.wait_for(options_.connect_timeout) != std::future_status::ready) {
    asio::post(io_, [this]{
      if(!connected_) fail_session(session_, "connect timed out");
    });
    throw TransportError("timed out connecting to broker " + options_.broker_url);
  }
  try {
    ready.get();
  } catch(const std::exception& e) {
    throw TransportError(std::string("failed to connect to broker: ") + e.what());
  }
}

void MqttTransport::disconnect() {
  {
    std::lock_guard lg(m_);
    want_connected_ = false;
  }
  auto done = std::make_shared<std::promise<void>>();
  auto finished = done->get_future();
  asio::post(io_, [this, done]{
    reconnect_timer_.cancel();
    keepalive_timer_.cancel();
    if(socket_ && socket_->is_open()) {
      if(connected_) {
        MqttPacket bye;
        bye.type = MqttPacketType::Disconnect;
        asio::error_code ec;
        asio::write(*socket_, asio::buffer(mqtt_encode(bye)), ec);
        if(ec) logger_->debug("DISCONNECT not delivered: {}", ec.message());
      }
      asio::error_code ec;
      socket_->close(ec);
    }
    ++session_;
    bool was = connected_.exchange(false);
    write_queue_.clear();
    fail_pending("disconnected");
    if(was) logger_->info("Disconnected from broker");
    done->set_value();
  });
  if(finished.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
    logger_->warn("Timed out waiting for the MQTT io thread to disconnect");
  }
}

void MqttTransport::start_session() {
  {
    std::lock_guard lg(m_);
    if(!want_connected_) return;
  }
  reconnect_timer_.cancel();
  auto session = ++session_;
  if(socket_) {
    asio::error_code ec;
    socket_->close(ec);
  }
  socket_ = std::make_unique<tcp::socket>(io_);
  read_buf_.clear();
  write_queue_.clear();
  awaiting_pingresp_ = false;

  resolver_.async_resolve(broker_.host, std::to_string(broker_.port),
    [this, session](const asio::error_code& ec, tcp::resolver::results_type results){
      if(session != session_) return;
      if(ec) return fail_session(session, "resolve failed: " + ec.message());
      asio::async_connect(*socket_, results,
        [this, session](const asio::error_code& ec, const tcp::endpoint&){
          if(session != session_) return;
          if(ec) return fail_session(session, "connect failed: " + ec.message());
          MqttPacket hello;
          hello.type = MqttPacketType::Connect;
          hello.client_id = options_.client_id;
          hello.username = options_.username;
          hello.password = options_.password;
          hello.keepalive = static_cast<uint16_t>(options_.keepalive.count());
          hello.clean_session = true;
          write_packet(hello);
          read_loop(session);
        });
    });
}

void MqttTransport::fail_session(uint64_t session, const std::string& reason) {
  if(session != session_) return;
  ++session_;
  if(socket_) {
    asio::error_code ec;
    socket_->close(ec);
  }
  keepalive_timer_.cancel();
  write_queue_.clear();
  bool was = connected_.exchange(false);
  fail_pending(reason);
  std::shared_ptr<std::promise<void>> connack;
  {
    std::lock_guard lg(m_);
    connack.swap(connack_);
  }
  if(connack) connack->set_exception(std::make_exception_ptr(TransportError(reason)));
  if(was) {
    logger_->warn("Lost connection to broker: {}", reason);
  } else {
    logger_->warn("Broker connection failed: {}", reason);
  }
  schedule_reconnect();
}

void MqttTransport::fail_pending(const std::string& reason) {
  std::map<uint16_t, std::shared_ptr<std::promise<MqttPacket>>> acks;
  std::shared_ptr<std::promise<void>> connack;
  {
    std::lock_guard lg(m_);
    acks.swap(pending_acks_);
    connack.swap(connack_);
  }
  for(auto& [id, promise] : acks) {
    promise->set_exception(std::make_exception_ptr(TransportError(reason)));
  }
  if(connack) connack->set_exception(std::make_exception_ptr(TransportError(reason)));
}

void MqttTransport::schedule_reconnect() {
  {
    std::lock_guard lg(m_);
    if(!want_connected_) return;
  }
  reconnect_timer_.expires_after(options_.reconnect_delay);
  reconnect_timer_.async_wait([this](const asio::error_code& ec){
    if(ec) return;
    {
      std::lock_guard lg(m_);
      if(!want_connected_) return;
    }
    reconnects_++;
    logger_->info("Reconnecting to broker {}:{}", broker_.host, broker_.port);
    start_session();
  });
}

// ---- wire ------------------------------------------------------------------

void MqttTransport::read_loop(uint64_t session) {
  socket_->async_read_some(asio::buffer(chunk_),
    [this, session](const asio::error_code& ec, std::size_t n){
      if(session != session_) return;
      if(ec) {
        return fail_session(session, ec == asio::error::eof ? "broker closed the connection" : ec.message());
      }
      read_buf_.insert(read_buf_.end(), chunk_.begin(), chunk_.begin() + n);
      while(true) {
        MqttPacket packet;
        std::size_t used = 0;
        try {
          if(mqtt_decode(read_buf_.data(), read_buf_.size(), packet, used) == MqttDecodeStatus::Incomplete) break;
        } catch(const MqttProtocolError& e) {
          return fail_session(session, e.what());
        }
        read_buf_.erase(read_buf_.begin(), read_buf_.begin() + used);
        on_packet(session, packet);
        if(session != session_) return;
      }
      read_loop(session);
    });
}

void MqttTransport::write_packet(const MqttPacket& packet) {
  std::vector<unsigned char> bytes;
  try {
    bytes = mqtt_encode(packet);
  } catch(const MqttProtocolError& e) {
    logger_->warn("Not sending {}: {}", to_string(packet.type), e.what());
    return;
  }
  write_bytes(std::move(bytes));
}

void MqttTransport::write_bytes(std::vector<unsigned char> bytes) {
  if(!socket_ || !socket_->is_open()) return;
  bool idle = write_queue_.empty();
  write_queue_.push_back(std::move(bytes));
  if(idle) do_write(session_);
}

void MqttTransport::do_write(uint64_t session) {
  asio::async_write(*socket_, asio::buffer(write_queue_.front()),
    [this, session](const asio::error_code& ec, std::size_t){
      if(session != session_) return;
      if(ec) return fail_session(session, "write failed: " + ec.message());
      write_queue_.pop_front();
      if(!write_queue_.empty()) do_write(session);
    });
}

void MqttTransport::arm_keepalive(uint64_t session) {
  if(options_.keepalive.count() <= 0) return;
  keepalive_timer_.expires_after(options_.keepalive);
  keepalive_timer_.async_wait([this, session](const asio::error_code& ec){
    if(ec || session != session_) return;
    if(awaiting_pingresp_) return fail_session(session, "keepalive timeout");
    awaiting_pingresp_ = true;
    MqttPacket ping;
    ping.type = MqttPacketType::Pingreq;
    write_packet(ping);
    arm_keepalive(session);
  });
}

void MqttTransport::on_packet(uint64_t session, const MqttPacket& packet) {
  switch(packet.type) {
    case MqttPacketType::Connack: {
      if(packet.return_code != 0) {
        auto reason = "broker refused connection (code " + std::to_string(packet.return_code) + ")";
        std::shared_ptr<std::promise<void>> connack;
        {
          std::lock_guard lg(m_);
          connack.swap(connack_);
          // A refusal is not retried with the same credentials.
          want_connected_ = false;
        }
        if(connack) connack->set_exception(std::make_exception_ptr(TransportError(reason)));
        return fail_session(session, reason);
      }
      connected_ = true;
      resubscribe();
      arm_keepalive(session);
      std::shared_ptr<std::promise<void>> connack;
      {
        std::lock_guard lg(m_);
        connack.swap(connack_);
      }
      if(connack) connack->set_value();
      logger_->info("Connected to broker {}:{}", broker_.host, broker_.port);
      break;
    }
    case MqttPacketType::Publish:
      deliver(packet);
      break;
    case MqttPacketType::Puback:
    case MqttPacketType::Suback:
    case MqttPacketType::Unsuback: {
      std::shared_ptr<std::promise<MqttPacket>> waiter;
      {
        std::lock_guard lg(m_);
        auto it = pending_acks_.find(packet.packet_id);
        if(it != pending_acks_.end()) {
          waiter = it->second;
          pending_acks_.erase(it);
        }
      }
      if(waiter) {
        waiter->set_value(packet);
      } else if(packet.type == MqttPacketType::Suback &&
                std::count(packet.granted.begin(), packet.granted.end(), kMqttSubackFailure) > 0) {
        logger_->warn("Broker refused a resubscription");
      }
      break;
    }
    case MqttPacketType::Pingresp:
      awaiting_pingresp_ = false;
      break;
    default:
      logger_->debug("Ignoring unexpected {} from broker", to_string(packet.type));
      break;
  }
}

void MqttTransport::resubscribe() {
  std::vector<std::string> groups;
  {
    std::lock_guard lg(m_);
    groups.assign(groups_.begin(), groups_.end());
  }
  for(const auto& group : groups) {
    MqttPacket sub;
    sub.type = MqttPacketType::Subscribe;
    {
      std::lock_guard lg(m_);
      if(++last_packet_id_ == 0) ++last_packet_id_;
      sub.packet_id = last_packet_id_;
    }
    sub.subscriptions = filters_for(group);
    write_packet(sub);
  }
  if(!groups.empty()) logger_->debug("Resubscribed to {} groups", groups.size());
}

void MqttTransport::deliver(const MqttPacket& publish) {
  if(publish.qos == 1) {
    MqttPacket ack;
    ack.type = MqttPacketType::Puback;
    ack.packet_id = publish.packet_id;
    write_packet(ack);
  }

  auto info = parse_topic(options_.topic_prefix, publish.topic);
  if(!info) {
    logger_->debug("Ignoring message on foreign topic {}", publish.topic);
    return;
  }
  std::optional<Message> message;
  try {
    message.emplace(decode_wire_message(*info, publish.payload));
  } catch(const std::exception& e) {
    logger_->warn("Dropping undecodable message on {}: {}", publish.topic, e.what());
    return;
  }
  if(!options_.device_id.empty()) {
    if(message->source() == options_.device_id) return;
    if(!message->destination().empty() && message->destination() != options_.device_id) return;
  }

  std::vector<HandlerSlot> handlers;
  {
    std::lock_guard lg(m_);
    handlers = handlers_;
  }
  for(auto& slot : handlers) {
    asio::post(slot.strand, [this, fn = slot.fn, msg = *message]{
      try {
        fn(msg);
      } catch(const std::exception& e) {
        logger_->warn("Message handler failed: {}", e.what());
      }
    });
  }
}

// ---- caller side -----------------------------------------------------------

MqttPacket MqttTransport::exchange(MqttPacket packet) {
  auto waiter = std::make_shared<std::promise<MqttPacket>>();
  auto reply = waiter->get_future();
  {
    std::lock_guard lg(m_);
    if(++last_packet_id_ == 0) ++last_packet_id_;
    packet.packet_id = last_packet_id_;
  }
  auto id = packet.packet_id;
  auto bytes = encode_for_caller(packet);
  {
    std::lock_guard lg(m_);
    pending_acks_[id] = waiter;
  }
  asio::post(io_, [this, id, bytes = std::move(bytes)]() mutable {
    if(!connected_) {
      std::shared_ptr<std::promise<MqttPacket>> orphan;
      {
        std::lock_guard lg(m_);
        auto it = pending_acks_.find(id);
        if(it != pending_acks_.end()) {
          orphan = it->second;
          pending_acks_.erase(it);
        }
      }
      if(orphan) orphan->set_exception(std::make_exception_ptr(TransportError("not connected to broker")));
      return;
    }
    write_bytes(std::move(bytes));
  });

  if(reply.wait_for(options_.ack_timeout) != std::future_status::ready) {
    std::lock_guard lg(m_);
    pending_acks_.erase(id);
    throw TransportError(to_string(packet.type) + " was not acknowledged in time");
  }
  return reply.get();
}

void MqttTransport::send(const Message& message) {
  if(!connected_) throw TransportError("not connected to broker");
  checked_group(message.group());
  if(!message.destination().empty() && !is_valid_topic_segment(message.destination())) {
    throw TransportError("invalid destination '" + message.destination() + "'");
  }

  MqttPacket publish;
  publish.type = MqttPacketType::Publish;
  publish.topic = topic_for(options_.topic_prefix, message.group(), message.type(), message.destination());
  publish.payload = encode_wire_payload(message);
  publish.qos = qos();

  if(publish.qos == 0) {
    asio::post(io_, [this, bytes = encode_for_caller(publish)]() mutable {
      if(connected_) write_bytes(std::move(bytes));
    });
    return;
  }
  exchange(publish);
}

void MqttTransport::join_group(const std::string& group) {
  const std::string name = checked_group(group);
  {
    std::lock_guard lg(m_);
    if(!groups_.insert(name).second) return;
  }
  logger_->info("Joined group {}", name);
  if(!connected_) return;

  MqttPacket sub;
  sub.type = MqttPacketType::Subscribe;
  sub.subscriptions = filters_for(name);
  try {
    auto ack = exchange(sub);
    if(std::count(ack.granted.begin(), ack.granted.end(), kMqttSubackFailure) > 0) {
      throw TransportError("broker refused subscription to group " + name);
    }
  } catch(const TransportError&) {
    std::lock_guard lg(m_);
    groups_.erase(name);
    throw;
  }
}

void MqttTransport::leave_group(const std::string& group) {
  const std::string name = group.empty() ? kDefaultGroup : group;
  {
    std::lock_guard lg(m_);
    if(groups_.erase(name) == 0) return;
  }
  logger_->info("Left group {}", name);
  if(!connected_) return;

  MqttPacket unsub;
  unsub.type = MqttPacketType::Unsubscribe;
  unsub.subscriptions = filters_for(name);
  exchange(unsub);
}

std::vector<std::string> MqttTransport::list_groups() const {
  std::lock_guard lg(m_);
  return std::vector<std::string>(groups_.begin(), groups_.end());
}

void MqttTransport::add_handler(MessageHandler handler) {
  std::lock_guard lg(m_);
  handlers_.push_back(HandlerSlot{std::move(handler), asio::make_strand(handler_pool_)});
}
