#include "message.hpp"
#include "mini_broker.hpp"
#include "mqtt_codec.hpp"
#include "mqtt_transport.hpp"
#include "test_runner_utils.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using clipsync::test::MiniBroker;
using clipsync::test::TestCase;
using clipsync::test::TestContext;
using clipsync::test::require;
using clipsync::test::throws;
using clipsync::test::wait_for_condition;

TransportOptions client_options(const MiniBroker& broker, const std::string& device) {
  TransportOptions options;
  options.broker_url = broker.url();
  options.client_id = device;
  options.device_id = device;
  options.keepalive = std::chrono::seconds(30);
  options.reconnect_delay = 200ms;
  options.connect_timeout = 3s;
  options.ack_timeout = 3s;
  return options;
}

// Thread-safe inbox for one transport's handler.
class Inbox {
public:
  MessageHandler handler() {
    return [this](const Message& m){
      std::lock_guard lg(m_);
      messages_.push_back(m);
    };
  }

  std::vector<Message> messages() const {
    std::lock_guard lg(m_);
    return messages_;
  }

  std::size_t size() const {
    std::lock_guard lg(m_);
    return messages_.size();
  }

  bool wait_for(std::size_t count, std::chrono::milliseconds timeout = 3s) const {
    return wait_for_condition([&]{ return size() >= count; }, timeout, 20ms);
  }

private:
  mutable std::mutex m_;
  std::vector<Message> messages_;
};

Message text_message(const std::string& text, const std::string& source, const std::string& group) {
  return Message::content(ClipboardContent::text(text), source, group);
}

bool test_codec_packets(TestContext&) {
  MqttPacket connect;
  connect.type = MqttPacketType::Connect;
  connect.client_id = "device-a";
  connect.username = "user";
  connect.password = "secret";
  connect.keepalive = 45;
  auto bytes = mqtt_encode(connect);

  MqttPacket decoded;
  std::size_t consumed = 0;
  require(mqtt_decode(bytes.data(), bytes.size() - 1, decoded, consumed) == MqttDecodeStatus::Incomplete,
          "partial packet");
  require(mqtt_decode(bytes.data(), bytes.size(), decoded, consumed) == MqttDecodeStatus::Ok, "full packet");
  require(consumed == bytes.size(), "consumed");
  require(decoded.type == MqttPacketType::Connect && decoded.client_id == "device-a", "client id");
  require(decoded.username == "user" && decoded.password == "secret" && decoded.keepalive == 45, "credentials");

  MqttPacket publish;
  publish.type = MqttPacketType::Publish;
  publish.topic = "clipsync/default/content";
  publish.payload = std::vector<unsigned char>(300, 'x');
  publish.qos = 1;
  publish.packet_id = 513;
  auto two = mqtt_encode(publish);
  auto tail = mqtt_encode(connect);
  two.insert(two.end(), tail.begin(), tail.end());
  require(mqtt_decode(two.data(), two.size(), decoded, consumed) == MqttDecodeStatus::Ok, "first of two");
  require(decoded.topic == publish.topic && decoded.packet_id == 513, "publish header");
  require(decoded.payload.size() == 300, "multi byte remaining length");
  require(mqtt_decode(two.data() + consumed, two.size() - consumed, decoded, consumed) == MqttDecodeStatus::Ok &&
          decoded.type == MqttPacketType::Connect, "second of two");

  std::vector<unsigned char> qos2 = {0x34, 0x05, 0x00, 0x01, 'a', 0x00, 0x01};
  require(throws<MqttProtocolError>([&]{ mqtt_decode(qos2.data(), qos2.size(), decoded, consumed); }), "qos 2");
  std::vector<unsigned char> long_length = {0x30, 0xff, 0xff, 0xff, 0xff, 0x01};
  require(throws<MqttProtocolError>([&]{ mqtt_decode(long_length.data(), long_length.size(), decoded, consumed); }),
          "remaining length over four bytes");
  return true;
}

bool test_topic_matching(TestContext&) {
  require(mqtt_topic_matches("clipsync/+/content/#", "clipsync/home/content"), "# matches parent level");
  require(mqtt_topic_matches("clipsync/+/content/#", "clipsync/home/content/device-b"), "# matches child");
  require(!mqtt_topic_matches("clipsync/+/content/#", "clipsync/home/control/ping"), "literal differs");
  require(mqtt_topic_matches("clipsync/home/+", "clipsync/home/content"), "+ single level");
  require(!mqtt_topic_matches("clipsync/home/+", "clipsync/home/content/x"), "+ not multi level");
  require(mqtt_topic_matches("#", "clipsync/home"), "bare #");
  require(!mqtt_topic_matches("#", "$SYS/broker"), "$ topics hidden from wildcards");
  require(mqtt_topic_matches("$SYS/#", "$SYS/broker"), "$ topics by name");
  return true;
}

bool test_topic_scheme(TestContext&) {
  require(topic_for("clipsync", "", MessageType::Content) == "clipsync/default/content", "default group");
  require(topic_for("clipsync", "home", MessageType::Ping, "device-b") == "clipsync/home/control/ping/device-b",
          "control topic");
  require(topic_for("clipsync", "home", MessageType::File) == "clipsync/home/content", "files share the content topic");
  require(topic_for("clipsync", "home", MessageType::File, "device-b") == "clipsync/home/content/device-b",
          "directed file");
  require(uses_content_topic(MessageType::File) && !uses_content_topic(MessageType::Ping), "content topic types");
  require(content_filter("clipsync", "home") == "clipsync/home/content/#", "content filter");
  require(control_filter("clipsync", "") == "clipsync/default/control/#", "control filter");

  auto info = parse_topic("clipsync", "clipsync/home/content/device-b");
  require(info && info->group == "home" && info->type == MessageType::Content && info->destination == "device-b",
          "parse content");
  info = parse_topic("clipsync", "clipsync/home/control/ping");
  require(info && info->type == MessageType::Ping && info->subtype == "ping", "parse control");
  require(!parse_topic("clipsync", "other/home/content"), "foreign prefix");
  require(!parse_topic("clipsync", "clipsync/home/control/Bogus"), "unknown control type");
  require(!parse_topic("clipsync", "clipsync/home/control/content"), "content is not a control type");
  return true;
}

bool test_broker_urls(TestContext&) {
  auto a = MqttTransport::parse_broker_url("tcp://broker.local:1884");
  require(a.host == "broker.local" && a.port == 1884, "tcp scheme");
  auto b = MqttTransport::parse_broker_url("mqtt://10.0.0.1");
  require(b.host == "10.0.0.1" && b.port == 1883, "default port");
  auto c = MqttTransport::parse_broker_url("[::1]:2000");
  require(c.host == "::1" && c.port == 2000, "bracketed v6");
  require(throws<TransportError>([]{ MqttTransport::parse_broker_url("ws://broker"); }), "unsupported scheme");
  require(throws<TransportError>([]{ MqttTransport::parse_broker_url("tcp://:1883"); }), "missing host");
  require(throws<TransportError>([]{ MqttTransport::parse_broker_url("tcp://host:70000"); }), "bad port");
  return true;
}

class NullTransport : public TransportClient {
public:
  void connect() override { connected_ = true; }
  void disconnect() override { connected_ = false; }
  bool is_connected() const override { return connected_; }
  void join_group(const std::string&) override {}
  void leave_group(const std::string&) override {}
  std::vector<std::string> list_groups() const override { return {}; }
  void send(const Message&) override {}
  void add_handler(MessageHandler) override {}
  std::string name() const override { return "null"; }

private:
  bool connected_ = false;
};

bool test_transport_registry(TestContext&) {
  TransportRegistry registry;
  register_builtin_transports(registry);
  require(registry.has("mqtt") && !registry.has("null"), "builtin");
  require(throws<TransportError>([&]{ registry.create("null", TransportOptions{}, nullptr); }), "unknown name");

  registry.register_transport("null", [](const TransportOptions&, std::shared_ptr<Logger>){
    return std::make_unique<NullTransport>();
  });
  auto names = registry.names();
  require(names.size() == 2, "two backends");
  auto client = registry.create("null", TransportOptions{}, nullptr);
  client->connect();
  require(client->name() == "null" && client->is_connected(), "custom backend created");
  return true;
}

bool test_publish_subscribe(TestContext& ctx) {
  MiniBroker broker;
  broker.start();
  auto logger = std::make_shared<Logger>("mqtt");
  ctx.logs.attach(logger);

  MqttTransport a(client_options(broker, "device-a"), logger->child("a"));
  MqttTransport b(client_options(broker, "device-b"), logger->child("b"));
  Inbox inbox_a;
  Inbox inbox_b;
  a.add_handler(inbox_a.handler());
  b.add_handler(inbox_b.handler());

  require(throws<TransportError>([&]{ a.send(text_message("early", "device-a", "")); }), "send before connect");

  a.join_group("");
  b.join_group("default");
  require(b.list_groups() == std::vector<std::string>{"default"}, "empty group name means default");
  a.connect();
  b.connect();
  require(a.is_connected() && b.is_connected(), "connected");
  require(wait_for_condition([&]{
    return broker.subscriptions_of("device-b").count("clipsync/default/content/#") == 1;
  }, 2s), "subscribed on connect");

  a.send(text_message("hello from a", "device-a", ""));
  require(inbox_b.wait_for(1), "b receives");
  auto received = inbox_b.messages().front();
  require(received.is_content() && received.source() == "device-a", "source kept");
  require(received.group() == "default", "group from topic");
  auto content = received.clipboard_content();
  require(content && content->data_as_string() == "hello from a", "payload decoded");

  std::this_thread::sleep_for(200ms);
  require(inbox_a.size() == 0, "own message not echoed");

  auto directed = text_message("for c only", "device-a", "").with_destination("device-c");
  a.send(directed);
  a.send(text_message("second", "device-a", ""));
  require(inbox_b.wait_for(2), "b receives broadcast");
  std::this_thread::sleep_for(100ms);
  require(inbox_b.size() == 2, "message for another device skipped");
  require(inbox_b.messages().back().clipboard_content()->data_as_string() == "second", "order kept");

  a.disconnect();
  b.disconnect();
  require(!a.is_connected(), "disconnected");
  return true;
}

bool test_group_isolation(TestContext& ctx) {
  MiniBroker broker;
  broker.start();
  auto logger = std::make_shared<Logger>("mqtt");
  ctx.logs.attach(logger);

  MqttTransport a(client_options(broker, "device-a"), logger->child("a"));
  MqttTransport b(client_options(broker, "device-b"), logger->child("b"));
  Inbox inbox_b;
  b.add_handler(inbox_b.handler());
  a.connect();
  b.connect();
  b.join_group("work");
  b.join_group("work");
  require(b.list_groups().size() == 1, "join is idempotent");

  a.send(text_message("home only", "device-a", "home"));
  a.send(text_message("work item", "device-a", "work"));
  require(inbox_b.wait_for(1), "work delivered");
  std::this_thread::sleep_for(150ms);
  require(inbox_b.size() == 1 && inbox_b.messages().front().group() == "work", "home not delivered");

  b.leave_group("work");
  b.leave_group("never-joined");
  require(b.list_groups().empty(), "left");
  require(broker.subscriptions_of("device-b").empty(), "unsubscribed");
  a.send(text_message("after leave", "device-a", "work"));
  std::this_thread::sleep_for(150ms);
  require(inbox_b.size() == 1, "nothing after leave");

  broker.refuse_filters("clipsync/secret");
  require(throws<TransportError>([&]{ b.join_group("secret"); }), "refused subscription");
  require(b.list_groups().empty(), "refused group not kept");
  return true;
}

bool test_topic_segments(TestContext& ctx) {
  require(is_valid_topic_segment("home") && is_valid_topic_segment("device-b_2"), "plain names");
  require(!is_valid_topic_segment(""), "empty");
  require(!is_valid_topic_segment("a/b") && !is_valid_topic_segment("+") && !is_valid_topic_segment("home#"),
          "topic separators and wildcards");
  require(!is_valid_topic_segment(std::string("a\0b", 3)), "nul byte");

  MiniBroker broker;
  broker.start();
  auto logger = std::make_shared<Logger>("mqtt");
  ctx.logs.attach(logger);

  auto nested = client_options(broker, "device-n");
  nested.topic_prefix = "org/clipsync";
  require(throws<TransportError>([&]{ MqttTransport t(nested, logger->child("n")); }), "nested prefix rejected");

  MqttTransport a(client_options(broker, "device-a"), logger->child("a"));
  a.connect();
  for(const std::string group : {"a/b", "#", "+", "home/+"}) {
    require(throws<TransportError>([&]{ a.join_group(group); }), "wildcard group rejected: " + group);
  }
  require(a.list_groups().empty(), "rejected groups not kept");
  require(broker.subscriptions_of("device-a").empty(), "nothing subscribed");

  require(throws<TransportError>([&]{
    a.send(text_message("x", "device-a", "").with_destination("x/y"));
  }), "destination with separator rejected");
  require(throws<TransportError>([&]{ a.send(text_message("x", "device-a", "home/#")); }),
          "group with wildcard rejected on send");
  require(a.is_connected(), "still connected");
  a.disconnect();
  return true;
}

bool test_oversized_publish(TestContext& ctx) {
  MiniBroker broker;
  broker.start();
  auto logger = std::make_shared<Logger>("mqtt");
  ctx.logs.attach(logger);

  MqttTransport a(client_options(broker, "device-a"), logger->child("a"));
  MqttTransport b(client_options(broker, "device-b"), logger->child("b"));
  Inbox inbox_b;
  b.add_handler(inbox_b.handler());
  a.connect();
  b.connect();
  b.join_group("default");

  const std::string huge(70000, 'd');
  require(throws<TransportError>([&]{
    a.send(text_message("too long a topic", "device-a", "").with_destination(huge));
  }), "unencodable publish fails the caller");
  require(throws<TransportError>([&]{ a.join_group(std::string(70000, 'g')); }),
          "unencodable subscribe fails the caller");
  require(a.list_groups().empty(), "failed group not kept");

  require(a.is_connected(), "connection survives");
  a.send(text_message("still working", "device-a", ""));
  require(inbox_b.wait_for(1), "later publish delivered");
  require(inbox_b.messages().front().clipboard_content()->data_as_string() == "still working", "payload");

  a.disconnect();
  b.disconnect();
  return true;
}

bool test_resubscribe_after_reconnect(TestContext& ctx) {
  MiniBroker broker;
  auto port = broker.start();
  auto logger = std::make_shared<Logger>("mqtt");
  ctx.logs.attach(logger);

  MqttTransport a(client_options(broker, "device-a"), logger->child("a"));
  MqttTransport b(client_options(broker, "device-b"), logger->child("b"));
  Inbox inbox_b;
  b.add_handler(inbox_b.handler());
  b.join_group("home");
  a.connect();
  b.connect();

  broker.stop();
  require(wait_for_condition([&]{ return !b.is_connected(); }, 3s), "loss noticed");
  require(ctx.logs.wait_for_substring("Lost connection to broker", 2s), "loss logged");
  require(throws<TransportError>([&]{ a.send(text_message("while down", "device-a", "home")); }) ||
          !a.is_connected(), "send fails while down");

  broker.start(port);
  require(wait_for_condition([&]{ return a.is_connected() && b.is_connected(); }, 5s), "reconnected");
  require(b.reconnect_count() >= 1, "reconnect counted");
  require(wait_for_condition([&]{
    return broker.subscriptions_of("device-b").count("clipsync/home/content/#") == 1;
  }, 2s), "groups resubscribed");

  a.send(text_message("after restart", "device-a", "home"));
  require(inbox_b.wait_for(1), "delivery resumes");
  require(inbox_b.messages().front().clipboard_content()->data_as_string() == "after restart", "payload");
  return true;
}

bool test_credentials(TestContext& ctx) {
  MiniBroker broker;
  broker.start();
  broker.require_credentials("clip", "board");
  auto logger = std::make_shared<Logger>("mqtt");
  ctx.logs.attach(logger);

  auto options = client_options(broker, "device-a");
  options.username = "clip";
  options.password = "wrong";
  MqttTransport refused(options, logger->child("refused"));
  auto started = std::chrono::steady_clock::now();
  require(throws<TransportError>([&]{ refused.connect(); }), "bad password refused");
  require(std::chrono::steady_clock::now() - started < 2s, "refusal reported without waiting for timeout");
  require(!refused.is_connected(), "not connected");

  options.password = "board";
  MqttTransport accepted(options, logger->child("accepted"));
  accepted.connect();
  require(accepted.is_connected(), "good password accepted");
  accepted.disconnect();
  return true;
}

bool test_handler_isolation(TestContext& ctx) {
  MiniBroker broker;
  broker.start();
  auto logger = std::make_shared<Logger>("mqtt");
  ctx.logs.attach(logger);

  MqttTransport a(client_options(broker, "device-a"), logger->child("a"));
  auto options = client_options(broker, "device-b");
  options.qos = 0;
  MqttTransport b(options, logger->child("b"));
  std::atomic<int> throwing_calls{0};
  b.add_handler([&](const Message&){
    throwing_calls++;
    throw std::runtime_error("handler boom");
  });
  Inbox inbox;
  b.add_handler(inbox.handler());
  a.connect();
  b.connect();
  b.join_group("default");

  a.send(text_message("one", "device-a", ""));
  a.send(text_message("two", "device-a", ""));
  require(inbox.wait_for(2), "second handler still receives");
  require(wait_for_condition([&]{ return throwing_calls == 2; }, 2s), "throwing handler called each time");
  require(ctx.logs.wait_for_substring("handler boom", 1s), "handler failure logged");

  // Undecodable payloads on a content topic are dropped.
  MqttTransport raw(client_options(broker, "device-raw"), logger->child("raw"));
  raw.connect();
  raw.send(Message(MessageType::Content, "device-raw", std::vector<unsigned char>{'n', 'o', 'p', 'e'}));
  require(ctx.logs.wait_for_substring("Dropping undecodable message", 2s), "bad payload dropped");
  require(inbox.size() == 2, "nothing extra delivered");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"codec_packets", test_codec_packets},
    {"topic_matching", test_topic_matching},
    {"topic_scheme", test_topic_scheme},
    {"broker_urls", test_broker_urls},
    {"transport_registry", test_transport_registry},
    {"publish_subscribe", test_publish_subscribe},
    {"group_isolation", test_group_isolation},
    {"topic_segments", test_topic_segments},
    {"oversized_publish", test_oversized_publish},
    {"resubscribe_after_reconnect", test_resubscribe_after_reconnect},
    {"credentials", test_credentials},
    {"handler_isolation", test_handler_isolation}
  };
  return clipsync::test::run_test_cases("transport", tests, argc, argv);
}
