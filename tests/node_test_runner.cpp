#include "clip_sync_node.hpp"
#include "discovery_manager.hpp"
#include "mini_broker.hpp"
#include "settings_manager.hpp"
#include "tcp_peer_host.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using clipsync::test::MiniBroker;
using clipsync::test::TempWorkspace;
using clipsync::test::TestCase;
using clipsync::test::TestContext;
using clipsync::test::require;
using clipsync::test::throws;
using clipsync::test::wait_for_condition;

void configure(const std::shared_ptr<SettingsManager>& settings,
               const std::string& key,
               const nlohmann::json& value) {
  std::string error;
  if(!settings->set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

std::shared_ptr<SettingsManager> node_settings(const std::filesystem::path& root,
                                               const std::string& device_name,
                                               const std::string& broker_url) {
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(root / ".config" / "clipsync.json");
  configure(settings, "listen_ip", "127.0.0.1");
  configure(settings, "listen_port", 0);
  configure(settings, "device_name", device_name);
  configure(settings, "discovery_method", "manual");
  configure(settings, "reconnect_delay", 1);
  if(broker_url.empty()) {
    configure(settings, "transport", "");
  } else {
    configure(settings, "broker_url", broker_url);
  }
  return settings;
}

ClipSyncNode::Options node_options(const std::filesystem::path& root) {
  ClipSyncNode::Options options;
  options.workspace_root = root;
  return options;
}

bool test_identity_persisted(TestContext& ctx) {
  TempWorkspace workspace("node_identity");
  std::string first_id;
  {
    ClipSyncNode node(node_settings(workspace.root(), "desk", ""), node_options(workspace.root()));
    ctx.logs.attach(node, "desk");
    node.load_state();
    first_id = node.peer_id();
    ctx.logs.detach_all();
  }
  require(first_id.rfind("cs-", 0) == 0 && first_id.size() == 35, "generated id");
  require(std::filesystem::exists(workspace.path(".clipsync/identity.json")), "identity file");

  ClipSyncNode again(node_settings(workspace.root(), "desk", ""), node_options(workspace.root()));
  again.load_state();
  require(again.peer_id() == first_id, "identity reused");
  require(again.config().device_name == "desk", "device name");

  auto explicit_settings = node_settings(workspace.root(), "desk", "");
  configure(explicit_settings, "peer_id", "peer-fixed");
  ClipSyncNode fixed(explicit_settings, node_options(workspace.root()));
  fixed.load_state();
  require(fixed.peer_id() == "peer-fixed", "configured id wins");
  return true;
}

bool test_invalid_config(TestContext&) {
  TempWorkspace workspace("node_config");
  auto settings = node_settings(workspace.root(), "desk", "tcp://127.0.0.1:1");
  configure(settings, "qos", 2);
  ClipSyncNode node(settings, node_options(workspace.root()));
  require(throws<ConfigError>([&]{ node.load_state(); }), "qos 2 rejected");

  auto nested_prefix = node_settings(workspace.root(), "desk", "tcp://127.0.0.1:1");
  configure(nested_prefix, "topic_prefix", "org/clipsync");
  ClipSyncNode prefixed(nested_prefix, node_options(workspace.root()));
  require(throws<ConfigError>([&]{ prefixed.load_state(); }), "multi-level topic prefix rejected");

  auto wildcard_group = node_settings(workspace.root(), "desk", "tcp://127.0.0.1:1");
  configure(wildcard_group, "groups", nlohmann::json::array({"home", "a/b"}));
  ClipSyncNode grouped(wildcard_group, node_options(workspace.root()));
  require(throws<ConfigError>([&]{ grouped.load_state(); }), "group with topic separator rejected");

  auto anonymous = node_settings(workspace.root(), "desk", "tcp://127.0.0.1:1");
  configure(anonymous, "password", "hunter2");
  ClipSyncNode secret(anonymous, node_options(workspace.root()));
  require(throws<ConfigError>([&]{ secret.load_state(); }), "password without username rejected");

  auto bad_discovery = node_settings(workspace.root(), "desk", "");
  configure(bad_discovery, "discovery_method", "carrier-pigeon");
  ClipSyncNode other(bad_discovery, node_options(workspace.root()));
  require(throws<ConfigError>([&]{ other.load_state(); }), "unknown discovery method");
  require(throws<std::logic_error>([&]{ other.pair_with("127.0.0.1:1"); }), "pairing needs loaded state");
  return true;
}

bool test_sync_through_broker(TestContext& ctx) {
  MiniBroker broker;
  broker.start();
  TempWorkspace workspace("node_sync");
  auto root_a = workspace.path("a");
  auto root_b = workspace.path("b");

  ClipSyncNode a(node_settings(root_a, "alpha", broker.url()), node_options(root_a));
  ClipSyncNode b(node_settings(root_b, "bravo", broker.url()), node_options(root_b));
  ctx.logs.attach(a, "alpha");
  ctx.logs.attach(b, "bravo");

  std::mutex m;
  std::vector<std::string> received;
  std::vector<std::string> sources;
  b.add_content_handler([&](const ClipboardContent& content, const Message& message){
    std::lock_guard lg(m);
    received.push_back(content.data_as_string());
    sources.push_back(message.source());
  });
  a.start_background();
  b.start_background();

  auto stats = a.stats();
  require(stats.transport_connected, "a connected");
  require(stats.groups == std::vector<std::string>{"default"}, "default group joined");
  require(stats.discovery_backends == std::vector<std::string>{"manual"}, "manual discovery only");
  require(wait_for_condition([&]{
    return broker.subscriptions_of(b.peer_id()).count("clipsync/default/content/#") == 1;
  }, 2s), "b subscribed");

  a.send_content(ClipboardContent::text("copied on alpha"));
  require(wait_for_condition([&]{
    std::lock_guard lg(m);
    return !received.empty();
  }, 3s), "b received content");
  {
    std::lock_guard lg(m);
    require(received.front() == "copied on alpha", "content");
    require(sources.front() == a.peer_id(), "source is the sending node");
  }

  b.join_group("office");
  a.send_content(ClipboardContent::text("office only"), "office");
  require(wait_for_condition([&]{
    std::lock_guard lg(m);
    return received.size() == 2;
  }, 3s), "group content received");
  b.leave_group("office");
  require(b.stats().groups.size() == 1, "left office");

  b.stop();
  a.stop();
  require(!a.stats().transport_connected, "disconnected on stop");
  return true;
}

bool test_pairing_between_nodes(TestContext& ctx) {
  TempWorkspace workspace("node_pairing");
  auto root_a = workspace.path("a");
  auto root_b = workspace.path("b");

  std::string b_id;
  {
    ClipSyncNode a(node_settings(root_a, "alpha", ""), node_options(root_a));
    ClipSyncNode b(node_settings(root_b, "bravo", ""), node_options(root_b));
    ctx.logs.attach(a, "alpha");
    ctx.logs.attach(b, "bravo");
    a.start();
    b.start();
    b_id = b.peer_id();
    require(throws<TransportError>([&]{ a.send_content(ClipboardContent::text("x")); }), "no transport");

    std::string shown;
    auto address = b.enable_pairing([&](const PairingRequest& request, const std::string& code){
      shown = code;
      return request.device_name == "alpha";
    });
    auto result = a.pair_with(address);
    require(result.code == shown, "codes match");
    require(a.stats().paired_devices == 1 && b.stats().paired_devices == 1, "paired both ways");
    b.disable_pairing();

    require(wait_for_condition([&]{ return a.discovery()->peer(b_id).has_value(); }, 3s),
            "paired address handed to manual discovery");
    require(ctx.logs.wait_for_substring("Manually adding peer", 1s), "registrar used");

    b.stop();
    a.stop();
    ctx.logs.detach_all();
  }

  ClipSyncNode a(node_settings(root_a, "alpha", ""), node_options(root_a));
  a.load_state();
  require(a.pairing()->is_paired(b_id), "paired device reloaded");
  require(a.discovery()->peer(b_id).has_value(), "known peer reloaded");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"identity_persisted", test_identity_persisted},
    {"invalid_config", test_invalid_config},
    {"sync_through_broker", test_sync_through_broker},
    {"pairing_between_nodes", test_pairing_between_nodes}
  };
  return clipsync::test::run_test_cases("node", tests, argc, argv);
}
