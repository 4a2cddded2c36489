#include "pairing.hpp"
#include "tcp_peer_host.hpp"
#include "test_runner_utils.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using clipsync::test::TestCase;
using clipsync::test::TestContext;
using clipsync::test::require;
using clipsync::test::throws;

std::unique_ptr<TcpPeerHost> make_host(const std::string& id) {
  TcpPeerHost::Options options;
  options.peer_id = id;
  options.listen_ip = "127.0.0.1";
  options.listen_port = 0;
  auto host = std::make_unique<TcpPeerHost>(options, std::make_shared<Logger>(id + "/host"));
  host->start();
  return host;
}

PairingManager::Options pairing_options(const std::string& name, const std::filesystem::path& registry) {
  PairingManager::Options options;
  options.device_name = name;
  options.device_type = "desktop";
  options.registry_path = registry;
  options.request_timeout = 5s;
  return options;
}

class RecordingRegistrar : public PeerRegistrar {
public:
  void add_peer(const std::string& address) override {
    std::lock_guard lg(m_);
    added_.push_back(address);
  }

  bool remove_peer(const std::string&) override { return false; }

  std::vector<std::string> added() const {
    std::lock_guard lg(m_);
    return added_;
  }

private:
  mutable std::mutex m_;
  std::vector<std::string> added_;
};

// Two hosts on loopback, each with a pairing manager.
struct PairingFixture {
  PairingFixture(TestContext& ctx, const std::string& name)
    : workspace(name),
      log_a(std::make_shared<Logger>("alpha")),
      log_b(std::make_shared<Logger>("bravo")),
      host_a(make_host("peer-alpha")),
      host_b(make_host("peer-bravo")),
      alpha(*host_a, pairing_options("alpha", workspace.path("alpha/paired_devices.json")), log_a),
      bravo(*host_b, pairing_options("bravo", workspace.path("bravo/paired_devices.json")), log_b) {
    ctx.logs.attach(log_a, "alpha");
    ctx.logs.attach(log_b, "bravo");
    alpha.start();
    bravo.start();
  }

  ~PairingFixture() {
    alpha.shutdown();
    bravo.shutdown();
    host_a->stop();
    host_b->stop();
  }

  clipsync::test::TempWorkspace workspace;
  std::shared_ptr<Logger> log_a;
  std::shared_ptr<Logger> log_b;
  std::unique_ptr<TcpPeerHost> host_a;
  std::unique_ptr<TcpPeerHost> host_b;
  PairingManager alpha;
  PairingManager bravo;
};

bool test_verification_code(TestContext&) {
  require(compute_verification_code("abc", "def") == "382179", "abc+def");
  require(compute_verification_code("AAAA", "BBBB") == "072547", "zero padded code");
  require(compute_verification_code("def", "abc") == "358130", "order matters");
  auto code = compute_verification_code("some-random", "other-random");
  require(code.size() == 6, "six digits");
  require(code == compute_verification_code("some-random", "other-random"), "deterministic");
  return true;
}

bool test_attempt_state_machine(TestContext&) {
  require(is_valid_transition(AttemptState::Idle, AttemptState::RequestSent), "idle -> sent");
  require(is_valid_transition(AttemptState::AwaitingResponse, AttemptState::TimedOut), "awaiting -> timeout");
  require(!is_valid_transition(AttemptState::Idle, AttemptState::Accepted), "idle -> accepted");
  require(!is_valid_transition(AttemptState::Rejected, AttemptState::Accepted), "rejected -> accepted");
  require(is_terminal(AttemptState::TimedOut) && !is_terminal(AttemptState::RequestSent), "terminal states");

  PairingAttempt attempt;
  require(attempt.begin("peer-x"), "first begin");
  require(!attempt.begin("peer-y"), "second begin while active");
  attempt.advance(AttemptState::RequestSent);
  require(throws<std::logic_error>([&]{ attempt.advance(AttemptState::Accepted); }), "skip awaiting");
  attempt.advance(AttemptState::AwaitingResponse);
  attempt.advance(AttemptState::Rejected);
  attempt.finish();
  require(!attempt.active(), "released");
  require(attempt.state() == AttemptState::Rejected, "last state observable");
  require(attempt.begin("peer-y"), "begin after finish");
  require(attempt.state() == AttemptState::Idle && attempt.peer_id() == "peer-y", "reset on begin");
  return true;
}

bool test_zero_timestamp_encoding(TestContext&) {
  PairingResponse response;
  response.accepted = true;
  response.peer_id = "peer-z";
  nlohmann::json j = response;
  require(j.at("timestamp") == "0001-01-01T00:00:00Z", "zero time literal");
  auto back = j.get<PairingResponse>();
  require(back.timestamp == TimePoint{} && back.valid_until == TimePoint{}, "zero time parsed");
  require(back.accepted && back.peer_id == "peer-z", "fields kept");
  return true;
}

bool test_handshake_accepted(TestContext& ctx) {
  PairingFixture f(ctx, "pairing_accept");

  RecordingRegistrar registrar;
  f.alpha.set_peer_registrar(&registrar);

  std::mutex m;
  std::string shown_code;
  std::string requester;
  auto address = f.bravo.enable_pairing([&](const PairingRequest& request, const std::string& code){
    std::lock_guard lg(m);
    shown_code = code;
    requester = request.device_name;
    return true;
  });
  require(f.bravo.is_pairing_enabled(), "pairing enabled");

  auto result = f.alpha.request_pairing(address);
  {
    std::lock_guard lg(m);
    require(result.code == shown_code, "both sides derive the same code");
    require(requester == "alpha", "request carries device name");
  }
  require(result.device.peer_id == "peer-bravo", "paired device id");
  require(result.device.device_name == "bravo", "paired device name");
  require(!result.device.addresses.empty(), "initiator records an address");
  require(f.alpha.attempt_state() == AttemptState::Accepted, "attempt accepted");

  require(f.alpha.is_paired("peer-bravo"), "alpha registry");
  require(f.bravo.is_paired("peer-alpha"), "bravo registry");
  require(std::filesystem::exists(f.workspace.path("alpha/paired_devices.json")), "alpha persisted");
  require(std::filesystem::exists(f.workspace.path("bravo/paired_devices.json")), "bravo persisted");
  require(registrar.added().size() == 1, "registrar received the address");
  return true;
}

bool test_handshake_rejected(TestContext& ctx) {
  PairingFixture f(ctx, "pairing_reject");
  auto address = f.bravo.enable_pairing([](const PairingRequest&, const std::string&){ return false; });

  bool rejected = false;
  try {
    f.alpha.request_pairing(address);
  } catch(const PairingError& e) {
    rejected = e.code() == PairingError::Code::Rejected;
  }
  require(rejected, "rejection surfaces as Rejected");
  require(f.alpha.attempt_state() == AttemptState::Rejected, "attempt rejected");
  require(!f.alpha.is_paired("peer-bravo") && !f.bravo.is_paired("peer-alpha"), "nothing stored");

  // The slot is released, so a second attempt may run.
  f.bravo.enable_pairing([](const PairingRequest&, const std::string&){ return true; });
  auto result = f.alpha.request_pairing(address);
  require(result.device.peer_id == "peer-bravo", "retry succeeds");
  return true;
}

bool test_pairing_disabled(TestContext& ctx) {
  PairingFixture f(ctx, "pairing_disabled");
  auto address = f.bravo.enable_pairing([](const PairingRequest&, const std::string&){ return true; });
  f.bravo.disable_pairing();
  f.bravo.disable_pairing();
  require(!f.bravo.is_pairing_enabled(), "disabled");

  std::string message;
  bool rejected = false;
  try {
    f.alpha.request_pairing(address);
  } catch(const PairingError& e) {
    rejected = e.code() == PairingError::Code::Rejected;
    message = e.what();
  }
  require(rejected, "disabled responder rejects");
  require(message.find("not enabled") != std::string::npos, "reason forwarded");
  return true;
}

bool test_request_validation(TestContext& ctx) {
  PairingFixture f(ctx, "pairing_validation");
  auto code_of = [&](const std::string& address){
    try {
      f.alpha.request_pairing(address);
    } catch(const PairingError& e) {
      return e.code();
    }
    throw std::runtime_error("expected a pairing error for " + address);
  };
  require(code_of("not an address") == PairingError::Code::InvalidAddress, "invalid address");
  auto own = f.host_a->listen_addresses().front().with_peer_id("peer-alpha").to_string();
  require(code_of(own) == PairingError::Code::SelfPairing, "self pairing");
  require(code_of("/ip4/127.0.0.1/tcp/1/p2p/peer-nobody") == PairingError::Code::ConnectFailed, "unreachable");
  require(f.alpha.attempt_state() == AttemptState::Failed, "failed attempt observable");
  return true;
}

bool test_auto_disable(TestContext& ctx) {
  clipsync::test::TempWorkspace workspace("pairing_auto_disable");
  auto host = make_host("peer-timer");
  auto options = pairing_options("timer", workspace.path("paired.json"));
  options.auto_disable = 200ms;
  auto logger = std::make_shared<Logger>("timer");
  ctx.logs.attach(logger);
  PairingManager manager(*host, options, logger);
  manager.start();
  manager.enable_pairing([](const PairingRequest&, const std::string&){ return true; });
  require(manager.is_pairing_enabled(), "enabled");
  bool off = clipsync::test::wait_for_condition([&]{ return !manager.is_pairing_enabled(); }, 3s);
  bool logged = ctx.logs.wait_for_substring("Pairing mode timed out", 1s);
  manager.shutdown();
  host->stop();
  return off && logged;
}

bool test_registry_persistence(TestContext& ctx) {
  clipsync::test::TempWorkspace workspace("pairing_registry");
  auto host = make_host("peer-registry");
  auto registry = workspace.path("data/paired_devices.json");
  std::filesystem::create_directories(registry.parent_path());
  {
    std::ofstream out(registry);
    out << nlohmann::json{
      {"peer-one", {{"peer_id", "peer-one"}, {"device_name", "laptop"}, {"device_type", "desktop"},
                    {"addresses", {"/ip4/10.0.0.2/tcp/4001/p2p/peer-one"}},
                    {"paired_at", "2024-05-01T10:00:00Z"}, {"last_seen", "2024-05-01T10:00:00Z"}}}
    }.dump(2);
  }

  auto logger = std::make_shared<Logger>("registry");
  ctx.logs.attach(logger);
  {
    PairingManager manager(*host, pairing_options("registry", registry), logger);
    require(manager.load_paired_devices(), "load");
    require(manager.is_paired("peer-one"), "entry loaded");
    auto device = *manager.paired_device("peer-one");
    require(device.device_name == "laptop", "name loaded");
    device.device_name = "work laptop";
    manager.update_paired_device(device);
    require(manager.touch("peer-one", {"/ip4/10.0.0.3/tcp/4001/p2p/peer-one"}), "touch known");
    require(!manager.touch("peer-unknown"), "touch unknown");
    bool unknown = false;
    try {
      manager.remove_paired_device("peer-unknown");
    } catch(const PairingError& e) {
      unknown = e.code() == PairingError::Code::UnknownDevice;
    }
    require(unknown, "remove unknown");
  }
  {
    PairingManager manager(*host, pairing_options("registry", registry), logger);
    require(manager.load_paired_devices(), "reload");
    auto device = manager.paired_device("peer-one");
    require(device && device->device_name == "work laptop", "update persisted");
    require(device->addresses.size() == 1 && device->addresses.front().find("10.0.0.3") != std::string::npos,
            "touch persisted addresses");
    manager.remove_paired_device("peer-one");
  }
  {
    PairingManager manager(*host, pairing_options("registry", registry), logger);
    require(manager.load_paired_devices() && manager.paired_devices().empty(), "removal persisted");
  }
  {
    std::ofstream out(registry, std::ios::trunc);
    out << "{ not json";
  }
  PairingManager manager(*host, pairing_options("registry", registry), logger);
  require(!manager.load_paired_devices(), "corrupt file reported");
  require(manager.paired_devices().empty(), "corrupt file yields empty registry");
  host->stop();
  return true;
}

bool test_request_timeout(TestContext& ctx) {
  clipsync::test::TempWorkspace workspace("pairing_timeout");
  auto logger = std::make_shared<Logger>("waiting");
  ctx.logs.attach(logger);

  // Reads the request and never answers.
  std::atomic<bool> released{false};
  auto silent = make_host("peer-silent");
  silent->set_stream_handler(PairingManager::kProtocol, [&](std::shared_ptr<Stream> stream){
    stream->read_line(5s);
    stream->read_line(5s);
    clipsync::test::wait_for_condition([&]{ return released.load(); }, 5s);
    stream->close();
  });

  auto host = make_host("peer-waiting");
  auto options = pairing_options("waiting", workspace.path("paired.json"));
  options.request_timeout = 1s;
  PairingManager manager(*host, options, logger);
  manager.start();

  auto address = silent->listen_addresses().front().with_peer_id("peer-silent").to_string();
  auto started = std::chrono::steady_clock::now();
  bool timed_out = false;
  try {
    manager.request_pairing(address);
  } catch(const PairingError& e) {
    timed_out = e.code() == PairingError::Code::Timeout;
  }
  auto elapsed = std::chrono::steady_clock::now() - started;
  released = true;

  require(timed_out, "silent responder times out");
  require(elapsed >= 900ms && elapsed < 3s, "bounded by request_timeout");
  require(manager.paired_devices().empty(), "registry unchanged");
  require(manager.attempt_state() == AttemptState::TimedOut, "attempt timed out");
  require(!std::filesystem::exists(workspace.path("paired.json")), "nothing persisted");

  manager.shutdown();
  host->stop();
  silent->stop();
  return true;
}

bool test_responder_commits_on_verify(TestContext& ctx) {
  PairingFixture f(ctx, "pairing_verify");
  auto address = f.bravo.enable_pairing([](const PairingRequest&, const std::string&){ return true; });
  auto charlie = make_host("peer-charlie");
  auto bravo_id = charlie->connect(PeerAddress::parse(address), 5s);

  auto send_request = [&]{
    PairingRequest request;
    request.device_name = "charlie";
    request.peer_id = "peer-charlie";
    request.random_data = "charlie-random";
    auto stream = charlie->open_stream(bravo_id, PairingManager::kProtocol, 5s);
    stream->write_line("REQUEST");
    stream->write_line(nlohmann::json(request).dump());
    auto response = nlohmann::json::parse(stream->read_line(5s)).get<PairingResponse>();
    stream->close();
    return response;
  };
  auto verify = [&](const std::string& code){
    auto stream = charlie->open_stream(bravo_id, PairingManager::kProtocol, 5s);
    stream->write_line("VERIFY");
    stream->write_line(nlohmann::json{{"peer_id", "peer-charlie"}, {"pairing_code", code}}.dump());
    auto reply = nlohmann::json::parse(stream->read_line(5s));
    stream->close();
    return reply.value("verified", false);
  };

  auto response = send_request();
  require(response.accepted, "request accepted");
  require(!f.bravo.is_paired("peer-charlie"), "nothing committed before VERIFY");
  require(f.bravo.pending_verifications() == 1, "verification pending");

  require(!verify(""), "mismatch refused");
  require(!f.bravo.is_paired("peer-charlie"), "mismatch leaves registry unchanged");
  require(f.bravo.pending_verifications() == 0, "mismatch discards the pending entry");
  require(!verify(response.pairing_code), "nothing left to verify");

  response = send_request();
  auto expected = compute_verification_code("charlie-random", response.random_data);
  require(response.pairing_code == expected, "responder code");
  require(verify(expected), "matching code verified");
  require(f.bravo.is_paired("peer-charlie"), "committed after VERIFY");
  charlie->stop();

  // An initiator that never verifies leaves nothing behind.
  clipsync::test::TempWorkspace workspace("pairing_verify_expiry");
  auto logger = std::make_shared<Logger>("echo");
  ctx.logs.attach(logger);
  auto echo_host = make_host("peer-echo");
  auto options = pairing_options("echo", workspace.path("paired.json"));
  options.request_timeout = 200ms;
  PairingManager echo(*echo_host, options, logger);
  echo.start();
  auto echo_address = echo.enable_pairing([](const PairingRequest&, const std::string&){ return true; });
  auto foxtrot = make_host("peer-foxtrot");
  auto echo_id = foxtrot->connect(PeerAddress::parse(echo_address), 5s);
  {
    PairingRequest request;
    request.peer_id = "peer-foxtrot";
    request.random_data = "foxtrot-random";
    auto stream = foxtrot->open_stream(echo_id, PairingManager::kProtocol, 5s);
    stream->write_line("REQUEST");
    stream->write_line(nlohmann::json(request).dump());
    require(nlohmann::json::parse(stream->read_line(5s)).value("accepted", false), "foxtrot accepted");
    stream->close();
  }
  require(clipsync::test::wait_for_condition([&]{ return echo.pending_verifications() == 0; }, 2s),
          "pending entry expires");
  require(!echo.is_paired("peer-foxtrot"), "expired request never committed");
  echo.shutdown();
  foxtrot->stop();
  echo_host->stop();
  return true;
}

bool test_initiator_rejects_code_mismatch(TestContext& ctx) {
  PairingFixture f(ctx, "pairing_mismatch");

  // Accepts every request but reports a code it did not derive.
  std::mutex m;
  std::vector<std::string> verify_codes;
  auto delta = make_host("peer-delta");
  delta->set_stream_handler(PairingManager::kProtocol, [&](std::shared_ptr<Stream> stream){
    auto marker = stream->read_line(5s);
    auto body = nlohmann::json::parse(stream->read_line(5s));
    if(marker == "REQUEST") {
      PairingResponse response;
      response.accepted = true;
      response.peer_id = "peer-delta";
      response.device_name = "delta";
      response.random_data = "delta-random";
      response.pairing_code = "wrong!";
      stream->write_line(nlohmann::json(response).dump());
    } else {
      {
        std::lock_guard lg(m);
        verify_codes.push_back(body.value("pairing_code", "?"));
      }
      stream->write_line(nlohmann::json{{"verified", false}}.dump());
    }
    stream->close();
  });

  auto address = delta->listen_addresses().front().with_peer_id("peer-delta").to_string();
  bool mismatch = false;
  try {
    f.alpha.request_pairing(address);
  } catch(const PairingError& e) {
    mismatch = e.code() == PairingError::Code::VerificationFailed;
  }
  require(mismatch, "mismatch surfaces as VerificationFailed");
  require(!f.alpha.is_paired("peer-delta"), "initiator stores nothing");
  require(f.alpha.attempt_state() == AttemptState::Failed, "attempt failed");
  {
    std::lock_guard lg(m);
    require(verify_codes.size() == 1 && verify_codes.front().empty(), "responder told of the mismatch");
  }
  delta->stop();
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"verification_code", test_verification_code},
    {"attempt_state_machine", test_attempt_state_machine},
    {"zero_timestamp_encoding", test_zero_timestamp_encoding},
    {"handshake_accepted", test_handshake_accepted},
    {"handshake_rejected", test_handshake_rejected},
    {"pairing_disabled", test_pairing_disabled},
    {"request_validation", test_request_validation},
    {"auto_disable", test_auto_disable},
    {"registry_persistence", test_registry_persistence},
    {"request_timeout", test_request_timeout},
    {"responder_commits_on_verify", test_responder_commits_on_verify},
    {"initiator_rejects_code_mismatch", test_initiator_rejects_code_mismatch}
  };
  return clipsync::test::run_test_cases("pairing", tests, argc, argv);
}
