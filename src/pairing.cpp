#include "pairing.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;
using Code = PairingError::Code;

namespace {

constexpr const char* kZeroTime = "0001-01-01T00:00:00Z";
constexpr std::size_t kRandomBytes = 16;

json optional_time_to_json(TimePoint tp) {
  if(tp == TimePoint{}) return kZeroTime;
  return time_to_json(tp);
}

TimePoint optional_time_from_json(const json& j, const char* key) {
  if(!j.contains(key) || !j.at(key).is_string()) return TimePoint{};
  auto text = j.at(key).get<std::string>();
  if(text.rfind("0001-01-01", 0) == 0) return TimePoint{};
  return time_from_json(j.at(key));
}

struct Transition {
  AttemptState from;
  AttemptState to;
};

const Transition kTransitions[] = {
  {AttemptState::Idle, AttemptState::RequestSent},
  {AttemptState::Idle, AttemptState::Failed},
  {AttemptState::RequestSent, AttemptState::AwaitingResponse},
  {AttemptState::RequestSent, AttemptState::TimedOut},
  {AttemptState::RequestSent, AttemptState::Failed},
  {AttemptState::AwaitingResponse, AttemptState::Accepted},
  {AttemptState::AwaitingResponse, AttemptState::Rejected},
  {AttemptState::AwaitingResponse, AttemptState::TimedOut},
  {AttemptState::AwaitingResponse, AttemptState::Failed},
  {AttemptState::Accepted, AttemptState::Failed},
  {AttemptState::Accepted, AttemptState::Idle},
  {AttemptState::Rejected, AttemptState::Idle},
  {AttemptState::TimedOut, AttemptState::Idle},
  {AttemptState::Failed, AttemptState::Idle},
};

} // namespace

std::string to_string(PairingError::Code code) {
  switch(code) {
    case Code::InvalidAddress: return "invalid_address";
    case Code::SelfPairing: return "self_pairing";
    case Code::AlreadyInProgress: return "already_in_progress";
    case Code::ConnectFailed: return "connect_failed";
    case Code::Timeout: return "timeout";
    case Code::Rejected: return "rejected";
    case Code::ProtocolError: return "protocol_error";
    case Code::VerificationFailed: return "verification_failed";
    case Code::UnknownDevice: return "unknown_device";
  }
  return "unknown";
}

std::string to_string(AttemptState state) {
  switch(state) {
    case AttemptState::Idle: return "idle";
    case AttemptState::RequestSent: return "request_sent";
    case AttemptState::AwaitingResponse: return "awaiting_response";
    case AttemptState::Accepted: return "accepted";
    case AttemptState::Rejected: return "rejected";
    case AttemptState::TimedOut: return "timed_out";
    case AttemptState::Failed: return "failed";
  }
  return "unknown";
}

bool is_valid_transition(AttemptState from, AttemptState to) {
  for(const auto& t : kTransitions) {
    if(t.from == from && t.to == to) return true;
  }
  return false;
}

bool is_terminal(AttemptState state) {
  return state == AttemptState::Accepted || state == AttemptState::Rejected ||
         state == AttemptState::TimedOut || state == AttemptState::Failed;
}

// ---- PairingAttempt --------------------------------------------------------

bool PairingAttempt::begin(const std::string& peer_id) {
  std::lock_guard lg(m_);
  if(active_) return false;
  active_ = true;
  state_ = AttemptState::Idle;
  peer_id_ = peer_id;
  return true;
}

void PairingAttempt::advance(AttemptState next) {
  std::lock_guard lg(m_);
  if(!is_valid_transition(state_, next)) {
    throw std::logic_error("invalid pairing transition " + to_string(state_) + " -> " + to_string(next));
  }
  state_ = next;
}

void PairingAttempt::finish() {
  std::lock_guard lg(m_);
  active_ = false;
}

AttemptState PairingAttempt::state() const {
  std::lock_guard lg(m_);
  return state_;
}

std::string PairingAttempt::peer_id() const {
  std::lock_guard lg(m_);
  return peer_id_;
}

bool PairingAttempt::active() const {
  std::lock_guard lg(m_);
  return active_;
}

// ---- wire records ----------------------------------------------------------

void to_json(json& j, const PairingRequest& r) {
  j = json{
    {"device_name", r.device_name},
    {"device_type", r.device_type},
    {"timestamp", optional_time_to_json(r.timestamp)},
    {"random_data", r.random_data},
    {"peer_id", r.peer_id},
    {"nonce", r.nonce},
    {"metadata", r.metadata}
  };
}

void from_json(const json& j, PairingRequest& r) {
  r.device_name = j.value("device_name", "");
  r.device_type = j.value("device_type", "");
  r.timestamp = optional_time_from_json(j, "timestamp");
  r.random_data = j.value("random_data", "");
  r.peer_id = j.value("peer_id", "");
  r.nonce = j.value("nonce", "");
  r.metadata = field_or_empty<std::map<std::string, std::string>>(j, "metadata");
}

void to_json(json& j, const PairingResponse& r) {
  j = json{
    {"accepted", r.accepted},
    {"error_message", r.error_message},
    {"pairing_code", r.pairing_code},
    {"device_name", r.device_name},
    {"device_type", r.device_type},
    {"timestamp", optional_time_to_json(r.timestamp)},
    {"random_data", r.random_data},
    {"peer_id", r.peer_id},
    {"metadata", r.metadata},
    {"valid_until", optional_time_to_json(r.valid_until)}
  };
}

void from_json(const json& j, PairingResponse& r) {
  r.accepted = j.value("accepted", false);
  r.error_message = j.value("error_message", "");
  r.pairing_code = j.value("pairing_code", "");
  r.device_name = j.value("device_name", "");
  r.device_type = j.value("device_type", "");
  r.timestamp = optional_time_from_json(j, "timestamp");
  r.random_data = j.value("random_data", "");
  r.peer_id = j.value("peer_id", "");
  r.metadata = field_or_empty<std::map<std::string, std::string>>(j, "metadata");
  r.valid_until = optional_time_from_json(j, "valid_until");
}

std::string compute_verification_code(const std::string& initiator_random,
                                      const std::string& responder_random) {
  auto combined = initiator_random + responder_random;
  auto mac = hmac_sha256(combined, combined);
  uint32_t value = (static_cast<uint32_t>(mac[0]) << 24) |
                   (static_cast<uint32_t>(mac[1]) << 16) |
                   (static_cast<uint32_t>(mac[2]) << 8) |
                   static_cast<uint32_t>(mac[3]);
  return fmt::format("{:06}", value % 1000000);
}

// ---- PairingManager --------------------------------------------------------

PairingManager::PairingManager(PeerHost& host, Options options, std::shared_ptr<Logger> logger)
  : host_(host),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("pairing")),
    work_(std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor())),
    auto_disable_timer_(io_) {
  timer_thread_ = std::thread([this]{ io_.run(); });
}

PairingManager::~PairingManager() {
  shutdown();
}

void PairingManager::start() {
  {
    std::lock_guard lg(m_);
    if(started_) return;
    started_ = true;
  }
  bool loaded = false;
  {
    std::lock_guard lg(m_);
    loaded = loaded_;
  }
  if(!loaded) load_paired_devices();
  host_.set_stream_handler(kProtocol, [this](std::shared_ptr<Stream> stream){
    handle_stream(std::move(stream));
  });
  logger_->info("Pairing manager started with {} paired devices", paired_devices().size());
}

void PairingManager::shutdown() {
  bool was_started = false;
  {
    std::lock_guard lg(m_);
    was_started = started_;
    started_ = false;
    mode_ = PairingMode::Disabled;
    handler_ = nullptr;
    ++generation_;
  }
  if(was_started) host_.remove_stream_handler(kProtocol);
  if(timer_thread_.joinable()) {
    work_.reset();
    io_.stop();
    timer_thread_.join();
  }
}

std::string PairingManager::enable_pairing(PairingRequestHandler handler) {
  uint64_t generation = 0;
  {
    std::lock_guard lg(m_);
    mode_ = PairingMode::Enabled;
    handler_ = std::move(handler);
    generation = ++generation_;
  }
  asio::post(io_, [this, generation]{ arm_auto_disable(generation); });

  auto addrs = host_.listen_addresses();
  auto address = addrs.empty() ? host_.id() : addrs.front().with_peer_id(host_.id()).to_string();
  logger_->info("Pairing enabled, share address {}", address);
  return address;
}

void PairingManager::disable_pairing() {
  {
    std::lock_guard lg(m_);
    if(mode_ == PairingMode::Disabled) return;
    mode_ = PairingMode::Disabled;
    handler_ = nullptr;
    ++generation_;
  }
  asio::post(io_, [this]{ auto_disable_timer_.cancel(); });
  logger_->info("Pairing disabled");
}

PairingMode PairingManager::mode() const {
  std::lock_guard lg(m_);
  return mode_;
}

void PairingManager::arm_auto_disable(uint64_t generation) {
  auto_disable_timer_.cancel();
  if(options_.auto_disable.count() <= 0) return;
  auto_disable_timer_.expires_after(options_.auto_disable);
  auto_disable_timer_.async_wait([this, generation](const asio::error_code& ec){
    if(ec) return;
    {
      std::lock_guard lg(m_);
      if(generation_ != generation || mode_ == PairingMode::Disabled) return;
      mode_ = PairingMode::Disabled;
      handler_ = nullptr;
      ++generation_;
    }
    logger_->info("Pairing mode timed out");
  });
}

void PairingManager::set_peer_registrar(PeerRegistrar* registrar) {
  std::lock_guard lg(m_);
  registrar_ = registrar;
}

PairingRequest PairingManager::make_request() const {
  PairingRequest r;
  r.device_name = options_.device_name;
  r.device_type = options_.device_type;
  r.timestamp = utc_now();
  r.random_data = base64_encode(random_bytes(kRandomBytes));
  r.peer_id = host_.id();
  r.nonce = base64url_encode(random_bytes(kRandomBytes));
  r.metadata["version"] = kVersion;
  return r;
}

PairingResponse PairingManager::make_response(bool accepted, const std::string& error) const {
  PairingResponse r;
  r.accepted = accepted;
  r.error_message = error;
  r.device_name = options_.device_name;
  r.device_type = options_.device_type;
  r.timestamp = utc_now();
  r.random_data = base64_encode(random_bytes(kRandomBytes));
  r.peer_id = host_.id();
  r.metadata["version"] = kVersion;
  return r;
}

PairedDevice PairingManager::make_device(const std::string& peer_id,
                                         const std::string& name,
                                         const std::string& type,
                                         const std::map<std::string, std::string>& metadata) const {
  PairedDevice d;
  d.peer_id = peer_id;
  d.device_name = name;
  d.device_type = type;
  for(const auto& a : host_.addresses_of(peer_id)) {
    d.addresses.push_back(a.with_peer_id(peer_id).to_string());
  }
  d.metadata = metadata;
  d.paired_at = utc_now();
  d.last_seen = d.paired_at;
  return d;
}

PairingResult PairingManager::request_pairing(const std::string& address) {
  PeerAddress target;
  try {
    target = PeerAddress::parse(address);
  } catch(const std::invalid_argument& e) {
    throw PairingError(Code::InvalidAddress, "invalid pairing address '" + address + "': " + e.what());
  }
  if(!target.peer_id.empty() && target.peer_id == host_.id()) {
    throw PairingError(Code::SelfPairing, "cannot pair with self");
  }
  if(!attempt_.begin(target.peer_id)) {
    throw PairingError(Code::AlreadyInProgress, "a pairing attempt is already in progress");
  }

  try {
    std::string peer_id = target.peer_id;
    if(peer_id.empty() || !host_.is_connected(peer_id)) {
      try {
        peer_id = host_.connect(target, options_.request_timeout);
      } catch(const std::exception& e) {
        throw PairingError(Code::ConnectFailed, std::string("failed to connect: ") + e.what());
      }
      if(peer_id == host_.id()) throw PairingError(Code::SelfPairing, "cannot pair with self");
    }

    std::shared_ptr<Stream> stream;
    auto request = make_request();
    try {
      stream = host_.open_stream(peer_id, kProtocol, options_.request_timeout);
      stream->write_line("REQUEST");
      stream->write_line(json(request).dump());
    } catch(const std::exception& e) {
      throw PairingError(Code::ConnectFailed, std::string("failed to send pairing request: ") + e.what());
    }
    attempt_.advance(AttemptState::RequestSent);
    logger_->info("Sent pairing request to {}", peer_id);
    attempt_.advance(AttemptState::AwaitingResponse);

    std::string line;
    try {
      line = stream->read_line(options_.request_timeout);
    } catch(const StreamTimeout&) {
      stream->close();
      throw PairingError(Code::Timeout, fmt::format("no pairing response within {} ms",
                                                    options_.request_timeout.count()));
    } catch(const PeerHostError& e) {
      stream->close();
      throw PairingError(Code::ProtocolError, std::string("failed to read pairing response: ") + e.what());
    }
    stream->close();

    PairingResponse response;
    try {
      response = json::parse(line).get<PairingResponse>();
    } catch(const std::exception& e) {
      throw PairingError(Code::ProtocolError, std::string("malformed pairing response: ") + e.what());
    }
    if(!response.accepted) {
      attempt_.advance(AttemptState::Rejected);
      throw PairingError(Code::Rejected,
                         response.error_message.empty() ? "Pairing request rejected" : response.error_message);
    }
    attempt_.advance(AttemptState::Accepted);

    // The responder commits only on a matching VERIFY, so a mismatch is
    // still reported to it, with an empty code.
    auto code = compute_verification_code(request.random_data, response.random_data);
    const bool codes_match = response.pairing_code == code;
    bool verified = false;
    std::string verify_error;
    try {
      auto vs = host_.open_stream(peer_id, kProtocol, options_.request_timeout);
      vs->write_line("VERIFY");
      vs->write_line(json{{"peer_id", host_.id()}, {"pairing_code", codes_match ? code : ""}}.dump());
      auto reply = json::parse(vs->read_line(options_.request_timeout));
      vs->close();
      verified = reply.value("verified", false);
      verify_error = reply.value("error_message", "");
    } catch(const std::exception& e) {
      verify_error = e.what();
    }
    if(!codes_match) {
      throw PairingError(Code::VerificationFailed, "remote pairing code does not match");
    }
    if(!verified) {
      throw PairingError(Code::VerificationFailed, "pairing not confirmed by remote: " + verify_error);
    }

    auto device = make_device(peer_id, response.device_name, response.device_type, response.metadata);
    if(device.addresses.empty()) device.addresses.push_back(target.with_peer_id(peer_id).to_string());
    store_device(device);
    logger_->info("Paired with {} ({}), code {}", device.device_name, peer_id, code);

    PeerRegistrar* registrar = nullptr;
    {
      std::lock_guard lg(m_);
      registrar = registrar_;
    }
    if(registrar) {
      try {
        registrar->add_peer(device.addresses.front());
      } catch(const std::invalid_argument& e) {
        logger_->warn("Could not register address of {}: {}", peer_id, e.what());
      }
    }

    attempt_.finish();
    return PairingResult{device, code};
  } catch(const PairingError& e) {
    AttemptState terminal = AttemptState::Failed;
    if(e.code() == Code::Timeout) terminal = AttemptState::TimedOut;
    if(e.code() == Code::Rejected) terminal = AttemptState::Rejected;
    auto current = attempt_.state();
    if(current != terminal && is_valid_transition(current, terminal)) attempt_.advance(terminal);
    attempt_.finish();
    logger_->warn("Pairing with {} failed: {}", address, e.what());
    throw;
  } catch(const std::exception& e) {
    auto current = attempt_.state();
    if(is_valid_transition(current, AttemptState::Failed)) attempt_.advance(AttemptState::Failed);
    attempt_.finish();
    logger_->warn("Pairing with {} failed: {}", address, e.what());
    throw PairingError(Code::ProtocolError, e.what());
  }
}

void PairingManager::handle_stream(std::shared_ptr<Stream> stream) {
  try {
    auto marker = stream->read_line(options_.request_timeout);
    if(marker == "REQUEST") {
      handle_request(*stream);
    } else if(marker == "VERIFY") {
      handle_verify(*stream);
    } else {
      logger_->warn("Unknown pairing message type '{}' from {}", marker, stream->remote_peer_id());
    }
  } catch(const std::exception& e) {
    logger_->warn("Pairing stream from {} failed: {}", stream->remote_peer_id(), e.what());
  }
  stream->close();
}

void PairingManager::handle_request(Stream& stream) {
  const auto remote = stream.remote_peer_id();
  PairingRequest request;
  try {
    request = json::parse(stream.read_line(options_.request_timeout)).get<PairingRequest>();
  } catch(const PeerHostError&) {
    throw;
  } catch(const std::exception& e) {
    stream.write_line(json(make_response(false, std::string("Error: ") + e.what())).dump());
    return;
  }

  PairingRequestHandler handler;
  bool enabled = false;
  {
    std::lock_guard lg(m_);
    enabled = mode_ == PairingMode::Enabled;
    handler = handler_;
  }
  if(!enabled) {
    logger_->info("Ignoring pairing request from {}: pairing disabled", remote);
    stream.write_line(json(make_response(false, "Pairing not enabled on this device")).dump());
    return;
  }
  if(!request.peer_id.empty() && request.peer_id != remote) {
    stream.write_line(json(make_response(false, "Error: peer id does not match connection")).dump());
    return;
  }

  auto response = make_response(false, "");
  auto code = compute_verification_code(request.random_data, response.random_data);
  logger_->info("Pairing request from {} ({}), code {}", request.device_name, remote, code);

  bool accepted = false;
  try {
    accepted = handler && handler(request, code);
  } catch(const std::exception& e) {
    response.error_message = std::string("Error: ") + e.what();
    stream.write_line(json(response).dump());
    return;
  }
  if(!accepted) {
    response.error_message = "Pairing request rejected";
    stream.write_line(json(response).dump());
    logger_->info("Rejected pairing request from {}", remote);
    return;
  }

  response.accepted = true;
  response.pairing_code = code;
  {
    std::lock_guard lg(m_);
    drop_expired_pending_locked();
    pending_[remote] = PendingPairing{
      make_device(remote, request.device_name, request.device_type, request.metadata),
      code,
      std::chrono::steady_clock::now() + 2 * options_.request_timeout};
  }
  stream.write_line(json(response).dump());
  logger_->info("Accepted pairing request from {}, awaiting verification", remote);
}

void PairingManager::drop_expired_pending_locked() {
  auto now = std::chrono::steady_clock::now();
  for(auto it = pending_.begin(); it != pending_.end();) {
    if(it->second.expires <= now) {
      logger_->debug("Pairing with {} expired before verification", it->first);
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t PairingManager::pending_verifications() const {
  std::lock_guard lg(m_);
  auto now = std::chrono::steady_clock::now();
  return static_cast<std::size_t>(std::count_if(pending_.begin(), pending_.end(),
                                                [&](const auto& entry){ return entry.second.expires > now; }));
}

void PairingManager::handle_verify(Stream& stream) {
  const auto remote = stream.remote_peer_id();
  auto body = json::parse(stream.read_line(options_.request_timeout));
  auto code = body.value("pairing_code", "");

  std::optional<PendingPairing> pending;
  {
    std::lock_guard lg(m_);
    drop_expired_pending_locked();
    auto it = pending_.find(remote);
    if(it != pending_.end()) {
      pending = std::move(it->second);
      pending_.erase(it);
    }
  }
  if(!pending) {
    stream.write_line(json{{"verified", false}, {"error_message", "no pairing pending for this device"}}.dump());
    return;
  }
  if(code.empty() || code != pending->code) {
    logger_->warn("Pairing code mismatch from {}, pairing discarded", remote);
    stream.write_line(json{{"verified", false}, {"error_message", "verification code mismatch"}}.dump());
    return;
  }

  auto device = pending->device;
  device.paired_at = utc_now();
  device.last_seen = device.paired_at;
  store_device(device);
  stream.write_line(json{{"verified", true}}.dump());
  logger_->info("Pairing with {} verified", remote);

  PeerRegistrar* registrar = nullptr;
  {
    std::lock_guard lg(m_);
    registrar = registrar_;
  }
  if(registrar && !device.addresses.empty()) {
    try {
      registrar->add_peer(device.addresses.front());
    } catch(const std::invalid_argument& e) {
      logger_->warn("Could not register address of {}: {}", remote, e.what());
    }
  }
}

// ---- registry --------------------------------------------------------------

void PairingManager::store_device(const PairedDevice& device) {
  {
    std::lock_guard lg(m_);
    devices_[device.peer_id] = device;
  }
  save_paired_devices();
}

bool PairingManager::erase_device(const std::string& peer_id) {
  bool erased = false;
  {
    std::lock_guard lg(m_);
    erased = devices_.erase(peer_id) > 0;
  }
  if(erased) save_paired_devices();
  return erased;
}

bool PairingManager::is_paired(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  return devices_.count(peer_id) > 0;
}

std::vector<PairedDevice> PairingManager::paired_devices() const {
  std::lock_guard lg(m_);
  std::vector<PairedDevice> out;
  for(const auto& [id, device] : devices_) out.push_back(device);
  return out;
}

std::optional<PairedDevice> PairingManager::paired_device(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  auto it = devices_.find(peer_id);
  if(it == devices_.end()) return std::nullopt;
  return it->second;
}

void PairingManager::remove_paired_device(const std::string& peer_id) {
  if(!erase_device(peer_id)) {
    throw PairingError(Code::UnknownDevice, "device " + peer_id + " is not paired");
  }
  logger_->info("Removed paired device {}", peer_id);
}

void PairingManager::update_paired_device(const PairedDevice& device) {
  {
    std::lock_guard lg(m_);
    auto it = devices_.find(device.peer_id);
    if(it == devices_.end()) {
      throw PairingError(Code::UnknownDevice, "device " + device.peer_id + " is not paired");
    }
    it->second = device;
  }
  save_paired_devices();
}

bool PairingManager::touch(const std::string& peer_id, const std::vector<std::string>& addresses) {
  {
    std::lock_guard lg(m_);
    auto it = devices_.find(peer_id);
    if(it == devices_.end()) return false;
    it->second.last_seen = utc_now();
    if(!addresses.empty()) it->second.addresses = addresses;
  }
  save_paired_devices();
  return true;
}

bool PairingManager::save_paired_devices() const {
  if(!options_.persist || options_.registry_path.empty()) return false;

  std::lock_guard sl(save_mutex_);
  json doc = json::object();
  {
    std::lock_guard lg(m_);
    for(const auto& [id, device] : devices_) doc[id] = device;
  }

  const auto& path = options_.registry_path;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      logger_->warn("Unable to write paired devices to {}", tmp.string());
      return false;
    }
    out << doc.dump(2);
    if(!out) {
      logger_->warn("Failed writing paired devices to {}", tmp.string());
      return false;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if(ec) {
    logger_->warn("Unable to replace {}: {}", path.string(), ec.message());
    return false;
  }
  return true;
}

bool PairingManager::load_paired_devices() {
  if(!options_.persist || options_.registry_path.empty()) return false;
  const auto& path = options_.registry_path;
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) {
    logger_->debug("No paired devices file at {}", path.string());
    std::lock_guard lg(m_);
    loaded_ = true;
    return true;
  }

  std::map<std::string, PairedDevice> loaded;
  try {
    std::ifstream in(path);
    if(!in) throw std::runtime_error("cannot open file");
    auto doc = json::parse(in);
    if(!doc.is_object()) throw std::runtime_error("expected an object");
    for(auto it = doc.begin(); it != doc.end(); ++it) {
      auto device = it.value().get<PairedDevice>();
      if(device.peer_id.empty()) device.peer_id = it.key();
      loaded[device.peer_id] = device;
    }
  } catch(const std::exception& e) {
    logger_->warn("Ignoring unreadable paired devices file {}: {}", path.string(), e.what());
    std::lock_guard lg(m_);
    devices_.clear();
    return false;
  }

  std::lock_guard lg(m_);
  devices_ = std::move(loaded);
  loaded_ = true;
  logger_->info("Loaded {} paired devices", devices_.size());
  return true;
}
