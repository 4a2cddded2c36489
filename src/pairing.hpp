#pragma once

#include <asio.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "discovery.hpp"
#include "log.hpp"
#include "peer_host.hpp"
#include "types.hpp"

class PairingError : public std::runtime_error {
public:
  enum class Code {
    InvalidAddress,
    SelfPairing,
    AlreadyInProgress,
    ConnectFailed,
    Timeout,
    Rejected,
    ProtocolError,
    VerificationFailed,
    UnknownDevice,
  };

  PairingError(Code code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

  Code code() const { return code_; }

private:
  Code code_;
};

std::string to_string(PairingError::Code code);

enum class PairingMode { Disabled, Enabled };

enum class AttemptState { Idle, RequestSent, AwaitingResponse, Accepted, Rejected, TimedOut, Failed };

std::string to_string(AttemptState state);
bool is_valid_transition(AttemptState from, AttemptState to);
bool is_terminal(AttemptState state);

// The single outbound attempt slot.
class PairingAttempt {
public:
  // Claims the slot for peer_id. Returns false while another attempt runs.
  bool begin(const std::string& peer_id);
  // Throws std::logic_error on a transition the table does not allow.
  void advance(AttemptState next);
  // Releases the slot. The last state stays observable.
  void finish();

  AttemptState state() const;
  std::string peer_id() const;
  bool active() const;

private:
  mutable std::mutex m_;
  AttemptState state_ = AttemptState::Idle;
  std::string peer_id_;
  bool active_ = false;
};

struct PairingRequest {
  std::string device_name;
  std::string device_type;
  TimePoint timestamp{};
  std::string random_data;
  std::string peer_id;
  std::string nonce;
  std::map<std::string, std::string> metadata;
};

struct PairingResponse {
  bool accepted = false;
  std::string error_message;
  std::string pairing_code;
  std::string device_name;
  std::string device_type;
  TimePoint timestamp{};
  std::string random_data;
  std::string peer_id;
  std::map<std::string, std::string> metadata;
  TimePoint valid_until{};
};

void to_json(nlohmann::json& j, const PairingRequest& r);
void from_json(const nlohmann::json& j, PairingRequest& r);
void to_json(nlohmann::json& j, const PairingResponse& r);
void from_json(const nlohmann::json& j, PairingResponse& r);

// Six decimal digits from HMAC-SHA256(key = message = initiator + responder).
std::string compute_verification_code(const std::string& initiator_random,
                                      const std::string& responder_random);

struct PairingResult {
  PairedDevice device;
  std::string code;
};

// Decides an inbound request. Receives the code this device will display.
using PairingRequestHandler = std::function<bool(const PairingRequest&, const std::string& code)>;

class PairingManager {
public:
  static constexpr const char* kProtocol = "/clipsync/pairing/1.0.0";
  static constexpr const char* kVersion = "1.0.0";

  struct Options {
    std::string device_name;
    std::string device_type = "desktop";
    std::filesystem::path registry_path;
    bool persist = true;
    std::chrono::milliseconds auto_disable{std::chrono::seconds(300)};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};
  };

  PairingManager(PeerHost& host, Options options, std::shared_ptr<Logger> logger);
  ~PairingManager();

  PairingManager(const PairingManager&) = delete;
  PairingManager& operator=(const PairingManager&) = delete;

  // Loads the registry unless already loaded and registers the stream handler.
  void start();
  // Cancels the auto-disable timer and removes the stream handler.
  void shutdown();

  // Returns the address other devices should pair with.
  std::string enable_pairing(PairingRequestHandler handler);
  void disable_pairing();
  PairingMode mode() const;
  bool is_pairing_enabled() const { return mode() == PairingMode::Enabled; }

  // Blocks until the remote answers or request_timeout elapses.
  // Throws PairingError.
  PairingResult request_pairing(const std::string& address);
  AttemptState attempt_state() const { return attempt_.state(); }

  bool is_paired(const std::string& peer_id) const;
  std::vector<PairedDevice> paired_devices() const;
  std::optional<PairedDevice> paired_device(const std::string& peer_id) const;
  // Both throw PairingError(UnknownDevice).
  void remove_paired_device(const std::string& peer_id);
  void update_paired_device(const PairedDevice& device);
  // Refreshes last_seen, and addresses when given. Returns false when unknown.
  bool touch(const std::string& peer_id, const std::vector<std::string>& addresses = {});

  // Receives addresses of newly paired devices.
  void set_peer_registrar(PeerRegistrar* registrar);

  bool load_paired_devices();
  bool save_paired_devices() const;

  // Accepted inbound requests still waiting for the initiator's VERIFY.
  std::size_t pending_verifications() const;

private:
  struct PendingPairing {
    PairedDevice device;
    std::string code;
    std::chrono::steady_clock::time_point expires;
  };

  void handle_stream(std::shared_ptr<Stream> stream);
  void handle_request(Stream& stream);
  void handle_verify(Stream& stream);

  PairingRequest make_request() const;
  PairingResponse make_response(bool accepted, const std::string& error) const;
  PairedDevice make_device(const std::string& peer_id,
                           const std::string& name,
                           const std::string& type,
                           const std::map<std::string, std::string>& metadata) const;
  void store_device(const PairedDevice& device);
  bool erase_device(const std::string& peer_id);
  void arm_auto_disable(uint64_t generation);
  void drop_expired_pending_locked();

  PeerHost& host_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  PairingAttempt attempt_;

  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  asio::steady_timer auto_disable_timer_;
  std::thread timer_thread_;

  mutable std::mutex m_;
  PairingMode mode_ = PairingMode::Disabled;
  PairingRequestHandler handler_;
  uint64_t generation_ = 0;
  std::map<std::string, PairedDevice> devices_;
  std::map<std::string, PendingPairing> pending_;
  PeerRegistrar* registrar_ = nullptr;
  bool started_ = false;
  bool loaded_ = false;

  mutable std::mutex save_mutex_;
};
