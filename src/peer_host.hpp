#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class Context;

class PeerHostError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class StreamTimeout : public PeerHostError {
public:
  using PeerHostError::PeerHostError;
};

// Multiaddr-style peer address: /ip4/<ip>/tcp/<port>[/p2p/<id>].
// `host:port[/id]` is accepted on input as well.
struct PeerAddress {
  enum class Kind { IPv4, IPv6, DNS };

  Kind kind = Kind::IPv4;
  std::string host;
  uint16_t port = 0;
  std::string peer_id;

  // Throws std::invalid_argument.
  static PeerAddress parse(const std::string& text);

  std::string to_string() const;
  PeerAddress with_peer_id(const std::string& id) const;
  bool same_endpoint(const PeerAddress& other) const;
};

// Newline-delimited byte stream bound to one protocol and one remote peer.
class Stream {
public:
  virtual ~Stream() = default;

  // Throws StreamTimeout, or PeerHostError when the stream fails or closes.
  virtual std::string read_line(std::chrono::milliseconds timeout) = 0;
  virtual void write_line(const std::string& line) = 0;
  virtual void close() = 0;

  virtual const std::string& remote_peer_id() const = 0;
  virtual const std::string& protocol() const = 0;
};

// Identity and stream capability of the local device.
class PeerHost {
public:
  using StreamHandler = std::function<void(std::shared_ptr<Stream>)>;

  virtual ~PeerHost() = default;

  virtual const std::string& id() const = 0;
  virtual std::vector<PeerAddress> listen_addresses() const = 0;

  virtual void set_stream_handler(const std::string& protocol, StreamHandler handler) = 0;
  virtual void remove_stream_handler(const std::string& protocol) = 0;

  // Dials the address and identifies the remote. Returns its peer id.
  virtual std::string connect(const PeerAddress& address, std::chrono::milliseconds timeout) = 0;
  // Same, but abandons the dial with PeerHostError once `ctx` is cancelled.
  virtual std::string connect(const PeerAddress& address,
                              std::chrono::milliseconds timeout,
                              const Context& ctx) = 0;
  virtual std::shared_ptr<Stream> open_stream(const std::string& peer_id,
                                              const std::string& protocol,
                                              std::chrono::milliseconds timeout) = 0;
  virtual bool is_connected(const std::string& peer_id) const = 0;

  virtual void add_addresses(const std::string& peer_id, const std::vector<PeerAddress>& addresses) = 0;
  virtual std::vector<PeerAddress> addresses_of(const std::string& peer_id) const = 0;
};
