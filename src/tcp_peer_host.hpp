#pragma once

#include <asio.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "peer_host.hpp"

class TcpStream;

// PeerHost over plain TCP. Each stream is one socket that starts with a
// JSON header line naming the protocol and the dialing peer.
class TcpPeerHost : public PeerHost {
public:
  static constexpr const char* kIdentifyProtocol = "/clipsync/id/1.0.0";

  struct Options {
    std::string peer_id;
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 0;
    std::string advertise_ip;
    std::size_t handler_threads = 8;
    std::chrono::milliseconds header_timeout{10000};
  };

  TcpPeerHost(Options options, std::shared_ptr<Logger> logger);
  ~TcpPeerHost() override;

  // Binds the listener and starts the io thread. Throws PeerHostError.
  void start();
  void stop();

  uint16_t listen_port() const { return listen_port_; }

  const std::string& id() const override { return options_.peer_id; }
  std::vector<PeerAddress> listen_addresses() const override;

  void set_stream_handler(const std::string& protocol, StreamHandler handler) override;
  void remove_stream_handler(const std::string& protocol) override;

  std::string connect(const PeerAddress& address, std::chrono::milliseconds timeout) override;
  std::string connect(const PeerAddress& address,
                      std::chrono::milliseconds timeout,
                      const Context& ctx) override;
  std::shared_ptr<Stream> open_stream(const std::string& peer_id,
                                      const std::string& protocol,
                                      std::chrono::milliseconds timeout) override;
  bool is_connected(const std::string& peer_id) const override;

  void add_addresses(const std::string& peer_id, const std::vector<PeerAddress>& addresses) override;
  std::vector<PeerAddress> addresses_of(const std::string& peer_id) const override;

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void serve_inbound(std::shared_ptr<TcpStream> stream, std::string observed_ip);
  std::shared_ptr<TcpStream> dial(const PeerAddress& address,
                                  const std::string& protocol,
                                  std::chrono::milliseconds timeout,
                                  const Context* ctx = nullptr);
  void track(const std::shared_ptr<TcpStream>& stream);
  std::string advertised_ip() const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  asio::thread_pool handler_pool_;
  uint16_t listen_port_ = 0;
  std::atomic<bool> started_{false};

  mutable std::mutex m_;
  std::map<std::string, StreamHandler> handlers_;
  std::map<std::string, std::vector<PeerAddress>> peerstore_;
  std::set<std::string> connected_;
  std::vector<std::weak_ptr<TcpStream>> live_streams_;
};
