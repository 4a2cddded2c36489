#pragma once

#include <asio.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "discovery.hpp"
#include "peer_host.hpp"

// ---- DNS message codec (RFC 1035 subset used by mDNS service discovery) ----

class DnsFormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

constexpr uint16_t kDnsTypePTR = 12;
constexpr uint16_t kDnsTypeTXT = 16;
constexpr uint16_t kDnsTypeANY = 255;
constexpr uint16_t kDnsClassIN = 1;
constexpr uint16_t kDnsFlagResponse = 0x8400;

struct DnsQuestion {
  std::string name;
  uint16_t type = kDnsTypePTR;
  uint16_t klass = kDnsClassIN;
};

struct DnsRecord {
  std::string name;
  uint16_t type = kDnsTypeTXT;
  uint16_t klass = kDnsClassIN;
  uint32_t ttl = 0;
  std::string ptr_name;               // PTR
  std::vector<std::string> txt;       // TXT
  std::vector<uint8_t> rdata;         // any other type, verbatim
};

struct DnsMessage {
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<DnsQuestion> questions;
  std::vector<DnsRecord> answers;
  std::vector<DnsRecord> additionals;

  bool is_response() const { return (flags & 0x8000) != 0; }
};

std::vector<uint8_t> encode_dns_message(const DnsMessage& message);
// Throws DnsFormatError.
DnsMessage decode_dns_message(const uint8_t* data, std::size_t size);

// ---- discovery backend -----------------------------------------------------

// Announces `<peer id>._<tag>._udp.local` with `dnsaddr=` TXT strings and
// reports peers announcing the same service.
class MdnsDiscovery : public DiscoveryBackend {
public:
  MdnsDiscovery(PeerHost& host,
                PeerDiscoveredCallback report,
                MdnsOptions options,
                std::shared_ptr<Logger> logger);
  ~MdnsDiscovery() override;

  // Throws std::runtime_error when the multicast socket cannot be set up.
  void start(std::shared_ptr<Context> ctx) override;
  void stop() override;
  std::string name() const override { return "mdns"; }

  std::string service_name() const;
  DnsMessage build_announcement() const;
  DnsMessage build_query() const;

  // Processes one received datagram. Returns true when a peer was reported.
  bool handle_datagram(const std::vector<uint8_t>& data, const std::string& sender_ip);

private:
  void do_receive();
  void send_multicast(const DnsMessage& message);
  void connect_in_background(const PeerDescriptor& peer);

  PeerHost& host_;
  PeerDiscoveredCallback report_;
  MdnsOptions options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::unique_ptr<asio::ip::udp::socket> socket_;
  asio::ip::udp::endpoint sender_;
  std::array<uint8_t, 9000> recv_buf_{};

  std::mutex m_;
  std::shared_ptr<Context> ctx_;
  std::unique_ptr<asio::thread_pool> connect_pool_;
};
