#include "mdns.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {

constexpr std::size_t kMaxLabel = 63;
constexpr int kMaxPointerJumps = 16;

void put16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xff));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
  put16(out, static_cast<uint16_t>(v >> 16));
  put16(out, static_cast<uint16_t>(v & 0xffff));
}

void put_name(std::vector<uint8_t>& out, const std::string& name) {
  for(const auto& label : split(name, '.')) {
    if(label.empty()) continue;
    if(label.size() > kMaxLabel) throw DnsFormatError("label too long: " + label);
    out.push_back(static_cast<uint8_t>(label.size()));
    out.insert(out.end(), label.begin(), label.end());
  }
  out.push_back(0);
}

void put_record(std::vector<uint8_t>& out, const DnsRecord& record) {
  put_name(out, record.name);
  put16(out, record.type);
  put16(out, record.klass);
  put32(out, record.ttl);

  std::vector<uint8_t> rdata;
  if(record.type == kDnsTypePTR) {
    put_name(rdata, record.ptr_name);
  } else if(record.type == kDnsTypeTXT) {
    for(const auto& s : record.txt) {
      if(s.size() > 255) throw DnsFormatError("TXT string too long");
      rdata.push_back(static_cast<uint8_t>(s.size()));
      rdata.insert(rdata.end(), s.begin(), s.end());
    }
    if(rdata.empty()) rdata.push_back(0);
  } else {
    rdata = record.rdata;
  }
  if(rdata.size() > 0xffff) throw DnsFormatError("record data too long");
  put16(out, static_cast<uint16_t>(rdata.size()));
  out.insert(out.end(), rdata.begin(), rdata.end());
}

class Reader {
public:
  Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  std::size_t pos() const { return pos_; }
  void seek(std::size_t pos) { pos_ = pos; }

  void need(std::size_t n) const {
    if(pos_ + n > size_) throw DnsFormatError("truncated message");
  }

  uint16_t u16() {
    need(2);
    uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return v;
  }

  uint32_t u32() {
    uint32_t hi = u16();
    return (hi << 16) | u16();
  }

  std::string name() {
    std::string out;
    std::size_t pos = pos_;
    bool jumped = false;
    int jumps = 0;
    while(true) {
      if(pos >= size_) throw DnsFormatError("truncated name");
      uint8_t len = data_[pos];
      if((len & 0xC0) == 0xC0) {
        if(pos + 1 >= size_) throw DnsFormatError("truncated name pointer");
        std::size_t target = (static_cast<std::size_t>(len & 0x3F) << 8) | data_[pos + 1];
        if(!jumped) pos_ = pos + 2;
        jumped = true;
        if(++jumps > kMaxPointerJumps) throw DnsFormatError("name pointer loop");
        pos = target;
        continue;
      }
      if(len & 0xC0) throw DnsFormatError("unsupported label type");
      pos++;
      if(len == 0) break;
      if(pos + len > size_) throw DnsFormatError("truncated label");
      if(!out.empty()) out += '.';
      out.append(reinterpret_cast<const char*>(data_ + pos), len);
      pos += len;
    }
    if(!jumped) pos_ = pos;
    return out;
  }

  DnsRecord record() {
    DnsRecord r;
    r.name = name();
    r.type = u16();
    r.klass = u16() & 0x7FFF;
    r.ttl = u32();
    std::size_t length = u16();
    need(length);
    std::size_t start = pos_;
    if(r.type == kDnsTypePTR) {
      r.ptr_name = name();
    } else if(r.type == kDnsTypeTXT) {
      std::size_t p = start;
      while(p < start + length) {
        std::size_t n = data_[p++];
        if(p + n > start + length) throw DnsFormatError("truncated TXT string");
        if(n > 0) r.txt.emplace_back(reinterpret_cast<const char*>(data_ + p), n);
        p += n;
      }
    } else {
      r.rdata.assign(data_ + start, data_ + start + length);
    }
    pos_ = start + length;
    return r;
  }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::vector<uint8_t> encode_dns_message(const DnsMessage& message) {
  std::vector<uint8_t> out;
  put16(out, message.id);
  put16(out, message.flags);
  put16(out, static_cast<uint16_t>(message.questions.size()));
  put16(out, static_cast<uint16_t>(message.answers.size()));
  put16(out, 0);
  put16(out, static_cast<uint16_t>(message.additionals.size()));
  for(const auto& q : message.questions) {
    put_name(out, q.name);
    put16(out, q.type);
    put16(out, q.klass);
  }
  for(const auto& r : message.answers) put_record(out, r);
  for(const auto& r : message.additionals) put_record(out, r);
  return out;
}

DnsMessage decode_dns_message(const uint8_t* data, std::size_t size) {
  Reader in(data, size);
  DnsMessage m;
  m.id = in.u16();
  m.flags = in.u16();
  uint16_t qd = in.u16();
  uint16_t an = in.u16();
  uint16_t ns = in.u16();
  uint16_t ar = in.u16();
  for(uint16_t i = 0; i < qd; ++i) {
    DnsQuestion q;
    q.name = in.name();
    q.type = in.u16();
    q.klass = in.u16() & 0x7FFF;
    m.questions.push_back(std::move(q));
  }
  for(uint16_t i = 0; i < an; ++i) m.answers.push_back(in.record());
  for(uint16_t i = 0; i < ns; ++i) in.record();
  for(uint16_t i = 0; i < ar; ++i) m.additionals.push_back(in.record());
  return m;
}

// ---- MdnsDiscovery ---------------------------------------------------------

MdnsDiscovery::MdnsDiscovery(PeerHost& host,
                             PeerDiscoveredCallback report,
                             MdnsOptions options,
                             std::shared_ptr<Logger> logger)
  : host_(host),
    report_(std::move(report)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("mdns")) {}

MdnsDiscovery::~MdnsDiscovery() {
  stop();
}

std::string MdnsDiscovery::service_name() const {
  return "_" + options_.service_tag + "._udp.local";
}

DnsMessage MdnsDiscovery::build_announcement() const {
  auto instance = host_.id().substr(0, kMaxLabel) + "." + service_name();

  DnsMessage m;
  m.flags = kDnsFlagResponse;

  DnsRecord ptr;
  ptr.name = service_name();
  ptr.type = kDnsTypePTR;
  ptr.ttl = options_.ttl;
  ptr.ptr_name = instance;
  m.answers.push_back(ptr);

  DnsRecord txt;
  txt.name = instance;
  txt.type = kDnsTypeTXT;
  txt.ttl = options_.ttl;
  txt.txt.push_back("id=" + host_.id());
  for(const auto& a : host_.listen_addresses()) {
    txt.txt.push_back("dnsaddr=" + a.with_peer_id(host_.id()).to_string());
  }
  m.additionals.push_back(txt);
  return m;
}

DnsMessage MdnsDiscovery::build_query() const {
  DnsMessage m;
  m.questions.push_back(DnsQuestion{service_name(), kDnsTypePTR, kDnsClassIN});
  return m;
}

void MdnsDiscovery::start(std::shared_ptr<Context> ctx) {
  std::lock_guard lg(m_);
  if(ctx_) return;

  auto socket = std::make_unique<asio::ip::udp::socket>(io_);
  try {
    auto group = asio::ip::make_address(options_.multicast_group);
    socket->open(asio::ip::udp::v4());
    socket->set_option(asio::ip::udp::socket::reuse_address(true));
    socket->bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), options_.port));
    socket->set_option(asio::ip::multicast::join_group(group));
    socket->set_option(asio::ip::multicast::enable_loopback(true));
  } catch(const std::exception& e) {
    throw std::runtime_error(std::string("mDNS socket setup failed: ") + e.what());
  }

  socket_ = std::move(socket);
  ctx_ = std::move(ctx);
  connect_pool_ = std::make_unique<asio::thread_pool>(2);
  io_.restart();
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
  io_thread_ = std::thread([this]{ io_.run(); });

  asio::post(io_, [this]{ do_receive(); });
  send_multicast(build_query());
  send_multicast(build_announcement());
  logger_->info("mDNS discovery started for {}", service_name());
}

void MdnsDiscovery::stop() {
  std::unique_ptr<asio::thread_pool> pool;
  {
    std::lock_guard lg(m_);
    if(!ctx_) return;
    ctx_->cancel();
    ctx_.reset();
    pool = std::move(connect_pool_);
    asio::post(io_, [this]{
      asio::error_code ec;
      if(socket_) socket_->close(ec);
    });
    work_.reset();
  }
  if(io_thread_.joinable()) io_thread_.join();
  io_.stop();
  socket_.reset();
  if(pool) {
    pool->stop();
    pool->join();
  }
  logger_->info("mDNS discovery stopped");
}

void MdnsDiscovery::do_receive() {
  if(!socket_ || !socket_->is_open()) return;
  socket_->async_receive_from(asio::buffer(recv_buf_), sender_,
    [this](const asio::error_code& ec, std::size_t n){
      if(ec == asio::error::operation_aborted) return;
      if(!ec) {
        try {
          handle_datagram(std::vector<uint8_t>(recv_buf_.begin(), recv_buf_.begin() + n),
                          sender_.address().to_string());
        } catch(const std::exception& e) {
          logger_->debug("Ignoring mDNS packet from {}: {}", sender_.address().to_string(), e.what());
        }
      }
      do_receive();
    });
}

void MdnsDiscovery::send_multicast(const DnsMessage& message) {
  if(!socket_) return;
  auto payload = std::make_shared<std::vector<uint8_t>>(encode_dns_message(message));
  asio::post(io_, [this, payload]{
    if(!socket_ || !socket_->is_open()) return;
    asio::ip::udp::endpoint target(asio::ip::make_address(options_.multicast_group), options_.port);
    socket_->async_send_to(asio::buffer(*payload), target,
      [this, payload](const asio::error_code& ec, std::size_t){
        if(ec && ec != asio::error::operation_aborted) {
          logger_->debug("mDNS send failed: {}", ec.message());
        }
      });
  });
}

bool MdnsDiscovery::handle_datagram(const std::vector<uint8_t>& data, const std::string& sender_ip) {
  auto message = decode_dns_message(data.data(), data.size());
  auto service = lower(service_name());

  if(!message.is_response()) {
    bool asked = std::any_of(message.questions.begin(), message.questions.end(), [&](const DnsQuestion& q){
      return lower(q.name) == service && (q.type == kDnsTypePTR || q.type == kDnsTypeANY);
    });
    if(asked) send_multicast(build_announcement());
    return false;
  }

  std::map<std::string, std::vector<std::string>> txt_by_instance;
  auto collect = [&](const std::vector<DnsRecord>& records){
    for(const auto& r : records) {
      if(r.type != kDnsTypeTXT) continue;
      auto name = lower(r.name);
      if(name.size() <= service.size() + 1) continue;
      if(name.compare(name.size() - service.size(), service.size(), service) != 0) continue;
      auto& strings = txt_by_instance[r.name];
      strings.insert(strings.end(), r.txt.begin(), r.txt.end());
    }
  };
  collect(message.answers);
  collect(message.additionals);

  bool reported = false;
  for(const auto& entry : txt_by_instance) {
    std::string id;
    std::vector<PeerAddress> addrs;
    for(const auto& s : entry.second) {
      if(starts_with(s, "id=")) {
        id = s.substr(3);
      } else if(starts_with(s, "dnsaddr=")) {
        try {
          auto a = PeerAddress::parse(s.substr(8));
          if(a.host == "0.0.0.0" || a.host == "::") {
            a.host = sender_ip;
            a.kind = sender_ip.find(':') != std::string::npos ? PeerAddress::Kind::IPv6 : PeerAddress::Kind::IPv4;
          }
          addrs.push_back(a);
        } catch(const std::invalid_argument& e) {
          logger_->debug("Ignoring mDNS address '{}': {}", s, e.what());
        }
      }
    }
    if(id.empty()) {
      for(const auto& a : addrs) {
        if(!a.peer_id.empty()) { id = a.peer_id; break; }
      }
    }
    if(id.empty() || id == host_.id() || addrs.empty()) continue;

    PeerDescriptor peer;
    peer.id = id;
    peer.name = "mDNS-Peer-" + short_id(id);
    for(const auto& a : addrs) peer.addrs.push_back(a.with_peer_id(id).to_string());
    peer.last_seen = utc_now();
    peer.capabilities["discovery"] = "mdns";
    peer.device_type = "unknown";
    logger_->debug("mDNS found peer {} at {}", id, peer.addrs.front());
    if(report_) report_(peer);
    connect_in_background(peer);
    reported = true;
  }
  return reported;
}

void MdnsDiscovery::connect_in_background(const PeerDescriptor& peer) {
  std::lock_guard lg(m_);
  if(!connect_pool_ || !ctx_ || host_.is_connected(peer.id)) return;
  asio::post(*connect_pool_, [this, peer, ctx = ctx_]{
    for(const auto& text : peer.addrs) {
      if(ctx->cancelled()) return;
      try {
        host_.connect(PeerAddress::parse(text), options_.connect_timeout, *ctx);
        logger_->info("Connected to mDNS peer {}", peer.id);
        return;
      } catch(const std::exception& e) {
        logger_->debug("Failed to connect to mDNS peer {} at {}: {}", peer.id, text, e.what());
      }
    }
  });
}
