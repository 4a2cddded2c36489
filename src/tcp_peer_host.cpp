#include "tcp_peer_host.hpp"

#include "context.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <istream>

using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxLineBytes = 1 << 20;
constexpr std::size_t kMaxAddressesPerPeer = 8;
constexpr std::chrono::milliseconds kWriteTimeout{10000};

constexpr std::chrono::milliseconds kCancelPoll{100};

// Waits for `pending` until the deadline, polling `ctx` for cancellation.
// Returns true once the result is ready.
template<typename T>
bool wait_ready(std::future<T>& pending,
                std::chrono::steady_clock::time_point deadline,
                const Context* ctx) {
  while(true) {
    auto now = std::chrono::steady_clock::now();
    if(now >= deadline || (ctx && ctx->cancelled())) {
      return pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
    auto until = ctx ? std::min(deadline, now + kCancelPoll) : deadline;
    if(pending.wait_until(until) == std::future_status::ready) return true;
  }
}

bool is_unspecified(const std::string& ip) {
  return ip.empty() || ip == "0.0.0.0" || ip == "::";
}

// Runs fn on the io thread and waits for it. Never call from the io thread.
template<typename Executor>
void run_on(const Executor& executor, const std::function<void()>& fn) {
  std::promise<void> done;
  auto finished = done.get_future();
  asio::post(executor, [&]{
    fn();
    done.set_value();
  });
  finished.wait();
}

// Local address of the default route; no packet is sent.
std::string primary_local_ip() {
  try {
    asio::io_context io;
    asio::ip::udp::socket probe(io);
    probe.connect(asio::ip::udp::endpoint(asio::ip::make_address("192.0.2.1"), 9));
    return probe.local_endpoint().address().to_string();
  } catch(const std::exception&) {
    return "127.0.0.1";
  }
}

PeerAddress address_for(const std::string& ip, uint16_t port, const std::string& peer_id) {
  PeerAddress out;
  out.kind = ip.find(':') != std::string::npos ? PeerAddress::Kind::IPv6 : PeerAddress::Kind::IPv4;
  out.host = ip;
  out.port = port;
  out.peer_id = peer_id;
  return out;
}

} // namespace

class TcpStream : public Stream, public std::enable_shared_from_this<TcpStream> {
public:
  explicit TcpStream(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)), buf_(kMaxLineBytes) {}

  std::string read_line(std::chrono::milliseconds timeout) override {
    return read_line(timeout, nullptr);
  }

  // Gives up early with PeerHostError once `ctx` is cancelled.
  std::string read_line(std::chrono::milliseconds timeout, const Context* ctx) {
    auto pending = asio::async_read_until(socket_, buf_, '\n', asio::use_future);
    await(pending, timeout, "read", ctx);
    try {
      pending.get();
    } catch(const std::system_error& e) {
      throw PeerHostError(std::string("stream read failed: ") + e.what());
    }
    std::istream is(&buf_);
    std::string line;
    std::getline(is, line);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    return line;
  }

  void write_line(const std::string& line) override {
    std::string data = line + "\n";
    auto pending = asio::async_write(socket_, asio::buffer(data), asio::use_future);
    await(pending, kWriteTimeout, "write");
    try {
      pending.get();
    } catch(const std::system_error& e) {
      throw PeerHostError(std::string("stream write failed: ") + e.what());
    }
  }

  void close() override {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [self]{
      std::error_code ec;
      self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
      self->socket_.close(ec);
    });
  }

  const std::string& remote_peer_id() const override { return remote_peer_id_; }
  const std::string& protocol() const override { return protocol_; }

  void bind(std::string remote_peer_id, std::string protocol) {
    remote_peer_id_ = std::move(remote_peer_id);
    protocol_ = std::move(protocol);
  }

private:
  template<typename T>
  void await(std::future<T>& pending,
             std::chrono::milliseconds timeout,
             const char* what,
             const Context* ctx = nullptr) {
    if(wait_ready(pending, std::chrono::steady_clock::now() + timeout, ctx)) return;
    run_on(socket_.get_executor(), [this]{
      std::error_code ec;
      socket_.close(ec);
    });
    pending.wait();
    if(ctx && ctx->cancelled()) throw PeerHostError(std::string("stream ") + what + " cancelled");
    throw StreamTimeout(std::string("stream ") + what + " timed out");
  }

  asio::ip::tcp::socket socket_;
  asio::streambuf buf_;
  std::string remote_peer_id_;
  std::string protocol_;
};

TcpPeerHost::TcpPeerHost(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("peer-host")),
    work_(asio::make_work_guard(io_)),
    handler_pool_(options_.handler_threads > 0 ? options_.handler_threads : 1) {}

TcpPeerHost::~TcpPeerHost() {
  stop();
}

void TcpPeerHost::start() {
  if(started_) return;
  if(options_.peer_id.empty()) {
    throw PeerHostError("peer host requires a peer id");
  }
  try {
    auto address = asio::ip::make_address(options_.listen_ip);
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(address, options_.listen_port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    listen_port_ = acceptor_->local_endpoint().port();
  } catch(const std::exception& e) {
    acceptor_.reset();
    throw PeerHostError("unable to listen on " + options_.listen_ip + ":" +
                        std::to_string(options_.listen_port) + ": " + e.what());
  }
  started_ = true;
  start_accept();
  io_thread_ = std::thread([this](){
    io_.run();
  });
  logger_->info("Peer host {} listening on {}:{}", options_.peer_id, options_.listen_ip, listen_port_);
}

void TcpPeerHost::stop() {
  if(!started_.exchange(false)) return;

  run_on(io_.get_executor(), [this]{
    std::error_code ec;
    if(acceptor_) acceptor_->close(ec);
  });

  std::vector<std::shared_ptr<TcpStream>> live;
  {
    std::lock_guard lg(m_);
    for(auto& weak : live_streams_) {
      if(auto s = weak.lock()) live.push_back(std::move(s));
    }
    live_streams_.clear();
  }
  for(auto& s : live) s->close();
  live.clear();

  handler_pool_.join();
  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  acceptor_.reset();
  logger_->debug("Peer host stopped");
}

std::string TcpPeerHost::advertised_ip() const {
  if(!options_.advertise_ip.empty()) return options_.advertise_ip;
  if(!is_unspecified(options_.listen_ip)) return options_.listen_ip;
  static const std::string detected = primary_local_ip();
  return detected;
}

std::vector<PeerAddress> TcpPeerHost::listen_addresses() const {
  return {address_for(advertised_ip(), listen_port_, options_.peer_id)};
}

void TcpPeerHost::set_stream_handler(const std::string& protocol, StreamHandler handler) {
  std::lock_guard lg(m_);
  handlers_[protocol] = std::move(handler);
}

void TcpPeerHost::remove_stream_handler(const std::string& protocol) {
  std::lock_guard lg(m_);
  handlers_.erase(protocol);
}

void TcpPeerHost::track(const std::shared_ptr<TcpStream>& stream) {
  std::lock_guard lg(m_);
  live_streams_.erase(std::remove_if(live_streams_.begin(), live_streams_.end(),
                                     [](const std::weak_ptr<TcpStream>& w){ return w.expired(); }),
                      live_streams_.end());
  live_streams_.push_back(stream);
}

void TcpPeerHost::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->warn("Accept error: {}", ec.message());
        }
      } else {
        std::error_code rec;
        auto remote = socket.remote_endpoint(rec);
        std::string observed_ip = rec ? std::string() : remote.address().to_string();
        auto stream = std::make_shared<TcpStream>(std::move(socket));
        track(stream);
        asio::post(handler_pool_, [this, stream, observed_ip]{
          serve_inbound(stream, observed_ip);
        });
      }
      if(started_) {
        start_accept();
      }
    });
}

void TcpPeerHost::serve_inbound(std::shared_ptr<TcpStream> stream, std::string observed_ip) {
  std::string protocol;
  try {
    auto header = json::parse(stream->read_line(options_.header_timeout));
    protocol = header.value("protocol", "");
    auto remote = header.value("peer_id", "");
    if(remote.empty() || protocol.empty()) {
      stream->write_line(json{{"ok", false}, {"error", "missing protocol or peer id"}}.dump());
      stream->close();
      return;
    }

    StreamHandler handler;
    {
      std::lock_guard lg(m_);
      auto it = handlers_.find(protocol);
      if(it != handlers_.end()) handler = it->second;
    }
    if(!handler && protocol != kIdentifyProtocol) {
      logger_->debug("Refusing stream for unsupported protocol {} from {}", protocol, remote);
      stream->write_line(json{{"ok", false}, {"error", "unsupported protocol " + protocol}}.dump());
      stream->close();
      return;
    }

    std::vector<PeerAddress> advertised;
    if(header.contains("listen_addrs") && header.at("listen_addrs").is_array()) {
      for(const auto& text : header.at("listen_addrs")) {
        if(!text.is_string()) continue;
        try {
          auto addr = PeerAddress::parse(text.get<std::string>());
          if(is_unspecified(addr.host) && !observed_ip.empty()) {
            addr = address_for(observed_ip, addr.port, remote);
          }
          advertised.push_back(addr.with_peer_id(remote));
        } catch(const std::invalid_argument& e) {
          logger_->debug("Ignoring advertised address from {}: {}", remote, e.what());
        }
      }
    }
    add_addresses(remote, advertised);
    {
      std::lock_guard lg(m_);
      connected_.insert(remote);
    }

    stream->write_line(json{{"ok", true}, {"peer_id", options_.peer_id}}.dump());
    stream->bind(remote, protocol);
    if(protocol == kIdentifyProtocol) {
      stream->close();
      return;
    }
    handler(stream);
  } catch(const std::exception& e) {
    logger_->debug("Inbound stream {} ended: {}", protocol.empty() ? "(no header)" : protocol, e.what());
    stream->close();
  }
}

std::shared_ptr<TcpStream> TcpPeerHost::dial(const PeerAddress& address,
                                             const std::string& protocol,
                                             std::chrono::milliseconds timeout,
                                             const Context* ctx) {
  if(!started_) {
    throw PeerHostError("peer host is not running");
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto remaining = [&]{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(1);
  };

  tcp::resolver resolver(io_);
  auto resolving = resolver.async_resolve(address.host, std::to_string(address.port), asio::use_future);
  if(!wait_ready(resolving, deadline, ctx)) {
    run_on(io_.get_executor(), [&]{ resolver.cancel(); });
    resolving.wait();
    if(ctx && ctx->cancelled()) throw PeerHostError("dial to " + address.to_string() + " cancelled");
    throw StreamTimeout("resolving " + address.host + " timed out");
  }
  tcp::resolver::results_type results;
  try {
    results = resolving.get();
  } catch(const std::system_error& e) {
    throw PeerHostError("unable to resolve " + address.host + ": " + e.what());
  }

  tcp::socket socket(io_);
  auto connecting = asio::async_connect(socket, results, asio::use_future);
  if(!wait_ready(connecting, deadline, ctx)) {
    run_on(io_.get_executor(), [&]{
      std::error_code ec;
      socket.close(ec);
    });
    connecting.wait();
    if(ctx && ctx->cancelled()) throw PeerHostError("dial to " + address.to_string() + " cancelled");
    throw StreamTimeout("connecting to " + address.to_string() + " timed out");
  }
  try {
    connecting.get();
  } catch(const std::system_error& e) {
    throw PeerHostError("unable to connect to " + address.to_string() + ": " + e.what());
  }

  auto stream = std::make_shared<TcpStream>(std::move(socket));
  track(stream);

  json listen = json::array();
  for(const auto& a : listen_addresses()) listen.push_back(a.to_string());
  stream->write_line(json{{"protocol", protocol},
                          {"peer_id", options_.peer_id},
                          {"listen_addrs", listen}}.dump());
  json reply;
  try {
    reply = json::parse(stream->read_line(remaining(), ctx));
  } catch(const json::exception& e) {
    stream->close();
    throw PeerHostError(std::string("malformed stream reply: ") + e.what());
  }
  if(!reply.value("ok", false)) {
    stream->close();
    throw PeerHostError("peer refused " + protocol + ": " + reply.value("error", "unknown error"));
  }
  auto remote = reply.value("peer_id", "");
  if(remote.empty() || (!address.peer_id.empty() && remote != address.peer_id)) {
    stream->close();
    throw PeerHostError("peer id mismatch dialing " + address.to_string() + " (got '" + remote + "')");
  }
  stream->bind(remote, protocol);
  add_addresses(remote, {address.with_peer_id(remote)});
  {
    std::lock_guard lg(m_);
    connected_.insert(remote);
  }
  return stream;
}

std::string TcpPeerHost::connect(const PeerAddress& address, std::chrono::milliseconds timeout) {
  auto stream = dial(address, kIdentifyProtocol, timeout);
  stream->close();
  logger_->debug("Connected to {} at {}", stream->remote_peer_id(), address.to_string());
  return stream->remote_peer_id();
}

std::string TcpPeerHost::connect(const PeerAddress& address,
                                 std::chrono::milliseconds timeout,
                                 const Context& ctx) {
  if(ctx.cancelled()) throw PeerHostError("dial to " + address.to_string() + " cancelled");
  auto stream = dial(address, kIdentifyProtocol, timeout, &ctx);
  stream->close();
  logger_->debug("Connected to {} at {}", stream->remote_peer_id(), address.to_string());
  return stream->remote_peer_id();
}

std::shared_ptr<Stream> TcpPeerHost::open_stream(const std::string& peer_id,
                                                 const std::string& protocol,
                                                 std::chrono::milliseconds timeout) {
  if(peer_id == options_.peer_id) {
    throw PeerHostError("cannot open a stream to self");
  }
  auto addresses = addresses_of(peer_id);
  if(addresses.empty()) {
    throw PeerHostError("no known addresses for peer " + peer_id);
  }
  std::string last_error;
  for(const auto& address : addresses) {
    try {
      return dial(address.with_peer_id(peer_id), protocol, timeout);
    } catch(const PeerHostError& e) {
      last_error = e.what();
      logger_->debug("Dial {} failed: {}", address.to_string(), e.what());
    }
  }
  {
    std::lock_guard lg(m_);
    connected_.erase(peer_id);
  }
  throw PeerHostError("unable to reach peer " + peer_id + ": " + last_error);
}

bool TcpPeerHost::is_connected(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  return connected_.count(peer_id) > 0;
}

void TcpPeerHost::add_addresses(const std::string& peer_id, const std::vector<PeerAddress>& addresses) {
  if(peer_id.empty() || peer_id == options_.peer_id) return;
  std::lock_guard lg(m_);
  auto& known = peerstore_[peer_id];
  for(const auto& address : addresses) {
    auto it = std::find_if(known.begin(), known.end(),
                           [&](const PeerAddress& k){ return k.same_endpoint(address); });
    if(it != known.end()) continue;
    known.insert(known.begin(), address.with_peer_id(peer_id));
  }
  if(known.size() > kMaxAddressesPerPeer) known.resize(kMaxAddressesPerPeer);
}

std::vector<PeerAddress> TcpPeerHost::addresses_of(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  auto it = peerstore_.find(peer_id);
  if(it == peerstore_.end()) return {};
  return it->second;
}
