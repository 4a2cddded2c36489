#include "peer_host.hpp"

#include "utils.hpp"

namespace {

uint16_t parse_port(const std::string& text) {
  if(text.empty() || text.size() > 5) throw std::invalid_argument("invalid port '" + text + "'");
  for(char c : text) {
    if(c < '0' || c > '9') throw std::invalid_argument("invalid port '" + text + "'");
  }
  int value = std::stoi(text);
  if(value <= 0 || value > 65535) throw std::invalid_argument("port out of range '" + text + "'");
  return static_cast<uint16_t>(value);
}

PeerAddress parse_host_port(const std::string& text) {
  PeerAddress out;
  std::string rest = text;
  auto slash = rest.find('/');
  if(slash != std::string::npos) {
    out.peer_id = rest.substr(slash + 1);
    rest = rest.substr(0, slash);
  }
  std::string host;
  std::string port;
  if(!rest.empty() && rest.front() == '[') {
    auto close = rest.find(']');
    if(close == std::string::npos || close + 1 >= rest.size() || rest[close + 1] != ':') {
      throw std::invalid_argument("invalid address '" + text + "'");
    }
    host = rest.substr(1, close - 1);
    port = rest.substr(close + 2);
    out.kind = PeerAddress::Kind::IPv6;
  } else {
    auto colon = rest.rfind(':');
    if(colon == std::string::npos) throw std::invalid_argument("address '" + text + "' has no port");
    host = rest.substr(0, colon);
    port = rest.substr(colon + 1);
    bool numeric = !host.empty() && host.find_first_not_of("0123456789.") == std::string::npos;
    out.kind = numeric ? PeerAddress::Kind::IPv4 : PeerAddress::Kind::DNS;
  }
  if(host.empty()) throw std::invalid_argument("address '" + text + "' has no host");
  out.host = host;
  out.port = parse_port(port);
  return out;
}

} // namespace

PeerAddress PeerAddress::parse(const std::string& text) {
  if(text.empty()) throw std::invalid_argument("empty address");
  if(text.front() != '/') return parse_host_port(text);

  auto parts = split(text.substr(1), '/');
  if(parts.size() < 4) throw std::invalid_argument("incomplete address '" + text + "'");
  PeerAddress out;
  const auto& proto = parts[0];
  if(proto == "ip4") out.kind = Kind::IPv4;
  else if(proto == "ip6") out.kind = Kind::IPv6;
  else if(proto == "dns4" || proto == "dns6" || proto == "dns") out.kind = Kind::DNS;
  else throw std::invalid_argument("unsupported address protocol '" + proto + "'");
  out.host = parts[1];
  if(out.host.empty()) throw std::invalid_argument("address '" + text + "' has no host");
  if(parts[2] != "tcp") throw std::invalid_argument("address '" + text + "' is not tcp");
  out.port = parse_port(parts[3]);
  if(parts.size() == 6 && (parts[4] == "p2p" || parts[4] == "ipfs")) {
    if(parts[5].empty()) throw std::invalid_argument("address '" + text + "' has an empty peer id");
    out.peer_id = parts[5];
  } else if(parts.size() != 4) {
    throw std::invalid_argument("unsupported address '" + text + "'");
  }
  return out;
}

std::string PeerAddress::to_string() const {
  std::string proto = kind == Kind::IPv4 ? "ip4" : (kind == Kind::IPv6 ? "ip6" : "dns");
  std::string out = "/" + proto + "/" + host + "/tcp/" + std::to_string(port);
  if(!peer_id.empty()) out += "/p2p/" + peer_id;
  return out;
}

PeerAddress PeerAddress::with_peer_id(const std::string& id) const {
  PeerAddress copy = *this;
  copy.peer_id = id;
  return copy;
}

bool PeerAddress::same_endpoint(const PeerAddress& other) const {
  return host == other.host && port == other.port;
}
