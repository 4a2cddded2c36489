#include "mqtt_codec.hpp"

#include "utils.hpp"

namespace {

constexpr std::size_t kMaxRemainingLength = 268435455;

void put16(std::vector<unsigned char>& out, uint16_t v) {
  out.push_back(static_cast<unsigned char>(v >> 8));
  out.push_back(static_cast<unsigned char>(v & 0xff));
}

void put_string(std::vector<unsigned char>& out, const std::string& s) {
  if(s.size() > 0xffff) throw MqttProtocolError("string field too long");
  put16(out, static_cast<uint16_t>(s.size()));
  out.insert(out.end(), s.begin(), s.end());
}

class BodyReader {
public:
  BodyReader(const unsigned char* data, std::size_t size) : data_(data), size_(size) {}

  bool done() const { return pos_ >= size_; }
  std::size_t remaining() const { return size_ - pos_; }

  uint8_t u8() {
    need(1);
    return data_[pos_++];
  }

  uint16_t u16() {
    need(2);
    uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return v;
  }

  std::string string() {
    auto n = u16();
    need(n);
    std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return s;
  }

  std::vector<unsigned char> rest() {
    std::vector<unsigned char> out(data_ + pos_, data_ + size_);
    pos_ = size_;
    return out;
  }

private:
  void need(std::size_t n) const {
    if(pos_ + n > size_) throw MqttProtocolError("packet body truncated");
  }

  const unsigned char* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

uint8_t fixed_flags(const MqttPacket& p) {
  switch(p.type) {
    case MqttPacketType::Publish:
      return static_cast<uint8_t>((p.dup ? 0x08 : 0) | ((p.qos & 0x03) << 1) | (p.retain ? 0x01 : 0));
    case MqttPacketType::Subscribe:
    case MqttPacketType::Unsubscribe:
      return 0x02;
    default:
      return 0;
  }
}

} // namespace

std::string to_string(MqttPacketType type) {
  switch(type) {
    case MqttPacketType::Connect: return "CONNECT";
    case MqttPacketType::Connack: return "CONNACK";
    case MqttPacketType::Publish: return "PUBLISH";
    case MqttPacketType::Puback: return "PUBACK";
    case MqttPacketType::Subscribe: return "SUBSCRIBE";
    case MqttPacketType::Suback: return "SUBACK";
    case MqttPacketType::Unsubscribe: return "UNSUBSCRIBE";
    case MqttPacketType::Unsuback: return "UNSUBACK";
    case MqttPacketType::Pingreq: return "PINGREQ";
    case MqttPacketType::Pingresp: return "PINGRESP";
    case MqttPacketType::Disconnect: return "DISCONNECT";
  }
  return "UNKNOWN";
}

std::vector<unsigned char> mqtt_encode(const MqttPacket& p) {
  std::vector<unsigned char> body;
  switch(p.type) {
    case MqttPacketType::Connect: {
      put_string(body, "MQTT");
      body.push_back(4);
      uint8_t flags = 0;
      if(!p.username.empty()) flags |= 0x80;
      if(!p.password.empty()) flags |= 0x40;
      if(p.clean_session) flags |= 0x02;
      body.push_back(flags);
      put16(body, p.keepalive);
      put_string(body, p.client_id);
      if(!p.username.empty()) put_string(body, p.username);
      if(!p.password.empty()) put_string(body, p.password);
      break;
    }
    case MqttPacketType::Connack:
      body.push_back(p.session_present ? 1 : 0);
      body.push_back(p.return_code);
      break;
    case MqttPacketType::Publish:
      if(p.qos > 1) throw MqttProtocolError("QoS 2 is not supported");
      put_string(body, p.topic);
      if(p.qos > 0) put16(body, p.packet_id);
      body.insert(body.end(), p.payload.begin(), p.payload.end());
      break;
    case MqttPacketType::Puback:
    case MqttPacketType::Unsuback:
      put16(body, p.packet_id);
      break;
    case MqttPacketType::Subscribe:
      if(p.subscriptions.empty()) throw MqttProtocolError("SUBSCRIBE without filters");
      put16(body, p.packet_id);
      for(const auto& [filter, qos] : p.subscriptions) {
        put_string(body, filter);
        body.push_back(qos);
      }
      break;
    case MqttPacketType::Suback:
      put16(body, p.packet_id);
      body.insert(body.end(), p.granted.begin(), p.granted.end());
      break;
    case MqttPacketType::Unsubscribe:
      if(p.subscriptions.empty()) throw MqttProtocolError("UNSUBSCRIBE without filters");
      put16(body, p.packet_id);
      for(const auto& entry : p.subscriptions) put_string(body, entry.first);
      break;
    case MqttPacketType::Pingreq:
    case MqttPacketType::Pingresp:
    case MqttPacketType::Disconnect:
      break;
  }

  if(body.size() > kMaxRemainingLength) throw MqttProtocolError("packet too large");
  std::vector<unsigned char> out;
  out.push_back(static_cast<unsigned char>((static_cast<uint8_t>(p.type) << 4) | fixed_flags(p)));
  std::size_t len = body.size();
  do {
    unsigned char byte = len % 128;
    len /= 128;
    if(len > 0) byte |= 0x80;
    out.push_back(byte);
  } while(len > 0);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

MqttDecodeStatus mqtt_decode(const unsigned char* data,
                             std::size_t size,
                             MqttPacket& out,
                             std::size_t& consumed) {
  if(size < 2) return MqttDecodeStatus::Incomplete;

  std::size_t remaining = 0;
  std::size_t multiplier = 1;
  std::size_t pos = 1;
  while(true) {
    if(pos >= size) return MqttDecodeStatus::Incomplete;
    if(pos > 4) throw MqttProtocolError("malformed remaining length");
    unsigned char byte = data[pos++];
    remaining += (byte & 0x7f) * multiplier;
    multiplier *= 128;
    if((byte & 0x80) == 0) break;
  }
  if(size - pos < remaining) return MqttDecodeStatus::Incomplete;

  uint8_t header = data[0];
  uint8_t kind = header >> 4;
  uint8_t flags = header & 0x0f;

  MqttPacket p;
  BodyReader in(data + pos, remaining);
  switch(kind) {
    case 1: {
      p.type = MqttPacketType::Connect;
      auto protocol = in.string();
      auto level = in.u8();
      if(protocol != "MQTT" || level != 4) throw MqttProtocolError("unsupported protocol " + protocol);
      auto cflags = in.u8();
      p.clean_session = (cflags & 0x02) != 0;
      p.keepalive = in.u16();
      p.client_id = in.string();
      if(cflags & 0x04) {
        in.string();
        in.string();
      }
      if(cflags & 0x80) p.username = in.string();
      if(cflags & 0x40) p.password = in.string();
      break;
    }
    case 2:
      p.type = MqttPacketType::Connack;
      p.session_present = (in.u8() & 0x01) != 0;
      p.return_code = in.u8();
      break;
    case 3:
      p.type = MqttPacketType::Publish;
      p.dup = (flags & 0x08) != 0;
      p.qos = (flags >> 1) & 0x03;
      p.retain = (flags & 0x01) != 0;
      if(p.qos > 1) throw MqttProtocolError("QoS 2 is not supported");
      p.topic = in.string();
      if(p.qos > 0) p.packet_id = in.u16();
      p.payload = in.rest();
      break;
    case 4:
      p.type = MqttPacketType::Puback;
      p.packet_id = in.u16();
      break;
    case 8:
      p.type = MqttPacketType::Subscribe;
      p.packet_id = in.u16();
      while(!in.done()) {
        auto filter = in.string();
        auto qos = in.u8();
        p.subscriptions.emplace_back(filter, qos);
      }
      if(p.subscriptions.empty()) throw MqttProtocolError("SUBSCRIBE without filters");
      break;
    case 9:
      p.type = MqttPacketType::Suback;
      p.packet_id = in.u16();
      while(!in.done()) p.granted.push_back(in.u8());
      break;
    case 10:
      p.type = MqttPacketType::Unsubscribe;
      p.packet_id = in.u16();
      while(!in.done()) p.subscriptions.emplace_back(in.string(), 0);
      if(p.subscriptions.empty()) throw MqttProtocolError("UNSUBSCRIBE without filters");
      break;
    case 11:
      p.type = MqttPacketType::Unsuback;
      p.packet_id = in.u16();
      break;
    case 12:
      p.type = MqttPacketType::Pingreq;
      break;
    case 13:
      p.type = MqttPacketType::Pingresp;
      break;
    case 14:
      p.type = MqttPacketType::Disconnect;
      break;
    default:
      throw MqttProtocolError("unsupported packet type " + std::to_string(kind));
  }

  out = std::move(p);
  consumed = pos + remaining;
  return MqttDecodeStatus::Ok;
}

bool mqtt_topic_matches(const std::string& filter, const std::string& topic) {
  if(!topic.empty() && topic[0] == '$' && !filter.empty() && (filter[0] == '+' || filter[0] == '#')) {
    return false;
  }
  auto f = split(filter, '/');
  auto t = split(topic, '/');
  std::size_t i = 0;
  for(; i < f.size(); ++i) {
    if(f[i] == "#") return true;
    if(i >= t.size()) return false;
    if(f[i] != "+" && f[i] != t[i]) return false;
  }
  return i == t.size();
}
