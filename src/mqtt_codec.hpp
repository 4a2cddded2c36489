#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// MQTT 3.1.1 control packets, both client and broker side.

class MqttProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class MqttPacketType : uint8_t {
  Connect = 1,
  Connack = 2,
  Publish = 3,
  Puback = 4,
  Subscribe = 8,
  Suback = 9,
  Unsubscribe = 10,
  Unsuback = 11,
  Pingreq = 12,
  Pingresp = 13,
  Disconnect = 14,
};

std::string to_string(MqttPacketType type);

constexpr uint8_t kMqttSubackFailure = 0x80;

struct MqttPacket {
  MqttPacketType type = MqttPacketType::Pingreq;

  // CONNECT
  std::string client_id;
  std::string username;
  std::string password;
  uint16_t keepalive = 0;
  bool clean_session = true;

  // CONNACK
  bool session_present = false;
  uint8_t return_code = 0;

  // PUBLISH
  std::string topic;
  std::vector<unsigned char> payload;
  uint8_t qos = 0;
  bool retain = false;
  bool dup = false;

  uint16_t packet_id = 0;

  // SUBSCRIBE carries (filter, qos); UNSUBSCRIBE uses the filters only.
  std::vector<std::pair<std::string, uint8_t>> subscriptions;
  // SUBACK return codes
  std::vector<uint8_t> granted;
};

std::vector<unsigned char> mqtt_encode(const MqttPacket& packet);

enum class MqttDecodeStatus { Incomplete, Ok };

// Decodes one packet from the front of data. On Ok, consumed holds its
// length. Throws MqttProtocolError for malformed packets.
MqttDecodeStatus mqtt_decode(const unsigned char* data,
                             std::size_t size,
                             MqttPacket& out,
                             std::size_t& consumed);

// Filter matching with `+` and `#` wildcards.
bool mqtt_topic_matches(const std::string& filter, const std::string& topic);
