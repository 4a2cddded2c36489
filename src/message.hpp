#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

enum class MessageType {
  Content,
  File,
  Join,
  Leave,
  Ping,
  Pong,
  Ack,
  Hello,
  GroupInfo,
  GroupList,
  Discover,
  Presence,
  TransferStart,
  TransferChunk,
  TransferComplete
};

std::string to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& value);

constexpr const char* kDefaultGroup = "default";
constexpr const char* kContentSuffix = "content";
constexpr const char* kControlSuffix = "control";

// Immutable envelope. Routing fields are only changed through the
// with_* copies, so a message handed to a transport is never mutated.
class Message {
public:
  Message(MessageType type,
          std::string source,
          std::vector<unsigned char> payload,
          std::string group = std::string(),
          std::string destination = std::string(),
          bool requires_ack = false);

  static Message content(const ClipboardContent& content,
                         const std::string& source,
                         const std::string& group = std::string());
  static Message control(MessageType type,
                         const std::string& source,
                         const nlohmann::json& body,
                         const std::string& group = std::string());

  // Rebuilds a received message keeping the sender's id and timestamp.
  static Message received(MessageType type,
                          std::string id,
                          std::string source,
                          std::string destination,
                          std::string group,
                          TimePoint created,
                          std::vector<unsigned char> payload,
                          bool requires_ack);

  Message with_group(std::string group) const;
  Message with_destination(std::string destination) const;

  MessageType type() const { return type_; }
  bool is_content() const { return type_ == MessageType::Content; }
  const std::string& id() const { return id_; }
  const std::string& source() const { return source_; }
  const std::string& destination() const { return destination_; }
  const std::string& group() const { return group_; }
  TimePoint created() const { return created_; }
  const std::vector<unsigned char>& payload() const { return payload_; }
  bool requires_ack() const { return requires_ack_; }

  // Decodes the ClipboardContent payload of a content message.
  std::optional<ClipboardContent> clipboard_content() const;
  // Decodes a control payload as JSON, null if it is not JSON.
  nlohmann::json control_body() const;

private:
  MessageType type_;
  std::string id_;
  std::string source_;
  std::string destination_;
  std::string group_;
  TimePoint created_;
  std::vector<unsigned char> payload_;
  bool requires_ack_ = false;
};

struct TopicInfo {
  std::string group;
  MessageType type = MessageType::Content;
  std::string subtype;
  std::string destination;
};

// Content and file messages share the content topic and carry no subtype.
bool uses_content_topic(MessageType type);

// True for a non-empty single topic level without wildcards.
bool is_valid_topic_segment(const std::string& segment);

// <prefix>/<group|default>/<content|control>[/<subtype>][/<destination>]
std::string topic_for(const std::string& prefix,
                      const std::string& group,
                      MessageType type,
                      const std::string& destination = std::string());
std::string content_filter(const std::string& prefix, const std::string& group);
std::string control_filter(const std::string& prefix, const std::string& group);

// Returns nullopt when the topic does not belong to the prefix scheme.
std::optional<TopicInfo> parse_topic(const std::string& prefix, const std::string& topic);

// Wire encoding used by pub/sub transports.
std::vector<unsigned char> encode_wire_payload(const Message& message);
// Throws std::invalid_argument for payloads that do not decode.
Message decode_wire_message(const TopicInfo& topic, const std::vector<unsigned char>& payload);
