#include "message.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace {

const std::array<std::pair<MessageType, const char*>, 15> kMessageTypeNames = {{
  {MessageType::Content, "content"},
  {MessageType::File, "file"},
  {MessageType::Join, "join"},
  {MessageType::Leave, "leave"},
  {MessageType::Ping, "ping"},
  {MessageType::Pong, "pong"},
  {MessageType::Ack, "ack"},
  {MessageType::Hello, "hello"},
  {MessageType::GroupInfo, "group_info"},
  {MessageType::GroupList, "group_list"},
  {MessageType::Discover, "discover"},
  {MessageType::Presence, "presence"},
  {MessageType::TransferStart, "transfer_start"},
  {MessageType::TransferChunk, "transfer_chunk"},
  {MessageType::TransferComplete, "transfer_complete"},
}};

std::string group_or_default(const std::string& group) {
  return group.empty() ? kDefaultGroup : group;
}

std::vector<unsigned char> bytes_of(const std::string& s) {
  return std::vector<unsigned char>(s.begin(), s.end());
}

} // namespace

std::string to_string(MessageType type) {
  for(const auto& entry : kMessageTypeNames) {
    if(entry.first == type) return entry.second;
  }
  return "unknown";
}

std::optional<MessageType> message_type_from_string(const std::string& value) {
  for(const auto& entry : kMessageTypeNames) {
    if(value == entry.second) return entry.first;
  }
  return std::nullopt;
}

Message::Message(MessageType type,
                 std::string source,
                 std::vector<unsigned char> payload,
                 std::string group,
                 std::string destination,
                 bool requires_ack)
  : type_(type),
    id_(random_hex(16)),
    source_(std::move(source)),
    destination_(std::move(destination)),
    group_(std::move(group)),
    created_(utc_now()),
    payload_(std::move(payload)),
    requires_ack_(requires_ack) {}

Message Message::content(const ClipboardContent& content,
                         const std::string& source,
                         const std::string& group) {
  ClipboardContent stamped = content;
  if(stamped.device_id.empty()) stamped.device_id = source;
  nlohmann::json j = stamped;
  return Message(MessageType::Content, source, bytes_of(j.dump()), group);
}

Message Message::control(MessageType type,
                         const std::string& source,
                         const nlohmann::json& body,
                         const std::string& group) {
  if(type == MessageType::Content) {
    throw std::invalid_argument("content messages carry ClipboardContent");
  }
  return Message(type, source, bytes_of(body.dump()), group);
}

Message Message::received(MessageType type,
                          std::string id,
                          std::string source,
                          std::string destination,
                          std::string group,
                          TimePoint created,
                          std::vector<unsigned char> payload,
                          bool requires_ack) {
  Message m(type, std::move(source), std::move(payload), std::move(group),
            std::move(destination), requires_ack);
  if(!id.empty()) m.id_ = std::move(id);
  m.created_ = created;
  return m;
}

Message Message::with_group(std::string group) const {
  Message copy = *this;
  copy.group_ = std::move(group);
  return copy;
}

Message Message::with_destination(std::string destination) const {
  Message copy = *this;
  copy.destination_ = std::move(destination);
  return copy;
}

std::optional<ClipboardContent> Message::clipboard_content() const {
  if(type_ != MessageType::Content) return std::nullopt;
  auto j = nlohmann::json::parse(payload_.begin(), payload_.end(), nullptr, false);
  if(j.is_discarded() || !j.is_object()) return std::nullopt;
  try {
    return j.get<ClipboardContent>();
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

nlohmann::json Message::control_body() const {
  auto j = nlohmann::json::parse(payload_.begin(), payload_.end(), nullptr, false);
  if(j.is_discarded()) return nlohmann::json();
  return j;
}

bool uses_content_topic(MessageType type) {
  return type == MessageType::Content || type == MessageType::File;
}

bool is_valid_topic_segment(const std::string& segment) {
  if(segment.empty()) return false;
  return segment.find_first_of("/+#") == std::string::npos && segment.find('\0') == std::string::npos;
}

std::string topic_for(const std::string& prefix,
                      const std::string& group,
                      MessageType type,
                      const std::string& destination) {
  std::string topic = prefix + "/" + group_or_default(group) + "/";
  if(uses_content_topic(type)) {
    topic += kContentSuffix;
  } else {
    topic += std::string(kControlSuffix) + "/" + to_string(type);
  }
  if(!destination.empty()) {
    topic += "/" + destination;
  }
  return topic;
}

std::string content_filter(const std::string& prefix, const std::string& group) {
  return prefix + "/" + group_or_default(group) + "/" + kContentSuffix + "/#";
}

std::string control_filter(const std::string& prefix, const std::string& group) {
  return prefix + "/" + group_or_default(group) + "/" + kControlSuffix + "/#";
}

std::optional<TopicInfo> parse_topic(const std::string& prefix, const std::string& topic) {
  auto parts = split(topic, '/');
  if(parts.size() < 3 || parts[0] != prefix || parts[1].empty()) return std::nullopt;
  TopicInfo info;
  info.group = parts[1];
  if(parts[2] == kContentSuffix) {
    info.type = MessageType::Content;
    if(parts.size() > 4) return std::nullopt;
    if(parts.size() == 4) info.destination = parts[3];
    return info;
  }
  if(parts[2] != kControlSuffix || parts.size() < 4 || parts.size() > 5) return std::nullopt;
  auto type = message_type_from_string(parts[3]);
  if(!type || *type == MessageType::Content) return std::nullopt;
  info.type = *type;
  info.subtype = parts[3];
  if(parts.size() == 5) info.destination = parts[4];
  return info;
}

std::vector<unsigned char> encode_wire_payload(const Message& message) {
  if(uses_content_topic(message.type())) {
    return message.payload();
  }
  nlohmann::json envelope = {
    {"id", message.id()},
    {"type", to_string(message.type())},
    {"source", message.source()},
    {"destination", message.destination()},
    {"group", group_or_default(message.group())},
    {"created", time_to_json(message.created())},
    {"requires_ack", message.requires_ack()},
    {"data", message.control_body()}
  };
  return bytes_of(envelope.dump());
}

Message decode_wire_message(const TopicInfo& topic, const std::vector<unsigned char>& payload) {
  auto j = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
  if(j.is_discarded() || !j.is_object()) {
    throw std::invalid_argument("payload is not a JSON object");
  }
  if(topic.type == MessageType::Content) {
    auto content = j.get<ClipboardContent>();
    return Message::received(MessageType::Content, std::string(), content.device_id,
                             topic.destination, topic.group, content.created,
                             payload, false);
  }
  auto data = j.contains("data") ? j.at("data") : nlohmann::json::object();
  return Message::received(topic.type,
                           j.value("id", ""),
                           j.value("source", ""),
                           topic.destination.empty() ? j.value("destination", "") : topic.destination,
                           topic.group,
                           time_from_json(j.value("created", nlohmann::json())),
                           bytes_of(data.dump()),
                           j.value("requires_ack", false));
}
