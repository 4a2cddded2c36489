#include "types.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace {

const std::array<std::pair<ContentType, const char*>, 9> kContentTypeNames = {{
  {ContentType::Unknown, "unknown"},
  {ContentType::String, "string"},
  {ContentType::Text, "text"},
  {ContentType::Image, "image"},
  {ContentType::File, "file"},
  {ContentType::URL, "url"},
  {ContentType::FilePath, "filepath"},
  {ContentType::HTML, "html"},
  {ContentType::RTF, "rtf"},
}};

} // namespace

std::string to_string(ContentType type) {
  for(const auto& entry : kContentTypeNames) {
    if(entry.first == type) return entry.second;
  }
  return "unknown";
}

ContentType content_type_from_string(const std::string& value) {
  for(const auto& entry : kContentTypeNames) {
    if(value == entry.second) return entry.first;
  }
  return ContentType::Unknown;
}

ClipboardContent ClipboardContent::text(const std::string& value, const std::string& device_id) {
  ClipboardContent c;
  c.type = ContentType::Text;
  c.data.assign(value.begin(), value.end());
  c.created = utc_now();
  c.device_id = device_id;
  c.hash = sha256_hex(value);
  return c;
}

bool ClipboardContent::operator==(const ClipboardContent& other) const {
  return type == other.type && data == other.data && created == other.created &&
         device_id == other.device_id && hash == other.hash &&
         compressed == other.compressed && occurrences == other.occurrences;
}

bool PairedDevice::operator==(const PairedDevice& other) const {
  return peer_id == other.peer_id && device_name == other.device_name &&
         device_type == other.device_type && addresses == other.addresses &&
         capabilities == other.capabilities && metadata == other.metadata &&
         paired_at == other.paired_at && last_seen == other.last_seen;
}

nlohmann::json time_to_json(TimePoint tp) {
  return format_rfc3339(tp);
}

TimePoint time_from_json(const nlohmann::json& value) {
  if(!value.is_string()) return TimePoint{};
  auto parsed = parse_rfc3339(value.get<std::string>());
  if(!parsed) {
    throw std::invalid_argument("invalid timestamp '" + value.get<std::string>() + "'");
  }
  return *parsed;
}

void to_json(nlohmann::json& j, const ClipboardContent& c) {
  j = nlohmann::json{
    {"type", to_string(c.type)},
    {"data", base64_encode(c.data)},
    {"created", time_to_json(c.created)},
    {"device_id", c.device_id},
    {"hash", c.hash},
    {"compressed", c.compressed},
    {"occurrences", c.occurrences}
  };
}

void from_json(const nlohmann::json& j, ClipboardContent& c) {
  c.type = content_type_from_string(j.value("type", "unknown"));
  c.data = base64_decode(j.value("data", ""));
  c.created = time_from_json(j.value("created", nlohmann::json()));
  c.device_id = j.value("device_id", "");
  c.hash = j.value("hash", "");
  c.compressed = j.value("compressed", false);
  c.occurrences = j.value("occurrences", 0);
}

void to_json(nlohmann::json& j, const PeerDescriptor& p) {
  j = nlohmann::json{
    {"id", p.id},
    {"name", p.name},
    {"addrs", p.addrs},
    {"last_seen", time_to_json(p.last_seen)},
    {"capabilities", p.capabilities},
    {"device_type", p.device_type},
    {"version", p.version},
    {"groups", p.groups}
  };
}

void from_json(const nlohmann::json& j, PeerDescriptor& p) {
  p.id = j.at("id").get<std::string>();
  p.name = j.value("name", "");
  p.addrs = field_or_empty<std::vector<std::string>>(j, "addrs");
  p.last_seen = time_from_json(j.value("last_seen", nlohmann::json()));
  p.capabilities = field_or_empty<std::map<std::string, std::string>>(j, "capabilities");
  p.device_type = j.value("device_type", "");
  p.version = j.value("version", "");
  p.groups = field_or_empty<std::vector<std::string>>(j, "groups");
}

void to_json(nlohmann::json& j, const PairedDevice& d) {
  j = nlohmann::json{
    {"peer_id", d.peer_id},
    {"device_name", d.device_name},
    {"device_type", d.device_type},
    {"addresses", d.addresses},
    {"capabilities", d.capabilities},
    {"metadata", d.metadata},
    {"paired_at", time_to_json(d.paired_at)},
    {"last_seen", time_to_json(d.last_seen)}
  };
}

void from_json(const nlohmann::json& j, PairedDevice& d) {
  d.peer_id = j.at("peer_id").get<std::string>();
  d.device_name = j.value("device_name", "");
  d.device_type = j.value("device_type", "");
  d.addresses = field_or_empty<std::vector<std::string>>(j, "addresses");
  d.capabilities = field_or_empty<std::map<std::string, std::string>>(j, "capabilities");
  d.metadata = field_or_empty<std::map<std::string, std::string>>(j, "metadata");
  d.paired_at = time_from_json(j.value("paired_at", nlohmann::json()));
  d.last_seen = time_from_json(j.value("last_seen", nlohmann::json()));
}
