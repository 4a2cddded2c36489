#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils.hpp"

enum class ContentType { Unknown, String, Text, Image, File, URL, FilePath, HTML, RTF };

std::string to_string(ContentType type);
ContentType content_type_from_string(const std::string& value);

// One clipboard value as produced by the platform monitor.
struct ClipboardContent {
  ContentType type = ContentType::Unknown;
  std::vector<unsigned char> data;
  TimePoint created{};
  std::string device_id;
  std::string hash;
  bool compressed = false;
  int occurrences = 0;

  static ClipboardContent text(const std::string& value, const std::string& device_id = std::string());
  std::string data_as_string() const { return std::string(data.begin(), data.end()); }
  bool operator==(const ClipboardContent& other) const;
};

struct PeerDescriptor {
  std::string id;
  std::string name;
  std::vector<std::string> addrs;
  TimePoint last_seen{};
  std::map<std::string, std::string> capabilities;
  std::string device_type;
  std::string version;
  std::vector<std::string> groups;
};

struct PairedDevice {
  std::string peer_id;
  std::string device_name;
  std::string device_type;
  std::vector<std::string> addresses;
  std::map<std::string, std::string> capabilities;
  std::map<std::string, std::string> metadata;
  TimePoint paired_at{};
  TimePoint last_seen{};

  bool operator==(const PairedDevice& other) const;
  bool operator!=(const PairedDevice& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const ClipboardContent& c);
void from_json(const nlohmann::json& j, ClipboardContent& c);
void to_json(nlohmann::json& j, const PeerDescriptor& p);
void from_json(const nlohmann::json& j, PeerDescriptor& p);
void to_json(nlohmann::json& j, const PairedDevice& d);
void from_json(const nlohmann::json& j, PairedDevice& d);

// Missing and null fields read as an empty T.
template<typename T>
T field_or_empty(const nlohmann::json& j, const char* key) {
  if(!j.contains(key) || j.at(key).is_null()) return T{};
  return j.at(key).get<T>();
}

// Timestamps are RFC 3339 strings on disk and on the wire.
nlohmann::json time_to_json(TimePoint tp);
TimePoint time_from_json(const nlohmann::json& value);
