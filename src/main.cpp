#include <cpptrace/cpptrace.hpp>
#include <spdlog/fmt/ranges.h>

#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>

#include "clip_sync_node.hpp"
#include "command_line_parser.hpp"
#include "discovery_manager.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::mutex g_prompt_mutex;

bool confirm_on_stdin(const PairingRequest& request, const std::string& code) {
  std::lock_guard lg(g_prompt_mutex);
  print_out(nullptr, "Pairing request from {} ({}, {})", request.device_name, request.device_type, request.peer_id);
  print_out(nullptr, "Verification code: {}", code);
  print_out(nullptr, "Accept? [y/N]");
  std::string answer;
  if(!std::getline(std::cin, answer)) return false;
  answer = SettingsManager::to_lower(SettingsManager::trim_copy(answer));
  return answer == "y" || answer == "yes";
}

int run_command(ClipSyncNode& node, const std::string& command, const std::string& target) {
  auto logger = node.logger();

  if(command == "peers") {
    node.load_state();
    auto peers = node.discovery()->peers();
    if(peers.empty()) {
      print_out(nullptr, "No known peers");
    }
    for(const auto& p : peers) {
      print_out(nullptr, "{}  {}  {}  last seen {}",
                p.id, p.name, fmt::join(p.addrs, ","), format_rfc3339(p.last_seen));
    }
    return 0;
  }

  if(command == "paired") {
    node.load_state();
    auto devices = node.pairing()->paired_devices();
    if(devices.empty()) {
      print_out(nullptr, "No paired devices");
    }
    for(const auto& d : devices) {
      print_out(nullptr, "{}  {} ({})  paired {}  last seen {}",
                d.peer_id, d.device_name, d.device_type,
                format_rfc3339(d.paired_at), format_rfc3339(d.last_seen));
    }
    return 0;
  }

  if(command == "unpair") {
    if(target.empty()) {
      print_err(nullptr, "unpair needs a peer id");
      return 1;
    }
    node.load_state();
    node.pairing()->remove_paired_device(target);
    print_out(nullptr, "Removed {}", target);
    return 0;
  }

  if(command == "pair") {
    if(target.empty()) {
      print_err(nullptr, "pair needs the address shown by the other device");
      return 1;
    }
    node.start();
    auto result = node.pair_with(target);
    print_out(nullptr, "Paired with {} ({})", result.device.device_name, result.device.peer_id);
    print_out(nullptr, "Verification code: {}", result.code);
    node.stop();
    return 0;
  }

  if(command == "listen") {
    node.start();
    auto address = node.enable_pairing(confirm_on_stdin);
    print_out(nullptr, "Pairing enabled. On the other device run:");
    print_out(nullptr, "  clipsyncd pair {}", address);
    node.run();
    node.stop();
    return 0;
  }

  if(command == "run") {
    node.add_content_handler([logger](const ClipboardContent& content, const Message& message){
      if(content.type == ContentType::Text || content.type == ContentType::String ||
         content.type == ContentType::URL) {
        logger->print("[{}] {}: {}", message.group(), short_id(message.source()), content.data_as_string());
      } else {
        logger->print("[{}] {}: {} ({} bytes)", message.group(), short_id(message.source()),
                      to_string(content.type), content.data.size());
      }
    });
    node.start();
    node.run();
    node.stop();
    return 0;
  }

  print_err(nullptr, "Unknown command '{}'", command);
  return 1;
}

} // namespace

int main(int argc, char** argv){
  try {
    ClipSyncNode::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.install_signal_handlers = true;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "clipsync.json");
    settings->load();

    CommandLineParser parser("clipsyncd");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    ClipSyncNode node(settings, options);
    if(settings->save_requested()) {
      if(!settings->save()) {
        node.logger()->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    return run_command(node,
                       SettingsManager::to_lower(settings->get<std::string>("command")),
                       settings->get<std::string>("target"));
  } catch(const PairingError& e) {
    Logger logger("clipsyncd");
    logger.error("Pairing failed ({}): {}", to_string(e.code()), e.what());
    return 2;
  } catch(const ConfigError& e) {
    Logger logger("clipsyncd");
    logger.error("Configuration error: {}", e.what());
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("clipsyncd");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
