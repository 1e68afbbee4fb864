#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

struct PreviewConfig {
  static constexpr int DEFAULT_PORT = 8000;
  static constexpr const char *DEFAULT_FILE = "preview.yaml";

  std::string host = "0.0.0.0";
  int port = DEFAULT_PORT;
  fs::path root;
  bool reclaim = true;
  bool verbose = false;

  static int parse_port(const std::string &text) {
    size_t consumed = 0;
    int value = 0;
    try {
      value = std::stoi(text, &consumed);
    } catch (const std::exception &) {
      throw std::runtime_error("Invalid port: " + text);
    }
    if (consumed != text.size()) {
      throw std::runtime_error("Invalid port: " + text);
    }
    validate_port(value);
    return value;
  }

  static void validate_port(int value) {
    if (value < 1 || value > 65535) {
      throw std::runtime_error("Port out of range (1-65535): " +
                               std::to_string(value));
    }
  }

  // Relative `root` entries resolve against the config file's directory.
  static PreviewConfig load(const fs::path &config_path, PreviewConfig config);

  // The wildcard address is reachable as localhost; any other host is
  // printed as bound.
  std::string url() const {
    std::string shown = host == "0.0.0.0" ? "localhost" : host;
    return "http://" + shown + ":" + std::to_string(port) + "/";
  }
};

inline PreviewConfig
PreviewConfig::load(const fs::path &config_path,
                    PreviewConfig config = PreviewConfig()) {
  if (!fs::exists(config_path)) {
    throw std::runtime_error("Config file not found: " +
                             config_path.string());
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to parse " + config_path.string() +
                             ": " + e.what());
  }

  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Expected a mapping in " +
                             config_path.string());
  }

  std::unordered_set<std::string> known_keys = {"host", "port", "root",
                                                "reclaim", "verbose"};
  for (auto it = yaml.begin(); it != yaml.end(); ++it) {
    std::string key = it->first.as<std::string>();
    if (known_keys.find(key) == known_keys.end()) {
      throw std::runtime_error("Unknown key '" + key + "' in " +
                               config_path.string());
    }
  }

  try {
    if (yaml["host"])
      config.host = yaml["host"].as<std::string>();
    if (yaml["port"])
      config.port = yaml["port"].as<int>();
    if (yaml["root"]) {
      fs::path root = yaml["root"].as<std::string>();
      config.root =
          root.is_absolute() ? root : config_path.parent_path() / root;
    }
    if (yaml["reclaim"])
      config.reclaim = yaml["reclaim"].as<bool>();
    if (yaml["verbose"])
      config.verbose = yaml["verbose"].as<bool>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Invalid value in " + config_path.string() +
                             ": " + e.what());
  }

  validate_port(config.port);
  return config;
}

#endif
