#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace etlq::cli {

/// Values read from config.toml; unset keys keep the CLI defaults.
struct CliSettings {
  std::optional<std::string> output_mode;
  std::optional<size_t> max_rows;
  std::optional<bool> highlight;
  std::optional<bool> color;
  std::optional<int> http_timeout_ms;
  std::optional<char> csv_delimiter;
};

/// Returns ETLQ_CONFIG, else $XDG_CONFIG_HOME/etlq/config.toml, else ~/.config/etlq/config.toml.
std::string resolve_config_path();

/// Loads a TOML-style `[section]` / `key = value` file.
/// MUST return false with error naming the key and line for invalid values, and
/// MUST return true with empty settings when the file does not exist.
/// Inputs are a path; outputs are settings/error; side effects are file reads.
bool load_config(const std::string& path, CliSettings& out, std::string& error);

}  // namespace etlq::cli
