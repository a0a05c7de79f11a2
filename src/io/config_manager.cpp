#include "mantle/io/config_manager.hpp"
#include <array>
#include <format>
#include <iostream>

namespace mantle::io {

auto ConfigurationManager::resolve_config_path(std::string_view config_file) const
    -> std::expected<std::filesystem::path, core::FileError> {
  const std::filesystem::path requested(config_file);
  if (std::filesystem::is_regular_file(requested)) {
    return std::filesystem::absolute(requested);
  }

  if (requested.is_relative()) {
    const std::array<std::string, 2> suffixes = {"", ".yaml"};
    for (const auto& directory : search_directories_) {
      for (const auto& suffix : suffixes) {
        auto candidate = directory / requested;
        candidate += suffix;
        if (std::filesystem::is_regular_file(candidate)) {
          return std::filesystem::absolute(candidate);
        }
      }
    }
  }

  return std::unexpected(core::FileError{"could not locate config file", std::string(config_file)});
}

auto ConfigurationManager::load(std::string_view config_file)
    -> std::expected<Configuration, core::ConfigurationError> {

  auto path = resolve_config_path(config_file);
  if (!path) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to resolve config path: {}", path.error().message())));
  }
  config_file_path_ = std::move(path.value());

  YamlParser parser(config_file_path_.string());
  if (auto loaded = parser.load(); !loaded) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to load YAML file: {}", loaded.error().message())));
  }

  auto config = parser.parse();
  if (!config) {
    return std::unexpected(config.error());
  }

  std::cout << "[CONFIG] Loaded " << config_file_path_.string() << std::endl;
  return std::move(config.value());
}

} // namespace mantle::io
