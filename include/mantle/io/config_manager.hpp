#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include "yaml_parser.hpp"
#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

namespace mantle::io {

/**
 * @brief Locates a model file and turns it into a validated Configuration
 *
 * A name that is not an existing path is looked up in each search directory in order, with and
 * without a ".yaml" extension, so `mantle couette` finds `config/couette.yaml`.
 */
class ConfigurationManager {
private:
  std::vector<std::filesystem::path> search_directories_;
  std::filesystem::path config_file_path_;

  [[nodiscard]] auto
  resolve_config_path(std::string_view config_file) const -> std::expected<std::filesystem::path, core::FileError>;

public:
  ConfigurationManager() : search_directories_{".", "config"} {}
  explicit ConfigurationManager(std::vector<std::filesystem::path> search_directories)
      : search_directories_(std::move(search_directories)) {}

  [[nodiscard]] auto load(std::string_view config_file) -> std::expected<Configuration, core::ConfigurationError>;

  [[nodiscard]] auto config_file_path() const noexcept -> const std::filesystem::path& { return config_file_path_; }
};

} // namespace mantle::io
