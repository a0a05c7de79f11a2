#pragma once
#include "../io/config_types.hpp"
#include "application_types.hpp"
#include <expected>
#include <string>

namespace mantle::core {

class ConfigurationLoader {
public:
  [[nodiscard]] auto load_configuration(const std::string& config_file)
      -> std::expected<io::Configuration, ApplicationError>;

  auto display_configuration_info(const io::Configuration& config) const -> void;

private:
  auto display_model_info(const io::Configuration& config) const -> void;

  auto display_materials(const io::Configuration& config) const -> void;

  auto display_run_info(const io::Configuration& config) const -> void;
};

} // namespace mantle::core
