#include "mantle/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  mantle::core::ApplicationRunner app;
  auto result = app.run(argc, argv);
  return result.exit_code;
}
