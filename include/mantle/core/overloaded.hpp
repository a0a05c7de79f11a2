#pragma once

namespace mantle::core {

// Builds a std::visit visitor out of one lambda per alternative
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

} // namespace mantle::core
