#pragma once

namespace execpolicy::core {

// Builds a visitor for std::visit out of one lambda per alternative. A missing
// alternative is a compile error, which keeps every dispatch exhaustive.
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace execpolicy::core
