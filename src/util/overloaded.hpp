#pragma once

namespace royaos::util {

// Visitor built from lambdas for std::visit
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace royaos::util
