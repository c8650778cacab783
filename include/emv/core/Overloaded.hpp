/**
 * Overloaded.hpp - Lambda overload set for std::visit
 */

#pragma once

namespace emv::core {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace emv::core
