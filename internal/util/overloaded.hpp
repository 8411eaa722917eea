#pragma once

namespace txfeed::util {

// Visitor built from lambdas; std::visit fails to compile if an alternative is unhandled.
template <typename... Fns>
struct Overloaded : Fns... {
  using Fns::operator()...;
};

template <typename... Fns>
Overloaded(Fns...) -> Overloaded<Fns...>;

} // namespace txfeed::util
