#pragma once

namespace concat {
///
/// \brief Wrapper for constructing overloaded visitors for std::visit.
///
template <typename... T>
struct Visitor : T... {
	using T::operator()...;
};

template <typename... T>
Visitor(T...) -> Visitor<T...>;
} // namespace concat
