#pragma once
#include <stdexcept>
#include <string>

namespace concat {
///
/// \brief Exception type for internal invariant violations.
///
/// Data-dependent failures are reported as IoError values instead.
///
struct Error : std::runtime_error {
	explicit Error(std::string const& message) : std::runtime_error(message) {}
};
} // namespace concat
