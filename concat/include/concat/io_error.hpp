#pragma once
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace concat {
///
/// \brief Failure kinds that the operating system does not report.
///
enum class IoErrc { eUnexpectedEof = 1 };

[[nodiscard]] auto io_category() -> std::error_category const&;
[[nodiscard]] auto make_error_code(IoErrc errc) -> std::error_code;
} // namespace concat

template <>
struct std::is_error_code_enum<concat::IoErrc> : std::true_type {};

namespace concat {
///
/// \brief Failure reported by an open or read operation.
///
/// code carries the failure kind (eg std::errc::no_such_file_or_directory),
/// description the human readable detail reported alongside it.
///
struct IoError {
	std::error_code code{};
	std::string description{};

	///
	/// \brief Build an IoError from an errno value (generic category).
	///
	[[nodiscard]] static auto from_errno(int value, std::string_view context = {}) -> IoError;
	[[nodiscard]] static auto make(std::error_code code, std::string description) -> IoError;

	[[nodiscard]] auto kind() const -> std::error_code const& { return code; }
	[[nodiscard]] auto is(std::errc const kind) const -> bool { return code == kind; }
	[[nodiscard]] auto is(IoErrc const kind) const -> bool { return code == kind; }
	[[nodiscard]] auto to_string() const -> std::string;

	auto operator==(IoError const&) const -> bool = default;
};
} // namespace concat
