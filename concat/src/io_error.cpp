#include <concat/io_error.hpp>
#include <format>

namespace concat {
namespace {
struct IoCategory : std::error_category {
	[[nodiscard]] auto name() const noexcept -> char const* final { return "concat"; }

	[[nodiscard]] auto message(int const value) const -> std::string final {
		switch (static_cast<IoErrc>(value)) {
		case IoErrc::eUnexpectedEof: return "unexpected end of stream";
		default: return "unknown error";
		}
	}
};
} // namespace

auto io_category() -> std::error_category const& {
	static auto const ret = IoCategory{};
	return ret;
}

auto make_error_code(IoErrc const errc) -> std::error_code { return {static_cast<int>(errc), io_category()}; }

auto IoError::from_errno(int const value, std::string_view const context) -> IoError {
	auto code = std::error_code{value, std::generic_category()};
	if (context.empty()) { return IoError{.code = code, .description = code.message()}; }
	return IoError{.code = code, .description = std::format("{}: {}", context, code.message())};
}

auto IoError::make(std::error_code code, std::string description) -> IoError {
	if (description.empty()) { description = code.message(); }
	return IoError{.code = code, .description = std::move(description)};
}

auto IoError::to_string() const -> std::string { return std::format("{} ({}:{})", description, code.category().name(), code.value()); }
} // namespace concat
