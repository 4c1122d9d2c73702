#pragma once
#include <concat/core/polymorphic.hpp>
#include <concat/core/result.hpp>
#include <concat/io_error.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace concat {
///
/// \brief Abstract sequential source of bytes.
///
class Stream : public Polymorphic {
  public:
	using ReadResult = Result<std::size_t, IoError>;

	[[nodiscard]] static auto as_string(std::span<std::uint8_t const> bytes) -> std::string_view {
		// NOLINTNEXTLINE
		return {reinterpret_cast<char const*>(bytes.data()), bytes.size()};
	}

	///
	/// \brief Read up to out.size() bytes into out.
	/// \returns Number of bytes read (0 signals end of data), or the failure
	///
	[[nodiscard]] virtual auto read(std::span<std::uint8_t> out) -> ReadResult = 0;
	///
	/// \brief Render internal state for diagnostics.
	///
	[[nodiscard]] virtual auto describe() const -> std::string { return "Stream"; }
};

///
/// \brief Fill out completely, failing with IoErrc::eUnexpectedEof if data runs out first.
///
[[nodiscard]] auto read_exact(Stream& stream, std::span<std::uint8_t> out) -> Stream::ReadResult;
///
/// \brief Append everything until end of data to out.
/// \returns Number of bytes appended
///
/// On failure, bytes read before the failure remain in out.
///
[[nodiscard]] auto read_to_end(Stream& stream, std::vector<std::uint8_t>& out) -> Stream::ReadResult;
[[nodiscard]] auto read_to_end(Stream& stream, std::string& out) -> Stream::ReadResult;
} // namespace concat
