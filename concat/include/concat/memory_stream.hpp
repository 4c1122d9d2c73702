#pragma once
#include <concat/stream.hpp>

namespace concat {
class MemoryStream : public Stream {
  public:
	explicit MemoryStream(std::vector<std::uint8_t> bytes) : m_bytes(std::move(bytes)) {}
	explicit MemoryStream(std::string_view text);

	[[nodiscard]] auto read(std::span<std::uint8_t> out) -> ReadResult override;
	[[nodiscard]] auto describe() const -> std::string override;

	[[nodiscard]] auto remaining() const -> std::span<std::uint8_t const> { return std::span{m_bytes}.subspan(m_offset); }

  private:
	std::vector<std::uint8_t> m_bytes{};
	std::size_t m_offset{};
};
} // namespace concat
