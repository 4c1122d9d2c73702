#include <concat/memory_stream.hpp>
#include <algorithm>
#include <format>

namespace concat {
MemoryStream::MemoryStream(std::string_view const text) : m_bytes(text.begin(), text.end()) {}

auto MemoryStream::read(std::span<std::uint8_t> out) -> ReadResult {
	auto const source = remaining();
	auto const count = std::min(out.size(), source.size());
	std::copy_n(source.begin(), count, out.begin());
	m_offset += count;
	return count;
}

auto MemoryStream::describe() const -> std::string { return std::format("MemoryStream(\"{}\")", as_string(remaining())); }
} // namespace concat
