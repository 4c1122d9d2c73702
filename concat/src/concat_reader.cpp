#include <concat/concat_reader.hpp>
#include <algorithm>
#include <format>

namespace concat {
ConcatReader::ConcatReader(std::vector<std::unique_ptr<Stream>> streams) : m_streams(std::move(streams)) {
	if (std::ranges::any_of(m_streams, [](auto const& stream) { return stream == nullptr; })) { throw Error{"ConcatReader: null stream in sequence"}; }
	advance();
}

auto ConcatReader::read(std::span<std::uint8_t> out) -> ReadResult {
	if (out.empty()) { return std::size_t{}; }
	while (m_current) {
		auto result = m_current->read(out);
		if (!result || result.value() > 0) { return result; }
		advance();
	}
	return std::size_t{};
}

auto ConcatReader::skip() -> bool { return advance(); }

auto ConcatReader::advance() -> bool {
	if (m_next >= m_streams.size()) {
		m_current.reset();
		return false;
	}
	m_current = std::move(m_streams[m_next++]);
	return true;
}

auto ConcatReader::describe() const -> std::string {
	auto rest = std::string{};
	for (auto it = m_streams.begin() + static_cast<std::ptrdiff_t>(m_next); it != m_streams.end(); ++it) {
		if (!rest.empty()) { rest += ", "; }
		rest += (*it)->describe();
	}
	auto const current = m_current ? m_current->describe() : std::string{"None"};
	return std::format("ConcatReader {{ current: {}, rest: [{}] }}", current, rest);
}
} // namespace concat
