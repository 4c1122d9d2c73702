#include <concat/stream.hpp>
#include <array>

namespace concat {
namespace {
constexpr std::size_t chunk_size_v{4096};

template <typename OutT>
auto append_until_end(Stream& stream, OutT& out) -> Stream::ReadResult {
	auto chunk = std::array<std::uint8_t, chunk_size_v>{};
	auto total = std::size_t{};
	for (;;) {
		auto result = stream.read(chunk);
		if (!result) {
			if (result.error().is(std::errc::interrupted)) { continue; }
			return result;
		}
		auto const count = result.value();
		if (count == 0) { return total; }
		out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(count));
		total += count;
	}
}
} // namespace

auto read_exact(Stream& stream, std::span<std::uint8_t> out) -> Stream::ReadResult {
	auto remain = out;
	while (!remain.empty()) {
		auto result = stream.read(remain);
		if (!result) {
			if (result.error().is(std::errc::interrupted)) { continue; }
			return result;
		}
		if (result.value() == 0) { return IoError::make(IoErrc::eUnexpectedEof, "failed to fill whole buffer"); }
		remain = remain.subspan(result.value());
	}
	return out.size();
}

auto read_to_end(Stream& stream, std::vector<std::uint8_t>& out) -> Stream::ReadResult { return append_until_end(stream, out); }

auto read_to_end(Stream& stream, std::string& out) -> Stream::ReadResult { return append_until_end(stream, out); }
} // namespace concat
