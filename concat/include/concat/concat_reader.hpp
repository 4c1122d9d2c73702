#pragma once
#include <concat/concat_read.hpp>
#include <memory>
#include <vector>

namespace concat {
///
/// \brief Reads a sequence of already open streams as one continuous stream.
///
/// Read failures are returned unchanged; the failing stream stays current.
///
class ConcatReader : public ConcatRead {
  public:
	///
	/// \brief Construct an instance over streams (read front to back).
	/// \throws Error if any stream is null
	///
	explicit ConcatReader(std::vector<std::unique_ptr<Stream>> streams);

	[[nodiscard]] auto read(std::span<std::uint8_t> out) -> ReadResult override;
	[[nodiscard]] auto describe() const -> std::string override;

	[[nodiscard]] auto current() const -> Ptr<Stream const> override { return m_current.get(); }
	auto skip() -> bool override;

	[[nodiscard]] auto remaining_count() const -> std::size_t { return m_streams.size() - m_next; }

  private:
	auto advance() -> bool;

	std::unique_ptr<Stream> m_current{};
	std::vector<std::unique_ptr<Stream>> m_streams{};
	std::size_t m_next{};
};
} // namespace concat
