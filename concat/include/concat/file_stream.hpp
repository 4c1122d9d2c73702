#pragma once
#include <concat/source_id.hpp>
#include <concat/stream.hpp>
#include <cstdio>
#include <memory>

namespace concat {
///
/// \brief Stream over a file opened for binary reading; closed on destruction.
///
class FileStream : public Stream {
  public:
	///
	/// \brief Open path for reading.
	/// \returns FileStream if successful, else the OS error (kind and message)
	///
	[[nodiscard]] static auto open(SourceId const& path) -> Result<FileStream, IoError>;

	[[nodiscard]] auto read(std::span<std::uint8_t> out) -> ReadResult override;
	[[nodiscard]] auto describe() const -> std::string override;

	[[nodiscard]] auto path() const -> SourceId const& { return m_path; }
	[[nodiscard]] auto is_open() const -> bool { return m_file != nullptr; }

  private:
	struct Deleter {
		auto operator()(std::FILE* file) const noexcept -> void;
	};

	FileStream(std::FILE* file, SourceId path) : m_file(file), m_path(std::move(path)) {}

	std::unique_ptr<std::FILE, Deleter> m_file{};
	SourceId m_path{};
};
} // namespace concat
