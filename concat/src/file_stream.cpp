#include <concat/file_stream.hpp>
#include <cerrno>
#include <format>

namespace concat {
auto FileStream::Deleter::operator()(std::FILE* file) const noexcept -> void { std::fclose(file); }

auto FileStream::open(SourceId const& path) -> Result<FileStream, IoError> {
	errno = 0;
	auto* file = std::fopen(path.c_str(), "rb");
	if (file == nullptr) {
		auto const error = errno == 0 ? EIO : errno;
		return IoError::from_errno(error, std::format("failed to open '{}'", path.value()));
	}
	return FileStream{file, path};
}

auto FileStream::read(std::span<std::uint8_t> out) -> ReadResult {
	if (!m_file) { return IoError::make(std::make_error_code(std::errc::bad_file_descriptor), "stream is closed"); }
	if (out.empty()) { return std::size_t{}; }
	errno = 0;
	auto const count = std::fread(out.data(), 1, out.size(), m_file.get());
	if (count < out.size() && std::ferror(m_file.get()) != 0) {
		auto const error = errno == 0 ? EIO : errno;
		// leave the stream usable so the caller may retry
		std::clearerr(m_file.get());
		if (count > 0) { return count; }
		return IoError::from_errno(error, std::format("failed to read '{}'", m_path.value()));
	}
	return count;
}

auto FileStream::describe() const -> std::string { return std::format("FileStream(\"{}\")", m_path.value()); }
} // namespace concat
