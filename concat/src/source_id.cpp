#include <concat/source_id.hpp>
#include <filesystem>

namespace concat {
namespace fs = std::filesystem;

auto SourceId::filename() const -> std::string { return fs::path{m_value}.filename().string(); }

auto SourceId::absolute(std::string_view const prefix) const -> SourceId {
	auto const path = fs::path{m_value};
	if (prefix.empty() || path.has_root_directory()) { return *this; }
	return (fs::path{prefix} / path).generic_string();
}
} // namespace concat
