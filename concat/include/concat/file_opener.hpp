#pragma once
#include <concat/opener.hpp>
#include <string>

namespace concat {
///
/// \brief Opens SourceIds as files, relative to an optional mount point.
///
class FileOpener : public Opener {
  public:
	explicit FileOpener(std::string mount_point = {}) : m_mount_point(std::move(mount_point)) {}

	[[nodiscard]] auto open(SourceId const& id) -> OpenResult override;

	[[nodiscard]] auto mount_point() const -> std::string_view { return m_mount_point; }
	[[nodiscard]] auto resolve(SourceId const& id) const -> SourceId { return id.absolute(m_mount_point); }

  private:
	std::string m_mount_point{};
};
} // namespace concat
