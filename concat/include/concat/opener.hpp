#pragma once
#include <concat/core/polymorphic.hpp>
#include <concat/core/result.hpp>
#include <concat/io_error.hpp>
#include <concat/source_id.hpp>
#include <concat/stream.hpp>
#include <memory>

namespace concat {
///
/// \brief Turns a SourceId into a readable Stream.
///
class Opener : public Polymorphic {
  public:
	using OpenResult = Result<std::unique_ptr<Stream>, IoError>;

	///
	/// \brief Open the resource identified by id.
	/// \returns Non-null Stream on success, otherwise the failure as reported by the resource
	///
	[[nodiscard]] virtual auto open(SourceId const& id) -> OpenResult = 0;
};
} // namespace concat
