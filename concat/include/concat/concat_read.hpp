#pragma once
#include <concat/core/ptr.hpp>
#include <concat/source_id.hpp>
#include <concat/stream.hpp>

namespace concat {
///
/// \brief A Stream made of a sequence of sources read one after the other.
///
class ConcatRead : public Stream {
  public:
	///
	/// \brief Obtain the source currently being read, if one is open.
	///
	/// Never opens anything.
	///
	[[nodiscard]] virtual auto current() const -> Ptr<Stream const> = 0;
	///
	/// \brief Abandon the current source and move to the next one.
	/// \returns true if another source is now pending, false if the sequence is exhausted
	///
	virtual auto skip() -> bool = 0;
};

///
/// \brief A ConcatRead whose sources are identified by path.
///
class FileConcatRead : public ConcatRead {
  public:
	///
	/// \brief Obtain the identity of the current source (pending, open or failed).
	/// \returns nullptr once every source has been consumed
	///
	[[nodiscard]] virtual auto file_path() const -> Ptr<SourceId const> = 0;
};
} // namespace concat
