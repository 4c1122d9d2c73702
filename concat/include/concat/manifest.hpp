#pragma once
#include <concat/core/result.hpp>
#include <concat/file_concat_reader.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace concat {
///
/// \brief Ordered list of sources, optionally relative to a root directory.
///
/// JSON layout: { "root": "data", "sources": ["a.bin", "b.bin"] }
///
struct Manifest {
	using LoadResult = Result<Manifest, std::string>;

	std::string root{};
	std::vector<SourceId> sources{};

	[[nodiscard]] static auto parse(std::string_view json) -> LoadResult;
	///
	/// \brief Read and parse a manifest file.
	///
	/// A relative root is resolved against the directory containing the manifest.
	///
	[[nodiscard]] static auto load(SourceId const& path) -> LoadResult;

	///
	/// \brief Build a FileConcatReader over sources, opened relative to root.
	///
	[[nodiscard]] auto make_reader() const -> FileConcatReader;
};
} // namespace concat
