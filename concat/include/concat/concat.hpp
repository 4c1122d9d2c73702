#pragma once
#include <concat/concat_reader.hpp>
#include <concat/file_concat_reader.hpp>
#include <concat/file_opener.hpp>
#include <concat/memory_stream.hpp>

namespace concat {
///
/// \brief Chain already open streams into a single ConcatRead.
///
[[nodiscard]] auto concat(std::vector<std::unique_ptr<Stream>> streams) -> std::unique_ptr<ConcatRead>;
///
/// \brief Chain paths into a single lazily opened FileConcatRead.
/// \param opener Defaults to FileOpener if null
///
[[nodiscard]] auto concat_paths(std::vector<SourceId> paths, std::unique_ptr<Opener> opener = {}) -> std::unique_ptr<FileConcatRead>;
} // namespace concat
