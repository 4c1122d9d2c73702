#pragma once
#include <concat/file_concat_reader.hpp>
#include <concat/manifest.hpp>
#include <djson/json.hpp>

namespace concat::io {
///
/// \brief Write diagnostic state: state, path, error (if failed), and remaining sources.
///
auto to_json(dj::Json& out, FileConcatReader const& reader) -> void;

auto to_json(dj::Json& out, Manifest const& manifest) -> void;
auto from_json(dj::Json const& json, Manifest& out) -> void;
} // namespace concat::io
