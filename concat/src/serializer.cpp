#include <concat/serializer.hpp>

namespace concat {
auto io::to_json(dj::Json& out, FileConcatReader const& reader) -> void {
	out["state"] = std::string{FileConcatReader::to_string(reader.state())};
	if (auto const* path = reader.file_path()) { out["path"] = std::string{path->value()}; }
	if (auto const* error = reader.open_error()) {
		out["error"] = error->description;
		out["error_code"] = error->code.value();
	}
	auto& out_rest = out["rest"];
	for (auto const& id : reader.remaining()) { out_rest.push_back(std::string{id.value()}); }
}

auto io::to_json(dj::Json& out, Manifest const& manifest) -> void {
	if (!manifest.root.empty()) { out["root"] = manifest.root; }
	auto& out_sources = out["sources"];
	for (auto const& id : manifest.sources) { out_sources.push_back(std::string{id.value()}); }
}

auto io::from_json(dj::Json const& json, Manifest& out) -> void {
	out.root = json["root"].as<std::string>();
	out.sources.clear();
	for (auto const& in_source : json["sources"].array_view()) { out.sources.emplace_back(in_source.as<std::string>()); }
}
} // namespace concat
