#include <concat/core/logger.hpp>
#include <concat/file_opener.hpp>
#include <concat/file_stream.hpp>
#include <concat/manifest.hpp>
#include <concat/serializer.hpp>
#include <filesystem>
#include <format>

namespace concat {
namespace {
namespace fs = std::filesystem;

auto const g_log{logger::Logger{"Manifest"}};
} // namespace

auto Manifest::parse(std::string_view const text) -> LoadResult {
	auto const json = dj::Json::parse(text);
	if (!json) { return std::string{"manifest is not valid JSON"}; }
	auto const& sources = json["sources"];
	if (!sources) { return std::string{"manifest has no 'sources'"}; }
	if (!sources.is_array()) { return std::string{"manifest 'sources' is not an array"}; }
	for (auto const& source : sources.array_view()) {
		if (!source.is_string() || source.as_string().empty()) { return std::string{"manifest contains an empty or non-string source"}; }
	}

	auto ret = Manifest{};
	io::from_json(json, ret);
	return ret;
}

auto Manifest::load(SourceId const& path) -> LoadResult {
	auto file = FileStream::open(path);
	if (!file) {
		g_log.error("{}", file.error().description);
		return file.error().description;
	}

	auto text = std::string{};
	if (auto const result = read_to_end(file.value(), text); !result) {
		g_log.error("{}", result.error().description);
		return result.error().description;
	}

	auto ret = parse(text);
	if (!ret) {
		g_log.error("[{}]: {}", path.value(), ret.error());
		return ret;
	}

	auto const directory = fs::path{path.value()}.parent_path();
	auto& manifest = ret.value();
	if (!fs::path{manifest.root}.has_root_directory()) { manifest.root = (directory / manifest.root).lexically_normal().generic_string(); }
	g_log.debug("[{}]: {} sources, root [{}]", path.value(), manifest.sources.size(), manifest.root);
	return ret;
}

auto Manifest::make_reader() const -> FileConcatReader { return FileConcatReader{sources, std::make_unique<FileOpener>(root)}; }
} // namespace concat
