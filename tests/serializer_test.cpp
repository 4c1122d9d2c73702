#include <concat/serializer.hpp>
#include <test/fixtures.hpp>
#include <test/test.hpp>
#include <string>
#include <vector>

namespace {
using namespace concat;

auto to_strings(dj::Json const& array) -> std::vector<std::string> {
	auto ret = std::vector<std::string>{};
	for (auto const& element : array.array_view()) { ret.push_back(element.as<std::string>()); }
	return ret;
}

ADD_TEST(SerializeReaderState) {
	auto reader = FileConcatReader{{"1byte", "404", "2byte"}, std::make_unique<test::MockOpener>()};

	auto pending = dj::Json{};
	io::to_json(pending, reader);
	EXPECT(pending["state"].as<std::string>() == "pending");
	EXPECT(pending["path"].as<std::string>() == "1byte");
	EXPECT(!pending["error"]);
	EXPECT(to_strings(pending["rest"]) == std::vector<std::string>{"404", "2byte"});

	auto out = std::string{};
	EXPECT(read_to_end(reader, out).has_error());
	auto failed = dj::Json{};
	io::to_json(failed, reader);
	EXPECT(failed["state"].as<std::string>() == "failed");
	EXPECT(failed["path"].as<std::string>() == "404");
	EXPECT(failed["error"].as<std::string>() == "file missing");
	EXPECT(failed["error_code"].as<int>() == static_cast<int>(std::errc::no_such_file_or_directory));
	EXPECT(to_strings(failed["rest"]) == std::vector<std::string>{"2byte"});

	reader.skip();
	EXPECT(read_to_end(reader, out).has_value());
	auto exhausted = dj::Json{};
	io::to_json(exhausted, reader);
	EXPECT(exhausted["state"].as<std::string>() == "exhausted");
	EXPECT(!exhausted["path"]);
}

ADD_TEST(SerializeManifest) {
	auto const manifest = Manifest{.root = "data", .sources = {"a", "b"}};
	auto json = dj::Json{};
	io::to_json(json, manifest);
	auto parsed = Manifest{};
	io::from_json(json, parsed);
	EXPECT(parsed.root == "data");
	EXPECT(parsed.sources == manifest.sources);
}
} // namespace
