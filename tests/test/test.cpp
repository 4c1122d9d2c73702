#include <concat/core/logger.hpp>
#include <test/test.hpp>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <vector>

namespace test {
namespace {
struct Assert {};

void print_failure(std::string_view type, std::string_view expr, std::source_location const& sl) {
	std::cerr << std::format("  {} failed: '{}' [{}:{}]\n", type, expr, std::filesystem::path{sl.file_name()}.filename().string(), sl.line());
}

bool g_failed{}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void set_failure(std::string_view type, std::string_view expr, std::source_location const& sl) {
	print_failure(type, expr, sl);
	g_failed = true;
}

auto get_tests() -> std::vector<Test*>& {
	static auto ret = std::vector<Test*>{};
	return ret;
}

auto run_test(Test& test) -> bool {
	g_failed = {};
	try {
		test.run();
	} catch (Assert const&) {
		// failure already recorded
	} catch (std::exception const& e) {
		std::cerr << std::format("  unexpected exception: {}\n", e.what());
		g_failed = true;
	}
	if (g_failed) {
		std::cerr << std::format("[FAILED] {}\n", test.get_name());
		return false;
	}
	std::cout << std::format("[passed] {}\n", test.get_name());
	return true;
}
} // namespace

Test::Test() { get_tests().push_back(this); }

void Test::do_expect(bool pred, std::string_view expr, std::source_location const& location) {
	if (pred) { return; }
	set_failure("expectation", expr, location);
}

void Test::do_assert(bool pred, std::string_view expr, std::source_location const& location) {
	if (pred) { return; }
	set_failure("assertion", expr, location);
	throw Assert{};
}
} // namespace test

auto main(int argc, char** argv) -> int {
	// -v: print library debug logs while testing
	if (argc > 1 && std::strcmp(argv[1], "-v") == 0) { concat::logger::set_max_level(concat::logger::debug_v); }
	auto ret = EXIT_SUCCESS;
	for (auto* test : test::get_tests()) {
		if (!test::run_test(*test)) { ret = EXIT_FAILURE; }
	}
	return ret;
}
