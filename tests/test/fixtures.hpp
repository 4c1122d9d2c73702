#pragma once
#include <concat/memory_stream.hpp>
#include <concat/opener.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test {
///
/// \brief Serves fixed contents for known identities, fails with "file missing" otherwise.
///
class MockOpener : public concat::Opener {
  public:
	using Files = std::map<std::string, std::string, std::less<>>;

	static auto files() -> Files const& {
		static auto const ret = Files{
			{"test1.txt", "some\ntext\n"},
			{"1byte", "1"},
			{"2byte", "22"},
			{"3byte", "333"},
			{"4byte", "4444"},
			{"empty", ""},
			{"dir/other.test.txt", "here's "},
		};
		return ret;
	}

	static auto missing() -> concat::IoError { return concat::IoError::make(std::make_error_code(std::errc::no_such_file_or_directory), "file missing"); }

	explicit MockOpener(std::vector<std::string>* opened = {}) : m_opened(opened) {}

	auto open(concat::SourceId const& id) -> OpenResult override {
		if (m_opened != nullptr) { m_opened->emplace_back(id.value()); }
		auto const it = files().find(id.value());
		if (it == files().end()) { return missing(); }
		return std::unique_ptr<concat::Stream>{std::make_unique<concat::MemoryStream>(it->second)};
	}

  private:
	std::vector<std::string>* m_opened{};
};

///
/// \brief Fails the first `failures` reads with "connection reset", then serves text.
///
class FlakyStream : public concat::Stream {
  public:
	explicit FlakyStream(std::string_view text, int failures = 1) : m_inner(text), m_failures(failures) {}

	auto read(std::span<std::uint8_t> out) -> ReadResult override {
		if (m_failures > 0) {
			--m_failures;
			return concat::IoError::make(std::make_error_code(std::errc::connection_reset), "connection reset");
		}
		return m_inner.read(out);
	}

	auto describe() const -> std::string override { return std::format("FlakyStream({})", m_failures); }

  private:
	concat::MemoryStream m_inner;
	int m_failures{};
};

///
/// \brief MockOpener that serves a FlakyStream for identities starting with "flaky".
///
class FlakyOpener : public concat::Opener {
  public:
	auto open(concat::SourceId const& id) -> OpenResult override {
		if (id.value().starts_with("flaky")) { return std::unique_ptr<concat::Stream>{std::make_unique<FlakyStream>("ok")}; }
		return m_inner.open(id);
	}

  private:
	MockOpener m_inner{};
};

///
/// \brief MockOpener whose first open throws instead of returning.
///
class ThrowOnceOpener : public concat::Opener {
  public:
	explicit ThrowOnceOpener(std::vector<std::string>* opened = {}) : m_inner(opened) {}

	auto open(concat::SourceId const& id) -> OpenResult override {
		auto result = m_inner.open(id);
		if (!std::exchange(m_thrown, true)) { throw std::runtime_error{"device busy"}; }
		return result;
	}

  private:
	MockOpener m_inner;
	bool m_thrown{};
};

///
/// \brief Broken opener: reports success without a stream.
///
class NullOpener : public concat::Opener {
  public:
	auto open(concat::SourceId const& /*id*/) -> OpenResult override { return std::unique_ptr<concat::Stream>{}; }
};

///
/// \brief Unique scratch directory, removed on destruction.
///
class TempDir {
  public:
	TempDir() {
		static auto s_next{std::atomic<int>{}};
		m_path = std::filesystem::temp_directory_path() / std::format("concat-test-{}-{}", std::chrono::steady_clock::now().time_since_epoch().count(), s_next++);
		std::filesystem::create_directories(m_path);
	}

	TempDir(TempDir const&) = delete;
	TempDir(TempDir&&) = delete;
	auto operator=(TempDir const&) -> TempDir& = delete;
	auto operator=(TempDir&&) -> TempDir& = delete;

	~TempDir() {
		auto ec = std::error_code{};
		std::filesystem::remove_all(m_path, ec);
	}

	[[nodiscard]] auto path() const -> std::filesystem::path const& { return m_path; }

	auto write(std::string_view name, std::string_view text) const -> std::string {
		auto const path = m_path / name;
		std::filesystem::create_directories(path.parent_path());
		auto file = std::ofstream{path, std::ios::binary};
		file << text;
		return path.generic_string();
	}

  private:
	std::filesystem::path m_path{};
};
} // namespace test
