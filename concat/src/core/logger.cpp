#include <concat/core/logger.hpp>
#include <array>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace concat {
namespace {
namespace fs = std::filesystem;

auto thread_id() -> int {
	auto const next_id = []() -> int {
		static std::atomic<int> s_id{};
		return s_id++;
	};
	thread_local auto const ret{next_id()};
	return ret;
}

// lower is more severe; unknown levels are treated as debug
constexpr auto rank(char const level) -> int {
	switch (level) {
	case logger::error_v: return 0;
	case logger::warn_v: return 1;
	case logger::info_v: return 2;
	default: return 3;
	}
}

struct Timestamp {
	static constexpr std::size_t capacity_v{128};

	auto operator()(logger::Clock::time_point const& time_point) const -> std::array<char, capacity_v> {
		auto ret = std::array<char, capacity_v>{};
		auto const time = logger::Clock::to_time_t(time_point);
		static auto s_mutex{std::mutex{}};
		auto lock = std::unique_lock{s_mutex};
		// NOLINTNEXTLINE
		auto const tm_ = *std::localtime(&time);
		lock.unlock();
		std::strftime(ret.data(), ret.size(), "%T", &tm_);
		return ret;
	}
};

auto format_line(std::string_view const domain, std::string_view const message, char level) {
	return std::format("[{}][T{}] [{}] {} [{}]\n", level, thread_id(), domain, message, Timestamp{}(logger::Clock::now()).data());
}

// NOLINTNEXTLINE
std::weak_ptr<logger::File> g_file{};
// NOLINTNEXTLINE
std::atomic<char> g_max_level{logger::warn_v};
} // namespace

struct logger::File {
	std::mutex mutex{};
	std::string path{};
	std::string buffer{};
	std::condition_variable_any cv{};
	std::jthread thread{};

	File() : thread([this](std::stop_token const& stop) { run(stop); }) {}

	auto set_path(std::string path) -> void {
		auto lock = std::scoped_lock{mutex};
		if (fs::exists(path)) { fs::remove(path); }
		this->path = std::move(path);
	}

	auto push(std::string_view text) -> void {
		auto lock = std::unique_lock{mutex};
		buffer.append(text);
		lock.unlock();
		cv.notify_one();
	}

	auto run(std::stop_token const& stop) -> void {
		while (!stop.stop_requested()) {
			auto lock = std::unique_lock{mutex};
			cv.wait(lock, stop, [this] { return !buffer.empty(); });
			flush(lock);
		}
		// drain whatever arrived after the stop request
		auto lock = std::unique_lock{mutex};
		flush(lock);
	}

	auto flush(std::unique_lock<std::mutex>& lock) -> void {
		if (buffer.empty()) { return; }
		auto text = std::exchange(buffer, {});
		auto const target = path;
		lock.unlock();
		if (auto file = std::ofstream{target, std::ios::binary | std::ios::app}) { file << text; }
	}
};

auto logger::is_enabled(char const level) -> bool { return rank(level) <= rank(g_max_level.load()); }

auto logger::set_max_level(char const level) -> void { g_max_level.store(level); }

auto logger::get_max_level() -> char { return g_max_level.load(); }

auto logger::print(std::string_view const domain, std::string_view const message, char level) -> void {
	auto const line = format_line(domain, message, level);
	assert(!line.empty() && line.back() == '\n');
	if (auto file = g_file.lock()) { file->push(line); }
	auto& stream = level == error_v ? std::cerr : std::cout;
	stream << line;
}

auto logger::log_to_file(std::string path) -> std::shared_ptr<File> {
	auto file = g_file.lock();
	if (!file) {
		file = std::make_shared<File>();
		g_file = file;
	}
	file->set_path(std::move(path));
	return file;
}
} // namespace concat
