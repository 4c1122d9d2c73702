#pragma once
#include <chrono>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace concat::logger {
using Clock = std::chrono::system_clock;

inline constexpr auto error_v{'E'};
inline constexpr auto warn_v{'W'};
inline constexpr auto info_v{'I'};
inline constexpr auto debug_v{'D'};

///
/// \brief Check whether messages at level would be printed.
///
[[nodiscard]] auto is_enabled(char level) -> bool;
///
/// \brief Set the most verbose level that is printed (default: warn_v).
///
auto set_max_level(char level) -> void;
[[nodiscard]] auto get_max_level() -> char;

auto print(std::string_view domain, std::string_view message, char level) -> void;

struct Logger {
	std::string_view domain{};

	template <typename... Args>
	auto error(std::format_string<Args...> fmt, Args&&... args) const {
		log(error_v, fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	auto warn(std::format_string<Args...> fmt, Args&&... args) const {
		log(warn_v, fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	auto info(std::format_string<Args...> fmt, Args&&... args) const {
		log(info_v, fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	auto debug(std::format_string<Args...> fmt, Args&&... args) const {
		log(debug_v, fmt, std::forward<Args>(args)...);
	}

  private:
	template <typename... Args>
	auto log(char const level, std::format_string<Args...> fmt, Args&&... args) const {
		if (!is_enabled(level)) { return; }
		print(domain, std::format(fmt, std::forward<Args>(args)...), level);
	}
};

struct File;

auto log_to_file(std::string path = "concat.log") -> std::shared_ptr<File>;

auto const g_log{Logger{"General"}};
} // namespace concat::logger
