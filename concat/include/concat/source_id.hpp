#pragma once
#include <concepts>
#include <functional>
#include <string>
#include <string_view>

namespace concat {
///
/// \brief Path-like identity of a source that has not been opened yet.
///
class SourceId {
  public:
	struct Hasher;

	SourceId() = default;

	SourceId(std::string value) : m_value(std::move(value)), m_hash(std::hash<std::string>{}(m_value)) {}
	SourceId(std::string_view value) : SourceId(std::string{value}) {}
	SourceId(char const* value) : SourceId(std::string{value}) {}

	[[nodiscard]] auto value() const -> std::string_view { return m_value; }
	[[nodiscard]] auto c_str() const -> char const* { return m_value.c_str(); }

	[[nodiscard]] auto hash() const -> std::size_t { return m_hash; }
	[[nodiscard]] auto filename() const -> std::string;

	///
	/// \brief Obtain this identity joined onto prefix (generic separators).
	///
	/// Rooted identities and empty prefixes are returned unchanged.
	///
	[[nodiscard]] auto absolute(std::string_view prefix) const -> SourceId;

	[[nodiscard]] auto is_empty() const -> bool { return m_value.empty(); }

	operator std::string_view() const { return value(); }
	explicit operator bool() const { return !is_empty(); }

	auto operator==(SourceId const& rhs) const -> bool { return m_value == rhs.m_value; }

  private:
	std::string m_value{};
	std::size_t m_hash{};
};

struct SourceId::Hasher {
	using is_transparent = void;

	auto operator()(SourceId const& id) const { return id.hash(); }

	template <std::constructible_from<std::string_view> T>
	auto operator()(T const& id) const {
		return std::hash<std::string_view>{}(std::string_view{id});
	}
};
} // namespace concat
