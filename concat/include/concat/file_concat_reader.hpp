#pragma once
#include <concat/concat_read.hpp>
#include <concat/opener.hpp>
#include <memory>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace concat {
///
/// \brief Reads a sequence of paths as one continuous stream, opening each only when its first byte is requested.
///
/// An open failure is sticky: every read reports it again until skip() is called.
/// A read failure on an open source is reported once and leaves the source open.
/// At most one source is open at any time.
///
class FileConcatReader : public FileConcatRead {
  public:
	enum class State { ePending, eOpen, eFailed, eExhausted };

	static constexpr auto to_string(State const state) -> std::string_view {
		switch (state) {
		case State::ePending: return "pending";
		case State::eOpen: return "open";
		case State::eFailed: return "failed";
		case State::eExhausted: return "exhausted";
		}
		return "unknown";
	}

	///
	/// \brief Construct an instance over sources (read front to back).
	/// \param sources Ordered source identities
	/// \param opener Used to open each source; defaults to FileOpener if null
	///
	explicit FileConcatReader(std::vector<SourceId> sources, std::unique_ptr<Opener> opener = {});

	[[nodiscard]] auto read(std::span<std::uint8_t> out) -> ReadResult override;
	[[nodiscard]] auto describe() const -> std::string override;

	[[nodiscard]] auto current() const -> Ptr<Stream const> override;
	auto skip() -> bool override;
	[[nodiscard]] auto file_path() const -> Ptr<SourceId const> override;

	[[nodiscard]] auto state() const -> State;
	///
	/// \brief Obtain the stored open failure, if the current source failed to open.
	///
	[[nodiscard]] auto open_error() const -> Ptr<IoError const>;
	///
	/// \brief Obtain the identities not yet pulled (excludes the current source).
	///
	[[nodiscard]] auto remaining() const -> std::span<SourceId const> { return std::span{m_sources}.subspan(m_next); }

	[[nodiscard]] auto get_opener() const -> Opener const& { return *m_opener; }

  private:
	struct Pending {
		SourceId id{};
	};
	struct Open {
		std::unique_ptr<Stream> stream{};
		SourceId id{};
	};
	struct Failed {
		IoError error{};
		SourceId id{};
	};
	struct Exhausted {};

	using Slot = std::variant<Pending, Open, Failed, Exhausted>;

	auto open_pending() -> void;
	auto read_current(std::span<std::uint8_t> out) -> ReadResult;
	auto advance() -> bool;

	Slot m_slot{Exhausted{}};
	std::vector<SourceId> m_sources{};
	std::size_t m_next{};
	std::unique_ptr<Opener> m_opener{};
};
} // namespace concat
