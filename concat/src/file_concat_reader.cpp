#include <concat/core/logger.hpp>
#include <concat/core/visitor.hpp>
#include <concat/file_concat_reader.hpp>
#include <concat/file_opener.hpp>
#include <format>

namespace concat {
namespace {
auto const g_log{logger::Logger{"FileConcatReader"}};

auto quoted(SourceId const& id) -> std::string { return std::format("\"{}\"", id.value()); }
} // namespace

FileConcatReader::FileConcatReader(std::vector<SourceId> sources, std::unique_ptr<Opener> opener)
	: m_sources(std::move(sources)), m_opener(std::move(opener)) {
	if (!m_opener) { m_opener = std::make_unique<FileOpener>(); }
	advance();
}

auto FileConcatReader::read(std::span<std::uint8_t> out) -> ReadResult {
	// probing with an empty buffer must not open anything
	if (out.empty()) { return std::size_t{}; }

	for (;;) {
		if (std::holds_alternative<Pending>(m_slot)) {
			open_pending();
			continue;
		}
		auto result = read_current(out);
		if (!result || result.value() > 0 || std::holds_alternative<Exhausted>(m_slot)) { return result; }
		// current source reached end of data: chain to the next one
		advance();
	}
}

auto FileConcatReader::current() const -> Ptr<Stream const> {
	if (auto const* open = std::get_if<Open>(&m_slot)) { return open->stream.get(); }
	return nullptr;
}

auto FileConcatReader::skip() -> bool {
	if (auto const* id = file_path()) { g_log.debug("skipping [{}] ({})", id->value(), to_string(state())); }
	return advance();
}

auto FileConcatReader::file_path() const -> Ptr<SourceId const> {
	auto const visitor = Visitor{
		[](Pending const& pending) -> Ptr<SourceId const> { return &pending.id; },
		[](Open const& open) -> Ptr<SourceId const> { return &open.id; },
		[](Failed const& failed) -> Ptr<SourceId const> { return &failed.id; },
		[](Exhausted const&) -> Ptr<SourceId const> { return nullptr; },
	};
	return std::visit(visitor, m_slot);
}

auto FileConcatReader::state() const -> State {
	auto const visitor = Visitor{
		[](Pending const&) { return State::ePending; },
		[](Open const&) { return State::eOpen; },
		[](Failed const&) { return State::eFailed; },
		[](Exhausted const&) { return State::eExhausted; },
	};
	return std::visit(visitor, m_slot);
}

auto FileConcatReader::open_error() const -> Ptr<IoError const> {
	if (auto const* failed = std::get_if<Failed>(&m_slot)) { return &failed->error; }
	return nullptr;
}

auto FileConcatReader::describe() const -> std::string {
	auto const visitor = Visitor{
		[](Pending const& pending) { return std::format("Pending({})", quoted(pending.id)); },
		[](Open const& open) { return std::format("Open({}, {})", open.stream->describe(), quoted(open.id)); },
		[](Failed const& failed) { return std::format("Failed({}, {})", failed.error.description, quoted(failed.id)); },
		[](Exhausted const&) { return std::string{"Exhausted"}; },
	};
	auto rest = std::string{};
	for (auto const& id : remaining()) {
		if (!rest.empty()) { rest += ", "; }
		rest += quoted(id);
	}
	return std::format("FileConcatReader {{ state: {}, rest: [{}] }}", std::visit(visitor, m_slot), rest);
}

auto FileConcatReader::open_pending() -> void {
	auto* pending = std::get_if<Pending>(&m_slot);
	if (pending == nullptr) { throw Error{std::format("FileConcatReader: cannot open a source in state [{}]", to_string(state()))}; }

	// id stays in the slot until the open settles
	auto result = m_opener->open(pending->id);
	if (!result) {
		g_log.warn("failed to open [{}]: {}", pending->id.value(), result.error().description);
		m_slot = Failed{.error = std::move(result.error()), .id = std::move(pending->id)};
		return;
	}
	if (!result.value()) { throw Error{std::format("FileConcatReader: opener returned null stream for [{}]", pending->id.value())}; }

	g_log.debug("opened [{}]", pending->id.value());
	m_slot = Open{.stream = std::move(result.value()), .id = std::move(pending->id)};
}

auto FileConcatReader::read_current(std::span<std::uint8_t> out) -> ReadResult {
	auto const visitor = Visitor{
		[](Pending const&) -> ReadResult { throw Error{"FileConcatReader: read from unopened source"}; },
		[out](Open& open) -> ReadResult { return open.stream->read(out); },
		[](Failed const& failed) -> ReadResult { return failed.error; },
		[](Exhausted const&) -> ReadResult { return std::size_t{}; },
	};
	return std::visit(visitor, m_slot);
}

auto FileConcatReader::advance() -> bool {
	if (m_next >= m_sources.size()) {
		if (!std::holds_alternative<Exhausted>(m_slot)) { g_log.debug("all sources consumed"); }
		m_slot = Exhausted{};
		return false;
	}
	m_slot = Pending{.id = std::move(m_sources[m_next++])};
	return true;
}
} // namespace concat
