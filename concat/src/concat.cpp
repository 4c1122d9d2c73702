#include <concat/concat.hpp>

namespace concat {
auto concat(std::vector<std::unique_ptr<Stream>> streams) -> std::unique_ptr<ConcatRead> { return std::make_unique<ConcatReader>(std::move(streams)); }

auto concat_paths(std::vector<SourceId> paths, std::unique_ptr<Opener> opener) -> std::unique_ptr<FileConcatRead> {
	return std::make_unique<FileConcatReader>(std::move(paths), std::move(opener));
}
} // namespace concat
