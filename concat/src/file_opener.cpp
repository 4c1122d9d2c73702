#include <concat/file_opener.hpp>
#include <concat/file_stream.hpp>

namespace concat {
auto FileOpener::open(SourceId const& id) -> OpenResult {
	auto result = FileStream::open(resolve(id));
	if (!result) { return std::move(result.error()); }
	return std::unique_ptr<Stream>{std::make_unique<FileStream>(std::move(result.value()))};
}
} // namespace concat
