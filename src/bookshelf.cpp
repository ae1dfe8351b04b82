#include "bookshelf.h"
#include "history_store.h"
#include "library_database.h"
#include "library_t.h"
#include "opf_parser.h"
#include "utilities.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

// ============================================================================
// Bookshelf
// ============================================================================

namespace {

constexpr std::array<std::string_view, 4> PreferredFormats = {"EPUB", "AZW3", "MOBI", "PDF"};

[[nodiscard]] size_t format_rank(const std::string& format)
{
	const auto upper = [&] {
		std::string s = format;
		std::ranges::transform(s, s.begin(), [](const unsigned char c) {
			return static_cast<char>(std::toupper(c));
		});
		return s;
	}();
	const auto it = std::ranges::find(PreferredFormats, upper);
	return static_cast<size_t>(it - PreferredFormats.begin());
}

} // namespace

Bookshelf::Bookshelf(std::string path, std::vector<BookRecord> books, const Transliterator& translit)
        : path_(std::move(path)),
          name_(HistoryStore::name_for(path_)),
          index_(std::move(books), translit),
          session_(index_)
{}

[[nodiscard]] std::unique_ptr<Bookshelf> Bookshelf::load(const std::string& path,
                                                         const Transliterator& translit)
{
	const LibraryDatabase database(path);
	return std::make_unique<Bookshelf>(path, database.load_books(), translit);
}

[[nodiscard]] const std::string& Bookshelf::path() const
{
	return path_;
}

[[nodiscard]] const std::string& Bookshelf::name() const
{
	return name_;
}

[[nodiscard]] const BookIndex& Bookshelf::index() const
{
	return index_;
}

[[nodiscard]] BookSession& Bookshelf::session()
{
	return session_;
}

[[nodiscard]] const BookSession& Bookshelf::session() const
{
	return session_;
}

[[nodiscard]] std::optional<std::filesystem::path> Bookshelf::book_file(const BookRecord& book) const
{
	auto files = book.files;
	std::ranges::stable_sort(files, {}, [](const BookFile& f) { return format_rank(f.format); });

	const auto dir = std::filesystem::path(path_) / book.path;
	for (const auto& file : files) {
		if (file.name.empty() || file.format.empty()) {
			continue;
		}
		auto candidate = dir / (file.name + "." + Util::to_lower(file.format));
		std::error_code ec = {};
		if (std::filesystem::is_regular_file(candidate, ec)) {
			return candidate;
		}
	}
	return std::nullopt;
}

[[nodiscard]] std::optional<BookDetails> Bookshelf::details(const BookRecord& book) const
{
	return OPFParser::parse(std::filesystem::path(path_) / book.path / Library::MetadataFile);
}
