#ifndef BOOKSHELF_H
#define BOOKSHELF_H

#include "book_t.h"
#include "query_session.h"
#include "search_fields.h"
#include "transliterator.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ============================================================================
// Bookshelf
// ============================================================================

using BookSession    = QuerySession<BookIndex>;
using LibrarySession = QuerySession<LibraryIndex>;

// The open library: its books, their index and the query over them.
// Built in one piece and replaced in one piece.
class Bookshelf {
	std::string path_     = {};
	std::string name_     = {};
	BookIndex index_      = {};
	BookSession session_;

public:
	Bookshelf(std::string path, std::vector<BookRecord> books, const Transliterator& translit);

	// Reads the library's database and indexes it. Throws DatabaseError.
	[[nodiscard]] static std::unique_ptr<Bookshelf> load(const std::string& path,
	                                                     const Transliterator& translit);

	Bookshelf(const Bookshelf&)            = delete;
	Bookshelf& operator=(const Bookshelf&) = delete;

	[[nodiscard]] const std::string& path() const;

	[[nodiscard]] const std::string& name() const;

	[[nodiscard]] const BookIndex& index() const;

	[[nodiscard]] BookSession& session();

	[[nodiscard]] const BookSession& session() const;

	// First existing file of the book, preferring EPUB, AZW3, MOBI, PDF
	[[nodiscard]] std::optional<std::filesystem::path> book_file(const BookRecord& book) const;

	[[nodiscard]] std::optional<BookDetails> details(const BookRecord& book) const;
};

#endif
