#ifndef SEARCH_FIELDS_H
#define SEARCH_FIELDS_H

#include "book_t.h"
#include "library_t.h"
#include "search_index.h"

#include <string>
#include <vector>

// ============================================================================
// Search Fields
// ============================================================================

// Title is primary; every author, every tag and the book path are searched
struct BookFields {
	using Record = BookRecord;
	using Id     = BookId;

	[[nodiscard]] static Id id(const Record& book);

	[[nodiscard]] static std::vector<FieldText> fields(const Record& book);
};

// Display name is primary; the library path is searched too
struct LibraryFields {
	using Record = LibraryRecord;
	using Id     = std::string;

	[[nodiscard]] static Id id(const Record& library);

	[[nodiscard]] static std::vector<FieldText> fields(const Record& library);
};

using BookIndex    = SearchIndex<BookFields>;
using LibraryIndex = SearchIndex<LibraryFields>;

#endif
