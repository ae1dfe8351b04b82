#include "search_fields.h"

// ============================================================================
// Search Fields
// ============================================================================

[[nodiscard]] BookFields::Id BookFields::id(const Record& book)
{
	return book.id;
}

[[nodiscard]] std::vector<FieldText> BookFields::fields(const Record& book)
{
	std::vector<FieldText> fields = {};
	fields.reserve(2 + book.authors.size() + book.tags.size());

	fields.push_back({.text = book.title, .primary = true});
	for (const auto& author : book.authors) {
		fields.push_back({.text = author});
	}
	for (const auto& tag : book.tags) {
		fields.push_back({.text = tag});
	}
	fields.push_back({.text = book.path});
	return fields;
}

[[nodiscard]] LibraryFields::Id LibraryFields::id(const Record& library)
{
	return library.path;
}

[[nodiscard]] std::vector<FieldText> LibraryFields::fields(const Record& library)
{
	return {
	        {.text = library.display_name, .primary = true},
	        {.text = library.path},
	};
}
