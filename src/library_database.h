#ifndef LIBRARY_DATABASE_H
#define LIBRARY_DATABASE_H

#include "book_t.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

// ============================================================================
// Library Database
// ============================================================================

class DatabaseError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Read-only view of a calibre metadata.db
class LibraryDatabase {
	struct Closer {
		void operator()(sqlite3* db) const;
	};

	std::unique_ptr<sqlite3, Closer> db_ = nullptr;
	std::filesystem::path file_          = {};

	class Statement;

public:
	// Throws DatabaseError if the database cannot be opened
	explicit LibraryDatabase(const std::filesystem::path& library);

	// All books ordered by sort title. Throws DatabaseError on any
	// SQLite failure.
	[[nodiscard]] std::vector<BookRecord> load_books() const;

	[[nodiscard]] int64_t count_books() const;

	// Number of books in the library, or nothing with a warning when its
	// database cannot be read
	[[nodiscard]] static std::optional<int64_t> book_count(const std::filesystem::path& library);
};

#endif
