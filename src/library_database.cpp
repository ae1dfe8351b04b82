#include "library_database.h"
#include "library_t.h"

#include <sqlite3.h>

#include <iostream>
#include <unordered_map>

// ============================================================================
// Library Database
// ============================================================================

namespace {

constexpr int BusyTimeoutMs = 2000;

constexpr auto BooksQuery =
        "SELECT id, title, path, uuid, has_cover, timestamp "
        "FROM books ORDER BY sort COLLATE NOCASE, id";

constexpr auto AuthorsQuery =
        "SELECT l.book, a.name FROM books_authors_link l "
        "JOIN authors a ON a.id = l.author ORDER BY l.book, l.id";

constexpr auto TagsQuery =
        "SELECT l.book, t.name FROM books_tags_link l "
        "JOIN tags t ON t.id = l.tag";

constexpr auto FilesQuery = "SELECT book, format, name FROM data ORDER BY book, id";

constexpr auto CountQuery = "SELECT COUNT(*) FROM books";

} // namespace

// Prepared statement bound to the lifetime of one query
class LibraryDatabase::Statement {
	sqlite3* db_         = nullptr;
	sqlite3_stmt* stmt_  = nullptr;

public:
	Statement(sqlite3* db, const char* sql) : db_(db)
	{
		if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
			const std::string message = sqlite3_errmsg(db_);
			sqlite3_finalize(stmt_);
			throw DatabaseError("Cannot query calibre database: " + message);
		}
	}

	~Statement()
	{
		sqlite3_finalize(stmt_);
	}

	Statement(const Statement&)            = delete;
	Statement& operator=(const Statement&) = delete;

	[[nodiscard]] bool step()
	{
		const int rc = sqlite3_step(stmt_);
		if (rc == SQLITE_ROW) {
			return true;
		}
		if (rc == SQLITE_DONE) {
			return false;
		}
		throw DatabaseError(std::string("Cannot read calibre database: ") +
		                    sqlite3_errmsg(db_));
	}

	[[nodiscard]] int64_t integer(const int column) const
	{
		return sqlite3_column_int64(stmt_, column);
	}

	[[nodiscard]] std::string text(const int column) const
	{
		const auto* value = sqlite3_column_text(stmt_, column);
		return value ? reinterpret_cast<const char*>(value) : std::string();
	}
};

void LibraryDatabase::Closer::operator()(sqlite3* db) const
{
	sqlite3_close(db);
}

LibraryDatabase::LibraryDatabase(const std::filesystem::path& library)
        : file_(library / Library::DatabaseFile)
{
	std::error_code ec = {};
	if (!std::filesystem::is_regular_file(file_, ec)) {
		throw DatabaseError("No calibre database found at " + file_.string());
	}

	sqlite3* raw = nullptr;
	const int rc = sqlite3_open_v2(file_.string().c_str(),
	                               &raw,
	                               SQLITE_OPEN_READONLY,
	                               nullptr);
	db_.reset(raw);
	if (rc != SQLITE_OK) {
		const std::string message = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
		throw DatabaseError("Cannot open " + file_.string() + ": " + message);
	}
	sqlite3_busy_timeout(db_.get(), BusyTimeoutMs);
}

[[nodiscard]] std::vector<BookRecord> LibraryDatabase::load_books() const
{
	std::vector<BookRecord> books                = {};
	std::unordered_map<BookId, size_t> positions = {};

	{
		Statement stmt(db_.get(), BooksQuery);
		while (stmt.step()) {
			BookRecord book = {.id        = stmt.integer(0),
			                   .title     = stmt.text(1),
			                   .path      = stmt.text(2),
			                   .uuid      = stmt.text(3),
			                   .timestamp = stmt.text(5),
			                   .has_cover = stmt.integer(4) != 0};
			positions.emplace(book.id, books.size());
			books.emplace_back(std::move(book));
		}
	}

	const auto owner = [&](const BookId id) -> BookRecord* {
		const auto it = positions.find(id);
		return (it != positions.end()) ? &books[it->second] : nullptr;
	};

	{
		Statement stmt(db_.get(), AuthorsQuery);
		while (stmt.step()) {
			if (auto* book = owner(stmt.integer(0))) {
				book->authors.emplace_back(stmt.text(1));
			}
		}
	}

	{
		Statement stmt(db_.get(), TagsQuery);
		while (stmt.step()) {
			if (auto* book = owner(stmt.integer(0))) {
				book->tags.insert(stmt.text(1));
			}
		}
	}

	{
		Statement stmt(db_.get(), FilesQuery);
		while (stmt.step()) {
			if (auto* book = owner(stmt.integer(0))) {
				book->files.push_back({.format = stmt.text(1), .name = stmt.text(2)});
			}
		}
	}

	return books;
}

[[nodiscard]] int64_t LibraryDatabase::count_books() const
{
	Statement stmt(db_.get(), CountQuery);
	return stmt.step() ? stmt.integer(0) : 0;
}

[[nodiscard]] std::optional<int64_t> LibraryDatabase::book_count(const std::filesystem::path& library)
{
	try {
		return LibraryDatabase(library).count_books();
	} catch (const DatabaseError& e) {
		std::cerr << "Warning: Cannot count books in " << library.string() << ": " << e.what() << '\n';
		return std::nullopt;
	}
}
