#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "book_t.h"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

// Directory under the system temp dir, removed with everything in it
class TempDir {
	std::filesystem::path path_ = {};

public:
	TempDir()
	{
		std::random_device rd;
		const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
		const std::string name = info ? info->name() : "test";
		path_ = std::filesystem::temp_directory_path() /
		        ("shelfsearch-" + name + "-" + std::to_string(rd()));
		std::filesystem::create_directories(path_);
	}

	~TempDir()
	{
		std::error_code ec = {};
		std::filesystem::remove_all(path_, ec);
	}

	TempDir(const TempDir&)            = delete;
	TempDir& operator=(const TempDir&) = delete;

	[[nodiscard]] const std::filesystem::path& path() const
	{
		return path_;
	}

	[[nodiscard]] std::filesystem::path operator/(const std::filesystem::path& sub) const
	{
		return path_ / sub;
	}
};

inline void write_file(const std::filesystem::path& file, const std::string& content)
{
	std::filesystem::create_directories(file.parent_path());
	std::ofstream out(file, std::ios::binary | std::ios::trunc);
	out << content;
}

struct FixtureBook {
	BookId id                        = {};
	std::string title                = {};
	std::string sort                 = {};
	std::vector<std::string> authors = {};
	std::vector<std::string> tags    = {};
	std::string path                 = {};
	std::vector<BookFile> files      = {};
};

// Writes a metadata.db with the part of the calibre schema that is read
inline void write_calibre_library(const std::filesystem::path& dir,
                                  const std::vector<FixtureBook>& books)
{
	std::filesystem::create_directories(dir);

	sqlite3* db = nullptr;
	ASSERT_EQ(sqlite3_open((dir / "metadata.db").string().c_str(), &db), SQLITE_OK);

	const auto exec = [db](const std::string& sql) {
		char* error = nullptr;
		const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
		EXPECT_EQ(rc, SQLITE_OK) << (error ? error : "") << " in " << sql;
		sqlite3_free(error);
	};

	const auto quote = [](const std::string& text) {
		std::string quoted = "'";
		for (const char c : text) {
			quoted += c;
			if (c == '\'') {
				quoted += '\'';
			}
		}
		return quoted + "'";
	};

	exec("CREATE TABLE books (id INTEGER PRIMARY KEY, title TEXT, sort TEXT, "
	     "timestamp TEXT, path TEXT, uuid TEXT, has_cover BOOL DEFAULT 0)");
	exec("CREATE TABLE authors (id INTEGER PRIMARY KEY, name TEXT UNIQUE)");
	exec("CREATE TABLE books_authors_link (id INTEGER PRIMARY KEY, book INTEGER, "
	     "author INTEGER)");
	exec("CREATE TABLE tags (id INTEGER PRIMARY KEY, name TEXT UNIQUE)");
	exec("CREATE TABLE books_tags_link (id INTEGER PRIMARY KEY, book INTEGER, tag INTEGER)");
	exec("CREATE TABLE data (id INTEGER PRIMARY KEY, book INTEGER, format TEXT, "
	     "uncompressed_size INTEGER, name TEXT)");

	for (const auto& book : books) {
		const auto id = std::to_string(book.id);
		exec("INSERT INTO books (id, title, sort, timestamp, path, uuid) VALUES (" + id +
		     ", " + quote(book.title) + ", " + quote(book.sort.empty() ? book.title : book.sort) +
		     ", '2024-01-02 03:04:05+00:00', " + quote(book.path) + ", 'uuid-" + id + "')");
		for (const auto& author : book.authors) {
			exec("INSERT OR IGNORE INTO authors (name) VALUES (" + quote(author) + ")");
			exec("INSERT INTO books_authors_link (book, author) SELECT " + id +
			     ", id FROM authors WHERE name = " + quote(author));
		}
		for (const auto& tag : book.tags) {
			exec("INSERT OR IGNORE INTO tags (name) VALUES (" + quote(tag) + ")");
			exec("INSERT INTO books_tags_link (book, tag) SELECT " + id +
			     ", id FROM tags WHERE name = " + quote(tag));
		}
		for (const auto& file : book.files) {
			exec("INSERT INTO data (book, format, uncompressed_size, name) VALUES (" + id +
			     ", " + quote(file.format) + ", 1, " + quote(file.name) + ")");
		}
	}

	sqlite3_close(db);
}

#endif
