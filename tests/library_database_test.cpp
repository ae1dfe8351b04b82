#include "library_database.h"
#include "test_support.h"

#include <gtest/gtest.h>

TEST(LibraryDatabase, LoadsBooksInSortOrderWithAuthorsTagsAndFiles)
{
	TempDir dir;
	write_calibre_library(dir.path(),
	                      {{.id      = 1,
	                        .title   = "The Hobbit",
	                        .sort    = "Hobbit, The",
	                        .authors = {"J. R. R. Tolkien"},
	                        .tags    = {"Fantasy", "Classic"},
	                        .path    = "J. R. R. Tolkien/The Hobbit (1)",
	                        .files   = {{.format = "EPUB", .name = "The Hobbit - J. R. R. Tolkien"}}},
	                       {.id      = 2,
	                        .title   = "Good Omens",
	                        .authors = {"Terry Pratchett", "Neil Gaiman"},
	                        .path    = "Terry Pratchett/Good Omens (2)"},
	                       {.id = 3, .title = "anathem", .path = "Unknown/anathem (3)"}});

	const LibraryDatabase database(dir.path());
	const auto books = database.load_books();

	ASSERT_EQ(books.size(), 3u);
	EXPECT_EQ(books[0].title, "anathem");
	EXPECT_EQ(books[1].title, "Good Omens");
	EXPECT_EQ(books[2].title, "The Hobbit");

	EXPECT_EQ(books[1].authors, (std::vector<std::string>{"Terry Pratchett", "Neil Gaiman"}));
	EXPECT_TRUE(books[0].authors.empty());

	EXPECT_EQ(books[2].tags, (std::set<std::string>{"Classic", "Fantasy"}));
	EXPECT_EQ(books[2].path, "J. R. R. Tolkien/The Hobbit (1)");
	EXPECT_EQ(books[2].uuid, "uuid-1");
	ASSERT_EQ(books[2].files.size(), 1u);
	EXPECT_EQ(books[2].files[0].format, "EPUB");

	EXPECT_EQ(database.count_books(), 3);
}

TEST(LibraryDatabase, EmptyLibraryHasNoBooks)
{
	TempDir dir;
	write_calibre_library(dir.path(), {});

	const LibraryDatabase database(dir.path());
	EXPECT_TRUE(database.load_books().empty());
	EXPECT_EQ(database.count_books(), 0);
}

TEST(LibraryDatabase, MissingDatabaseThrows)
{
	TempDir dir;
	EXPECT_THROW(LibraryDatabase{dir.path()}, DatabaseError);
}

TEST(LibraryDatabase, ForeignDatabaseThrowsOnLoad)
{
	TempDir dir;
	write_file(dir / "metadata.db", std::string(4096, 'x'));

	EXPECT_THROW(
	        {
		        const LibraryDatabase database(dir.path());
		        static_cast<void>(database.load_books());
	        },
	        DatabaseError);
}

TEST(LibraryDatabase, BookCountReadsTheDatabase)
{
	TempDir dir;
	write_calibre_library(dir.path(),
	                      {{.id = 1, .title = "One", .path = "A/One (1)"},
	                       {.id = 2, .title = "Two", .path = "A/Two (2)"}});

	EXPECT_EQ(LibraryDatabase::book_count(dir.path()), std::optional<int64_t>(2));
}

TEST(LibraryDatabase, BookCountIsEmptyForUnreadableLibraries)
{
	TempDir missing;
	EXPECT_FALSE(LibraryDatabase::book_count(missing.path()));

	TempDir foreign;
	write_file(foreign / "metadata.db", std::string(4096, 'x'));
	EXPECT_FALSE(LibraryDatabase::book_count(foreign.path()));
}
