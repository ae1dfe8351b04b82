#include "bookshelf.h"
#include "library_database.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace {

class BookshelfTest : public ::testing::Test {
protected:
	Transliterator translit_ = {};
	TempDir dir_;
};

} // namespace

TEST_F(BookshelfTest, SwitchingLibrariesReplacesEveryBook)
{
	write_calibre_library(dir_ / "a",
	                      {{.id = 1, .title = "Shared Title", .path = "a/1"},
	                       {.id = 2, .title = "Only In A", .path = "a/2"}});
	write_calibre_library(dir_ / "b",
	                      {{.id = 7, .title = "Shared Title", .path = "b/7"},
	                       {.id = 8, .title = "Only In B", .path = "b/8"}});

	auto shelf = Bookshelf::load((dir_ / "a").string(), translit_);
	ASSERT_EQ(shelf->index().size(), 2u);

	shelf = Bookshelf::load((dir_ / "b").string(), translit_);
	for (const auto* query : {"", "shared", "only", "a"}) {
		for (const auto id : shelf->index().query(query)) {
			EXPECT_TRUE(id == 7 || id == 8) << "query " << query << " returned " << id;
		}
	}
	EXPECT_EQ(shelf->index().find(1), nullptr);
	EXPECT_EQ(shelf->name(), "b");
}

TEST_F(BookshelfTest, SessionStartsUnfiltered)
{
	write_calibre_library(dir_.path(),
	                      {{.id = 1, .title = "Beta", .path = "x/1"},
	                       {.id = 2, .title = "Alpha", .path = "x/2"}});

	auto shelf = Bookshelf::load(dir_.path().string(), translit_);
	auto& session = shelf->session();
	EXPECT_EQ(session.matches(), (std::vector<BookId>{2, 1}));

	session.set_query("beta");
	ASSERT_NE(session.selected(), nullptr);
	EXPECT_EQ(session.selected()->id, 1);
}

TEST_F(BookshelfTest, LoadFailsWithoutDatabase)
{
	EXPECT_THROW(static_cast<void>(Bookshelf::load(dir_.path().string(), translit_)),
	             DatabaseError);
}

TEST_F(BookshelfTest, BookFilePrefersEpubAndSkipsMissingFiles)
{
	const BookRecord book = {.id    = 1,
	                         .title = "Dune",
	                         .path  = "Frank Herbert/Dune (1)",
	                         .files = {{.format = "PDF", .name = "Dune"},
	                                   {.format = "MOBI", .name = "Dune"},
	                                   {.format = "EPUB", .name = "Dune"}}};

	const auto book_dir = dir_ / "Frank Herbert" / "Dune (1)";
	write_file(book_dir / "Dune.pdf", "%PDF");
	write_file(book_dir / "Dune.mobi", "mobi");

	const Bookshelf shelf(dir_.path().string(), {book}, translit_);

	// No EPUB on disk, so MOBI beats PDF
	EXPECT_EQ(shelf.book_file(book), book_dir / "Dune.mobi");

	write_file(book_dir / "Dune.epub", "epub");
	EXPECT_EQ(shelf.book_file(book), book_dir / "Dune.epub");
}

TEST_F(BookshelfTest, BookWithoutFilesHasNothingToOpen)
{
	const BookRecord book = {.id = 1, .title = "Paper only", .path = "x/1"};
	const Bookshelf shelf(dir_.path().string(), {book}, translit_);
	EXPECT_FALSE(shelf.book_file(book));
	EXPECT_FALSE(shelf.details(book));
}

TEST_F(BookshelfTest, DetailsComeFromTheOpfBesideTheBook)
{
	const BookRecord book = {.id = 1, .title = "Dune", .path = "Frank Herbert/Dune (1)"};
	write_file(dir_ / book.path / "metadata.opf",
	           R"(<?xml version="1.0" encoding="utf-8"?>
<package xmlns="http://www.idpf.org/2007/opf" version="2.0">
  <metadata xmlns:dc="http://purl.org/dc/elements/1.1/" xmlns:opf="http://www.idpf.org/2007/opf">
    <dc:title>Dune</dc:title>
    <dc:publisher>Chilton</dc:publisher>
  </metadata>
</package>)");

	const Bookshelf shelf(dir_.path().string(), {book}, translit_);
	const auto details = shelf.details(book);
	ASSERT_TRUE(details);
	EXPECT_EQ(details->publisher, "Chilton");
}
