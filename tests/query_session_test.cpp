#include "query_session.h"
#include "search_fields.h"
#include "transliterator.h"

#include <gtest/gtest.h>

namespace {

class QuerySessionTest : public ::testing::Test {
protected:
	Transliterator translit_ = {};
	BookIndex index_{{{.id = 10, .title = "Alpha"},
	                  {.id = 20, .title = "Beta"},
	                  {.id = 30, .title = "Alphabet"}},
	                 translit_};
};

} // namespace

TEST_F(QuerySessionTest, StartsUnfilteredAtFirstRecord)
{
	QuerySession session(index_);
	EXPECT_EQ(session.query(), "");
	EXPECT_EQ(session.matches(), (std::vector<BookId>{10, 20, 30}));
	EXPECT_EQ(session.cursor(), 0u);
	ASSERT_NE(session.selected(), nullptr);
	EXPECT_EQ(session.selected()->id, 10);
}

TEST_F(QuerySessionTest, SetQueryResetsCursor)
{
	QuerySession session(index_);
	session.move_cursor(2);
	EXPECT_EQ(session.cursor(), 2u);

	session.set_query("alpha");
	EXPECT_EQ(session.matches(), (std::vector<BookId>{10, 30}));
	EXPECT_EQ(session.cursor(), 0u);
}

TEST_F(QuerySessionTest, NoMatchesLeavesCursorUnset)
{
	QuerySession session(index_);
	session.set_query("gamma");
	EXPECT_TRUE(session.matches().empty());
	EXPECT_FALSE(session.cursor());
	EXPECT_EQ(session.selected(), nullptr);

	session.move_cursor(1);
	EXPECT_FALSE(session.cursor());
}

TEST_F(QuerySessionTest, CursorIsClamped)
{
	QuerySession session(index_);
	session.move_cursor(-5);
	EXPECT_EQ(session.cursor(), 0u);
	session.move_cursor(100);
	EXPECT_EQ(session.cursor(), 2u);
	session.move_cursor(-1);
	EXPECT_EQ(session.cursor(), 1u);
}

TEST_F(QuerySessionTest, ClearRestoresUnfilteredState)
{
	QuerySession session(index_);
	session.set_query("beta");
	session.clear();
	EXPECT_EQ(session.query(), "");
	EXPECT_EQ(session.matches(), (std::vector<BookId>{10, 20, 30}));
	EXPECT_EQ(session.cursor(), 0u);
}

TEST_F(QuerySessionTest, TypingAndErasingEditTheQuery)
{
	QuerySession session(index_);
	session.type("b");
	session.type("é");
	EXPECT_EQ(session.query(), "bé");
	EXPECT_TRUE(session.erase());
	EXPECT_EQ(session.query(), "b");
	EXPECT_EQ(session.matches(), (std::vector<BookId>{20, 30}));
	EXPECT_TRUE(session.erase());
	EXPECT_FALSE(session.erase());
}

TEST_F(QuerySessionTest, TransitionsArePure)
{
	const auto start = with_query(index_, "alpha");
	const auto moved = with_cursor(start, 1);

	EXPECT_EQ(start.cursor, 0u);
	EXPECT_EQ(moved.cursor, 1u);
	EXPECT_EQ(moved.matches, start.matches);
	EXPECT_EQ(moved.raw_query, "alpha");
}
