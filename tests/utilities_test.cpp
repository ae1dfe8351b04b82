#include "utilities.h"

#include <gtest/gtest.h>

using namespace std::chrono;

TEST(Utilities, FormatsIso8601InUtc)
{
	EXPECT_EQ(Util::format_iso8601(TimePoint{}), "1970-01-01T00:00:00Z");

	const auto tp = sys_days{2024y / March / 5} + 10h + 20min + 30s;
	EXPECT_EQ(Util::format_iso8601(time_point_cast<system_clock::duration>(tp)),
	          "2024-03-05T10:20:30Z");
}

TEST(Utilities, ParsesIso8601Variants)
{
	const auto expected = time_point_cast<system_clock::duration>(
	        sys_days{2024y / March / 5} + 8h + 20min + 30s);

	EXPECT_EQ(Util::parse_iso8601("2024-03-05T08:20:30Z"), expected);
	EXPECT_EQ(Util::parse_iso8601("2024-03-05 08:20:30"), expected);
	EXPECT_EQ(Util::parse_iso8601("2024-03-05T08:20:30.123456Z"), expected);
	EXPECT_EQ(Util::parse_iso8601("2024-03-05T10:20:30+02:00"), expected);
	EXPECT_EQ(Util::parse_iso8601("2024-03-05T03:20:30-05:00"), expected);

	const auto midnight = time_point_cast<system_clock::duration>(sys_days{2024y / March / 5});
	EXPECT_EQ(Util::parse_iso8601("2024-03-05"), midnight);
}

TEST(Utilities, RejectsMalformedTimestamps)
{
	EXPECT_FALSE(Util::parse_iso8601(""));
	EXPECT_FALSE(Util::parse_iso8601("yesterday"));
	EXPECT_FALSE(Util::parse_iso8601("2024-13-40"));
	EXPECT_FALSE(Util::parse_iso8601("2024-03-05T25:00:00Z"));
}

TEST(Utilities, FormattedTimestampParsesBack)
{
	const auto now = time_point_cast<seconds>(system_clock::now());
	EXPECT_EQ(Util::parse_iso8601(Util::format_iso8601(now)),
	          time_point_cast<system_clock::duration>(now));
}

TEST(Utilities, PopUtf8RemovesWholeCodePoints)
{
	std::string s = "a中";
	EXPECT_TRUE(Util::pop_utf8(s));
	EXPECT_EQ(s, "a");
	EXPECT_TRUE(Util::pop_utf8(s));
	EXPECT_EQ(s, "");
	EXPECT_FALSE(Util::pop_utf8(s));
}

TEST(Utilities, TokenizeSplitsOnAnyWhitespace)
{
	const auto words = Util::tokenize("  tolkien\tlord   of\nrings ");
	ASSERT_EQ(words.size(), 4u);
	EXPECT_EQ(words[0], "tolkien");
	EXPECT_EQ(words[3], "rings");
	EXPECT_TRUE(Util::tokenize(" \t ").empty());
}

TEST(Utilities, FoldCaseHandlesNonAscii)
{
	EXPECT_EQ(Util::fold_case("ÄBC Déjà"), "äbc déjà");
	EXPECT_EQ(Util::fold_case("中国"), "中国");
}

TEST(Utilities, DisplayWidthCountsWideCharactersTwice)
{
	EXPECT_EQ(Util::display_width("abc"), 3u);
	EXPECT_EQ(Util::display_width("中国a"), 5u);
	EXPECT_EQ(Util::display_width(""), 0u);
}

TEST(Utilities, TruncateRespectsColumns)
{
	EXPECT_EQ(Util::truncate("short", 10), "short");
	EXPECT_EQ(Util::truncate("abcdefghij", 6), "abc...");
	// A wide character never gets split or overflows the budget
	EXPECT_EQ(Util::truncate("中国历史书", 8), "中国...");
}

TEST(Utilities, JoinSeparatesParts)
{
	EXPECT_EQ(Util::join({"a", "b", "c"}, ", "), "a, b, c");
	EXPECT_EQ(Util::join({}, ", "), "");
}

TEST(Utilities, CanonicalPathDropsTrailingSeparator)
{
	const auto base = std::filesystem::temp_directory_path();
	EXPECT_EQ(Util::canonical_path(base / "lib" / ""), Util::canonical_path(base / "lib"));
	EXPECT_EQ(Util::canonical_path(base / "a" / ".." / "lib"),
	          Util::canonical_path(base / "lib"));
}
