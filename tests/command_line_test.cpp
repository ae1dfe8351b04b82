#include "command_line.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(CommandLine, NoArgumentsGivesDefaults)
{
	const auto options = CommandLine::parse({});
	ASSERT_TRUE(options);
	EXPECT_FALSE(options->library);
	EXPECT_TRUE(options->scan.empty());
	EXPECT_FALSE(options->history_file);
	EXPECT_FALSE(options->no_history);
	EXPECT_FALSE(options->help);
}

TEST(CommandLine, PositionalLibrary)
{
	const auto options = CommandLine::parse({"/books/Calibre Library"});
	ASSERT_TRUE(options);
	EXPECT_EQ(options->library, "/books/Calibre Library");
}

TEST(CommandLine, LongAndShortOptions)
{
	const auto options = CommandLine::parse(
	        {"-l", "/lib", "--scan", "/mnt/a", "-s", "/mnt/b", "--scan=/mnt/c", "--history=h.json"});
	ASSERT_TRUE(options);
	EXPECT_EQ(options->library, "/lib");
	ASSERT_EQ(options->scan.size(), 3u);
	EXPECT_EQ(options->scan[0], std::filesystem::path("/mnt/a"));
	EXPECT_EQ(options->scan[2], std::filesystem::path("/mnt/c"));
	EXPECT_EQ(options->history_file, std::filesystem::path("h.json"));
}

TEST(CommandLine, FlagsAreRecognised)
{
	const auto options = CommandLine::parse({"--no-history", "-V", "--help"});
	ASSERT_TRUE(options);
	EXPECT_TRUE(options->no_history);
	EXPECT_TRUE(options->version);
	EXPECT_TRUE(options->help);
}

TEST(CommandLine, DoubleDashEndsOptions)
{
	const auto options = CommandLine::parse({"--", "-odd-name"});
	ASSERT_TRUE(options);
	EXPECT_EQ(options->library, "-odd-name");
}

TEST(CommandLine, UsageErrors)
{
	EXPECT_FALSE(CommandLine::parse({"--bogus"}));
	EXPECT_FALSE(CommandLine::parse({"--scan"}));
	EXPECT_FALSE(CommandLine::parse({"/a", "/b"}));
	EXPECT_FALSE(CommandLine::parse({"-l", "/a", "/b"}));
	EXPECT_FALSE(CommandLine::parse({"--history", "h.json", "--no-history"}));
}

TEST(CommandLine, UsageListsOptions)
{
	std::ostringstream out;
	CommandLine::usage(out, "shelfsearch");
	const auto text = out.str();
	EXPECT_NE(text.find("Usage: shelfsearch"), std::string::npos);
	EXPECT_NE(text.find("--scan"), std::string::npos);
	EXPECT_NE(text.find("--no-history"), std::string::npos);
}
