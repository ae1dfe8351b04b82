#include "launcher.h"
#include "test_support.h"

#include <gtest/gtest.h>

TEST(Launcher, MissingFileIsReportedWithoutSpawning)
{
	TempDir dir;
	const auto error = Launcher::open(dir / "nowhere.epub");
	ASSERT_TRUE(error);
	EXPECT_NE(error->find("nowhere.epub"), std::string::npos);
}
