#include "display_manager.h"

#include <gtest/gtest.h>

TEST(DisplayManager, FollowKeepsCursorVisible)
{
	size_t scroll = 0;

	DisplayManager::follow(scroll, 9, 20, 5);
	EXPECT_EQ(scroll, 5u);

	DisplayManager::follow(scroll, 7, 20, 5);
	EXPECT_EQ(scroll, 5u);

	DisplayManager::follow(scroll, 2, 20, 5);
	EXPECT_EQ(scroll, 2u);
}

TEST(DisplayManager, FollowNeverScrollsPastTheEnd)
{
	size_t scroll = 15;
	DisplayManager::follow(scroll, std::nullopt, 8, 5);
	EXPECT_EQ(scroll, 3u);

	DisplayManager::follow(scroll, 0, 3, 5);
	EXPECT_EQ(scroll, 0u);
}

TEST(DisplayManager, FollowResetsOnEmptyList)
{
	size_t scroll = 4;
	DisplayManager::follow(scroll, std::nullopt, 0, 5);
	EXPECT_EQ(scroll, 0u);
}
