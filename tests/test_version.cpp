#include <gtest/gtest.h>

#include "version.hpp"

using namespace Toolpack;

TEST(VersionTest, ComparesNumerically)
{
    EXPECT_EQ(compareVersions("1.10.0", "1.9.0"), 1);
    EXPECT_EQ(compareVersions("1.2.0", "1.2.0"), 0);
    EXPECT_EQ(compareVersions("1.2", "1.2.0.0"), 0);
    EXPECT_EQ(compareVersions("1.65.0.0", "1.65.0.1"), -1);
}

TEST(VersionTest, ValidatesVersionShape)
{
    EXPECT_TRUE(isValidVersion("1.2.3"));
    EXPECT_TRUE(isValidVersion("1.65.0.1"));
    EXPECT_TRUE(isValidVersion("0.0.0"));
    EXPECT_FALSE(isValidVersion("1.2"));
    EXPECT_FALSE(isValidVersion("1.2.3.4.5"));
    EXPECT_FALSE(isValidVersion("01.2.3"));
    EXPECT_FALSE(isValidVersion("1.2.x"));
    EXPECT_FALSE(isValidVersion(""));
}

class SelectVersionTest : public ::testing::Test
{
protected:
    std::vector<std::string> available = {"1.64.0.0", "1.65.0.0", "1.65.0.1", "1.2.0", "1.3.0"};
};

TEST_F(SelectVersionTest, LatestPicksTheHighest)
{
    EXPECT_EQ(selectVersion(available, ""), "1.65.0.1");
    EXPECT_EQ(selectVersion(available, "latest"), "1.65.0.1");
}

TEST_F(SelectVersionTest, ExactVersion)
{
    EXPECT_EQ(selectVersion(available, "1.65.0.0"), "1.65.0.0");
    EXPECT_EQ(selectVersion(available, "1.2.0"), "1.2.0");
}

TEST_F(SelectVersionTest, ThreeComponentPrefixPicksNewestBuild)
{
    EXPECT_EQ(selectVersion(available, "1.65.0"), "1.65.0.1");
}

TEST_F(SelectVersionTest, Comparisons)
{
    EXPECT_EQ(selectVersion(available, "<1.65"), "1.64.0.0");
    EXPECT_EQ(selectVersion(available, ">=1.3"), "1.65.0.1");
    EXPECT_EQ(selectVersion(available, "<= 1.3.0"), "1.3.0");
    EXPECT_EQ(selectVersion(available, "==1.2.0"), "1.2.0");
    EXPECT_EQ(selectVersion(available, "!=1.65.0.1"), "1.65.0.0");
}

TEST_F(SelectVersionTest, NoMatchOrMalformed)
{
    EXPECT_FALSE(selectVersion(available, "2.0.0"));
    EXPECT_FALSE(selectVersion(available, ">2"));
    EXPECT_FALSE(selectVersion(available, "1.2"));
    EXPECT_FALSE(selectVersion(available, "banana"));
    EXPECT_FALSE(selectVersion(available, ">=1.x"));
    EXPECT_FALSE(selectVersion({}, "latest"));
}

TEST_F(SelectVersionTest, OversizedComponentsAreRejected)
{
    EXPECT_FALSE(isValidVersion("1.99999999999.0"));
    EXPECT_FALSE(isValidVersion("1.2.0.12345678901234567890"));
    EXPECT_TRUE(isValidVersion("1.999999999.0"));
    EXPECT_FALSE(selectVersion(available, ">=1.99999999999"));
    EXPECT_FALSE(selectVersion(available, "1.2.99999999999"));
}
