#include "secret.hpp"
#include <gtest/gtest.h>
#include <string>
#include <utility>

TEST(Secret, takesOwnershipAndWipesSource)
{
    std::string input = "hunter2";
    Secret secret(std::move(input));
    EXPECT_STREQ(secret.reveal(), "hunter2");
    EXPECT_TRUE(input.empty());
}

TEST(Secret, moveLeavesSourceEmpty)
{
    Secret first(std::string("correct horse"));
    Secret second(std::move(first));
    EXPECT_TRUE(first.empty());
    EXPECT_STREQ(second.reveal(), "correct horse");

    Secret third;
    third = std::move(second);
    EXPECT_TRUE(second.empty());
    EXPECT_STREQ(third.reveal(), "correct horse");
}

TEST(Secret, matchesComparesContent)
{
    Secret a(std::string("abc"));
    Secret b(std::string("abc"));
    Secret c(std::string("abd"));
    Secret d(std::string("ab"));
    EXPECT_TRUE(a.matches(b));
    EXPECT_FALSE(a.matches(c));
    EXPECT_FALSE(a.matches(d));
    EXPECT_TRUE(Secret().matches(Secret()));
}

TEST(Secret, clearEmptiesTheSecret)
{
    Secret secret(std::string("pw"));
    secret.clear();
    EXPECT_TRUE(secret.empty());
    EXPECT_STREQ(secret.reveal(), "");
}

TEST(Secret, secureWipeZeroesBuffer)
{
    char buffer[] = {'a', 'b', 'c', 'd'};
    secureWipe(buffer, sizeof(buffer));
    for (char c : buffer) {
        EXPECT_EQ(c, '\0');
    }
}
