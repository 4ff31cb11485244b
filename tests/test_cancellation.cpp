#include "cancellation.hpp"
#include <gtest/gtest.h>
#include <csignal>

namespace {

void (*currentHandler(int sig))(int) {
    struct sigaction current;
    sigaction(sig, nullptr, &current);
    return current.sa_handler;
}

} // namespace

TEST(CancellationToken, startsClearAndLatches)
{
    CancellationToken token;
    EXPECT_FALSE(token.cancelled());
    token.cancel();
    EXPECT_TRUE(token.cancelled());
    token.cancel();
    EXPECT_TRUE(token.cancelled());
}

TEST(CancellationToken, copiesShareState)
{
    CancellationToken token;
    CancellationToken copy = token;
    copy.cancel();
    EXPECT_TRUE(token.cancelled());

    CancellationToken other;
    EXPECT_FALSE(other.cancelled());
}

TEST(CancellationGuard, sigintSetsToken)
{
    CancellationToken token;
    {
        CancellationGuard guard(token);
        std::raise(SIGINT);
        EXPECT_TRUE(token.cancelled());
    }
    EXPECT_TRUE(token.cancelled());
}

TEST(CancellationGuard, sigtermSetsToken)
{
    CancellationToken token;
    CancellationGuard guard(token);
    std::raise(SIGTERM);
    EXPECT_TRUE(token.cancelled());
}

TEST(CancellationGuard, restoresPreviousHandlers)
{
    auto intBefore = currentHandler(SIGINT);
    auto termBefore = currentHandler(SIGTERM);
    {
        CancellationToken token;
        CancellationGuard guard(token);
        EXPECT_NE(currentHandler(SIGINT), intBefore);
        EXPECT_NE(currentHandler(SIGTERM), termBefore);
    }
    EXPECT_EQ(currentHandler(SIGINT), intBefore);
    EXPECT_EQ(currentHandler(SIGTERM), termBefore);
}

TEST(CancellationGuard, innermostGuardReceivesSignal)
{
    CancellationToken outer;
    CancellationToken inner;
    CancellationGuard outerGuard(outer);
    {
        CancellationGuard innerGuard(inner);
        std::raise(SIGINT);
    }
    EXPECT_TRUE(inner.cancelled());
    EXPECT_FALSE(outer.cancelled());

    std::raise(SIGINT);
    EXPECT_TRUE(outer.cancelled());
}
