/**
 * @file test_claim_namespace.cpp
 * @brief Rendezvous namespace derivation and its one-epoch tolerance.
 */
#include "relay/claim_namespace.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <cctype>

using namespace mydiarelay::tests;
using namespace mydiarelay::relay;

class ClaimNamespaceTest : public PureApiTest
{
  protected:
    ClaimNamespace ns{"test-secret"};
};

TEST_F(ClaimNamespaceTest, DerivationIsDeterministic)
{
    EXPECT_EQ(ns.derive_namespace("ABCD2345"), ns.derive_namespace("ABCD2345"));
    EXPECT_NE(ns.derive_namespace("ABCD2345"), ns.derive_namespace("ABCD2346"));
}

TEST_F(ClaimNamespaceTest, NamespaceIsPrefixedLowerHex)
{
    const std::string id = ns.derive_namespace("ABCD2345", 480000);
    ASSERT_EQ(id.rfind("mydia-claim:", 0), 0u);
    const std::string token = id.substr(kNamespacePrefix.size());
    EXPECT_EQ(token.size(), 64u);
    EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(ClaimNamespaceTest, EpochChangesTheNamespace)
{
    EXPECT_NE(ns.derive_namespace("ABCD2345", 480000), ns.derive_namespace("ABCD2345", 480001));
}

TEST_F(ClaimNamespaceTest, SecretChangesTheNamespace)
{
    ClaimNamespace other{"other-secret"};
    EXPECT_NE(ns.derive_namespace("ABCD2345", 7), other.derive_namespace("ABCD2345", 7));
}

TEST_F(ClaimNamespaceTest, EmptySecretFallsBackToDefault)
{
    ClaimNamespace empty{""};
    ClaimNamespace deflt;
    EXPECT_EQ(empty.derive_namespace("ABCD2345", 7), deflt.derive_namespace("ABCD2345", 7));
}

TEST_F(ClaimNamespaceTest, CurrentAndPreviousEpochValidate)
{
    const int64_t now = current_epoch();
    EXPECT_TRUE(ns.valid_namespace("ABCD2345", ns.derive_namespace("ABCD2345", now), now));
    EXPECT_TRUE(ns.valid_namespace("ABCD2345", ns.derive_namespace("ABCD2345", now - 1), now));
}

TEST_F(ClaimNamespaceTest, OlderEpochIsRejected)
{
    const int64_t now = current_epoch();
    EXPECT_FALSE(ns.valid_namespace("ABCD2345", ns.derive_namespace("ABCD2345", now - 2), now));
    EXPECT_FALSE(ns.valid_namespace("ABCD2345", ns.derive_namespace("ABCD2345", now + 1), now));
}

TEST_F(ClaimNamespaceTest, MalformedCandidatesAreRejected)
{
    const int64_t now = current_epoch();
    const std::string good = ns.derive_namespace("ABCD2345", now);
    const std::string token = good.substr(kNamespacePrefix.size());

    EXPECT_FALSE(ns.valid_namespace("ABCD2345", "", now));
    EXPECT_FALSE(ns.valid_namespace("ABCD2345", "other-claim:" + token, now));
    EXPECT_FALSE(ns.valid_namespace("ABCD2345", "mydia-claim:garbage", now));
    EXPECT_FALSE(ns.valid_namespace("ABCD2345", "mydia-claim:" + std::string(64, 'z'), now));

    std::string upper = good;
    for (size_t i = kNamespacePrefix.size(); i < upper.size(); ++i)
        upper[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(upper[i])));
    if (upper != good)
        EXPECT_FALSE(ns.valid_namespace("ABCD2345", upper, now));

    EXPECT_FALSE(ns.valid_namespace("ZZZZ9999", good, now));
}

TEST_F(ClaimNamespaceTest, EpochIsHourOfUnixTime)
{
    using namespace std::chrono;
    const system_clock::time_point tp{seconds(3600 * 42 + 1799)};
    EXPECT_EQ(epoch_of(tp), 42);
}
