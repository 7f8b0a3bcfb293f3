/**
 * @file test_crypto_utils.cpp
 * @brief Layer 2 isolated-process tests for crypto_utils.
 *
 * Each TEST_F spawns an independent subprocess that starts the Logger and CryptoUtils
 * modules, runs the test logic, and exits.
 *
 * Tests cover:
 * - HMAC-SHA256 against RFC 4231 vectors (the namespace derivation primitive)
 * - Random generation (uniqueness, bounds, thread safety)
 * - Hex and base64 encodings
 */
#include "test_patterns.h"
#include "crypto_workers.h"
#include <gtest/gtest.h>

using namespace mydiarelay::tests;

class CryptoUtilsTest : public IsolatedProcessTest
{
};

// ============================================================================
// HMAC-SHA256
// ============================================================================

TEST_F(CryptoUtilsTest, HMAC_MatchesRfc4231)
{
    auto w = SpawnWorker("crypto.hmac_rfc4231_vectors");
    ExpectWorkerOk(w);
}

TEST_F(CryptoUtilsTest, HMAC_KeyAndMessageChangeDigest)
{
    auto w = SpawnWorker("crypto.hmac_key_changes_digest");
    ExpectWorkerOk(w);
}

TEST_F(CryptoUtilsTest, HMAC_LongKeyAccepted)
{
    auto w = SpawnWorker("crypto.hmac_long_key_accepted");
    ExpectWorkerOk(w);
}

TEST_F(CryptoUtilsTest, ConstantTimeEqual)
{
    auto w = SpawnWorker("crypto.constant_time_equal");
    ExpectWorkerOk(w);
}

// ============================================================================
// Random Generation
// ============================================================================

TEST_F(CryptoUtilsTest, Random_IsUnique)
{
    auto w = SpawnWorker("crypto.random_unique");
    ExpectWorkerOk(w);
}

TEST_F(CryptoUtilsTest, Random_UniformWithinBounds)
{
    auto w = SpawnWorker("crypto.random_uniform");
    ExpectWorkerOk(w);
}

TEST_F(CryptoUtilsTest, Random_IsThreadSafe)
{
    auto w = SpawnWorker("crypto.random_thread_safe");
    ExpectWorkerOk(w);
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(CryptoUtilsTest, Hex_RoundTripAndValidation)
{
    auto w = SpawnWorker("crypto.hex_round_trip");
    ExpectWorkerOk(w);
}

TEST_F(CryptoUtilsTest, Base64_Variants)
{
    auto w = SpawnWorker("crypto.base64_variants");
    ExpectWorkerOk(w);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(CryptoUtilsTest, Lifecycle_FunctionsWorkAfterInit)
{
    auto w = SpawnWorker("crypto.lifecycle_after_init");
    ExpectWorkerOk(w);
}
