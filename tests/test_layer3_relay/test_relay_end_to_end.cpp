/**
 * @file test_relay_end_to_end.cpp
 * @brief Isolated-process tests that run the relay on a loopback port and drive it with
 *        RelayClient connections.
 *
 * Every worker starts Logger, CryptoUtils and the ZMQ context, binds the relay to an
 * ephemeral port and tears everything down before exiting.
 */
#include "relay_workers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace mydiarelay::tests;

class RelayEndToEndTest : public IsolatedProcessTest
{
};

TEST_F(RelayEndToEndTest, RegisterAndStatus)
{
    auto w = SpawnWorker("relay.register_and_status");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, PairingOverClaimCode)
{
    auto w = SpawnWorker("relay.pairing_over_claim_code");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, ResolveUnknownCode)
{
    auto w = SpawnWorker("relay.resolve_unknown_code");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, ResolveOfflineInstanceKeepsClaimUnlocked)
{
    auto w = SpawnWorker("relay.resolve_offline_instance");
    ExpectWorkerOk(w);
}

// ============================================================================
// Request fallback path
// ============================================================================

TEST_F(RelayEndToEndTest, RelayRequestRoundTrip)
{
    auto w = SpawnWorker("relay.relay_request_round_trip");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, InstanceDisconnectFailsPendingRequests)
{
    auto w = SpawnWorker("relay.relay_request_fails_on_instance_disconnect");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, RelayRequestTimesOut)
{
    auto w = SpawnWorker("relay.relay_request_times_out");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, RelayRequestsCapped)
{
    auto w = SpawnWorker("relay.relay_request_capped");
    ExpectWorkerOk(w);
}

// ============================================================================
// Rendezvous
// ============================================================================

TEST_F(RelayEndToEndTest, JoinRejectsForeignNamespace)
{
    auto w = SpawnWorker("relay.join_rejects_foreign_namespace");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, SignalingForwardedBetweenPeers)
{
    auto w = SpawnWorker("relay.signaling_forwarded_between_peers");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, ConnectByInstanceId)
{
    auto w = SpawnWorker("relay.connect_by_instance_id");
    ExpectWorkerOk(w);
}

// ============================================================================
// Registration
// ============================================================================

TEST_F(RelayEndToEndTest, ReregisterReplacesEntry)
{
    auto w = SpawnWorker("relay.reregister_replaces_entry");
    ExpectWorkerOk(w);
}

TEST_F(RelayEndToEndTest, InstanceTokenRequired)
{
    auto w = SpawnWorker("relay.instance_token_required");
    ExpectWorkerOk(w);
}
