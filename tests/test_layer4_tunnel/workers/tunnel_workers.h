// tests/test_layer4_tunnel/workers/tunnel_workers.h
#pragma once
/**
 * @file tunnel_workers.h
 * @brief Worker functions for the tunnel end-to-end tests: a TunnelHost and a TunnelClient
 *        meeting through a loopback relay, with the loopback peer transport in between.
 */

namespace mydiarelay::tests::worker::tunnel
{

int pair_over_claim_code();
int connect_by_instance_id();
int claim_code_reuse_rejected();
int claim_pairing_only_once();
int relay_fallback_request();
int negotiation_timeout();
int host_stop_disconnects_client();

} // namespace mydiarelay::tests::worker::tunnel
