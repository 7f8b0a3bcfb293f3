// tests/test_layer3_relay/workers/relay_workers.h
#pragma once
/**
 * @file relay_workers.h
 * @brief Worker functions for the relay end-to-end tests. Each one starts a RelayService
 *        on a loopback port and drives it with RelayClient connections.
 */

namespace mydiarelay::tests::worker::relay
{

int register_and_status();
int pairing_over_claim_code();
int resolve_unknown_code();
int resolve_offline_instance();
int relay_request_round_trip();
int relay_request_fails_on_instance_disconnect();
int relay_request_times_out();
int relay_request_capped();
int join_rejects_foreign_namespace();
int signaling_forwarded_between_peers();
int connect_by_instance_id();
int reregister_replaces_entry();
int instance_token_required();

} // namespace mydiarelay::tests::worker::relay
