// tests/test_layer3_relay/workers/relay_workers.cpp
#include "relay_workers.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"

#include "mdr_service.hpp"
#include "relay/claim_namespace.hpp"
#include "relay/claim_store.hpp"
#include "relay/connection_registry.hpp"
#include "relay/instance_token.hpp"
#include "relay/pending_request_ledger.hpp"
#include "relay/relay_client.hpp"
#include "relay/relay_service.hpp"
#include "relay/zmq_context.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace mydiarelay::relay;
using namespace mydiarelay::tests::helper;
using mydiarelay::utils::TunnelError;
using namespace std::chrono_literals;

namespace mydiarelay::tests::worker::relay
{

namespace
{

auto logger_module()
{
    return mydiarelay::utils::Logger::GetLifecycleModule();
}
auto crypto_module()
{
    return mydiarelay::crypto::GetLifecycleModule();
}
auto zmq_module()
{
    return mydiarelay::relay::GetZMQContextModule();
}

/// A RelayService on an ephemeral loopback port, run on its own thread.
class RunningRelay
{
  public:
    explicit RunningRelay(RelayService::Config cfg = {})
    {
        ClaimStoreOptions opts;
        opts.namespace_secret = "relay-worker-secret";
        claims = std::make_shared<ClaimStore>(make_claim_repository("memory", ""), opts);

        cfg.endpoint = "tcp://127.0.0.1:0";
        cfg.claims = claims;
        std::promise<std::string> bound;
        auto bound_future = bound.get_future();
        cfg.on_ready = [&bound](const std::string &ep, const std::string &) {
            bound.set_value(ep);
        };
        service = std::make_unique<RelayService>(std::move(cfg));
        m_thread = std::thread([this] { service->run(); });

        if (bound_future.wait_for(5s) != std::future_status::ready)
            throw std::runtime_error("relay did not bind within 5s");
        endpoint = bound_future.get();
    }

    ~RunningRelay()
    {
        service->stop();
        if (m_thread.joinable())
            m_thread.join();
    }

    RunningRelay(const RunningRelay &) = delete;
    RunningRelay &operator=(const RunningRelay &) = delete;

    nlohmann::json status() const { return nlohmann::json::parse(service->status_json_str()); }

    std::shared_ptr<ClaimStore> claims;
    std::unique_ptr<RelayService> service;
    std::string endpoint;

  private:
    std::thread m_thread;
};

/// Collects the messages a RelayClient receives without a matching ref.
class Inbox
{
  public:
    void attach(RelayClient &client)
    {
        client.on_message([this](const SignalMessage &msg) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_messages.push_back(msg);
            }
            m_cv.notify_all();
        });
    }

    /// Removes and returns the first message of @p type.
    std::optional<SignalMessage> wait_for(SignalType type,
                                          std::chrono::milliseconds timeout = 5s)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        std::optional<SignalMessage> found;
        m_cv.wait_for(lock, timeout, [&] {
            for (auto it = m_messages.begin(); it != m_messages.end(); ++it)
            {
                if (it->type == type)
                {
                    found = std::move(*it);
                    m_messages.erase(it);
                    return true;
                }
            }
            return false;
        });
        return found;
    }

  private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<SignalMessage> m_messages;
};

RelayClient::Options fast_options()
{
    RelayClient::Options opts;
    opts.reply_timeout = 3000ms;
    opts.ping_interval = 0s;
    opts.namespace_secret = "relay-worker-secret";
    return opts;
}

} // namespace

int register_and_status()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient instance(fast_options());
            ASSERT_TRUE(instance.connect(relay.endpoint));

            auto reg = instance.register_instance("srv-1");
            ASSERT_TRUE(reg.is_ok());
            EXPECT_EQ(reg.content().value("instance_id", ""), "srv-1");
            EXPECT_EQ(reg.content().value("relay_protocol", ""), "1.0");
            EXPECT_TRUE(relay.service->registry().online("srv-1"));

            auto status = relay.status();
            ASSERT_EQ(status["instances"].size(), 1u);
            EXPECT_EQ(status["instances"][0], "srv-1");
            EXPECT_EQ(status["pending_requests"], 0);

            ASSERT_TRUE(instance.ping().is_ok());

            instance.disconnect();
            EXPECT_TRUE(wait_until([&] { return !relay.service->registry().online("srv-1"); }));
            EXPECT_EQ(relay.service->registry().count(), 0u);
        },
        "relay.register_and_status", logger_module(), crypto_module(), zmq_module());
}

int pairing_over_claim_code()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient instance(fast_options());
            Inbox instance_inbox;
            instance_inbox.attach(instance);
            ASSERT_TRUE(instance.connect(relay.endpoint));
            ASSERT_TRUE(instance.register_instance("srv-1").is_ok());

            auto created = instance.create_claim("user-42", 300s);
            ASSERT_TRUE(created.is_ok());
            const std::string code = created.content().value("code", "");
            const int64_t claim_id = created.content().value("claim_id", int64_t{0});
            ASSERT_EQ(code.size(), kDefaultCodeLength);

            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));

            // Lower case with a separator still resolves.
            std::string typed = code.substr(0, 4) + "-" + code.substr(4);
            for (auto &c : typed)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            auto resolved = client.resolve_claim(typed);
            ASSERT_TRUE(resolved.is_ok());
            const std::string ns = resolved.content().value("namespace", "");
            EXPECT_EQ(ns.rfind(kNamespacePrefix, 0), 0u);
            EXPECT_EQ(resolved.content().value("instance_id", ""), "srv-1");
            EXPECT_EQ(resolved.content().value("claim_id", int64_t{0}), claim_id);
            EXPECT_FALSE(resolved.content().value("session_id", "").empty());

            auto pushed = instance_inbox.wait_for(SignalType::ClientConnected);
            ASSERT_TRUE(pushed.has_value());
            EXPECT_EQ(pushed->body.value("namespace", ""), ns);
            EXPECT_EQ(pushed->body.value("code", ""), code);
            EXPECT_EQ(pushed->body.value("session_id", ""),
                      resolved.content().value("session_id", ""));

            // Locked while the first client negotiates.
            RelayClient second(fast_options());
            ASSERT_TRUE(second.connect(relay.endpoint));
            auto locked = second.resolve_claim(code);
            ASSERT_TRUE(locked.is_error());
            EXPECT_EQ(locked.error(), TunnelError::ClaimRejected);
            EXPECT_EQ(second.last_error().value("code", ""), "locked");

            auto consumed = instance.consume_claim(claim_id, "device-7");
            ASSERT_TRUE(consumed.is_ok());
            EXPECT_EQ(consumed.content().value("device_id", ""), "device-7");

            auto again = second.resolve_claim(code);
            ASSERT_TRUE(again.is_error());
            EXPECT_EQ(second.last_error().value("code", ""), "already_consumed");
            EXPECT_EQ(second.last_error().value("message", ""), "Code already used");

            auto twice = instance.consume_claim(claim_id, "device-8");
            ASSERT_TRUE(twice.is_error());
            EXPECT_EQ(instance.last_error().value("code", ""), "already_consumed");
        },
        "relay.pairing_over_claim_code", logger_module(), crypto_module(), zmq_module());
}

int resolve_unknown_code()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));

            auto resolved = client.resolve_claim("ZZZZZZZZ");
            ASSERT_TRUE(resolved.is_error());
            EXPECT_EQ(resolved.error(), TunnelError::ClaimRejected);
            EXPECT_EQ(client.last_error().value("code", ""), "not_found");
            EXPECT_EQ(client.last_error().value("message", ""), "Code not found");

            auto empty = client.resolve_claim(" - ");
            ASSERT_TRUE(empty.is_error());
            EXPECT_EQ(client.last_error().value("code", ""), "not_found");
        },
        "relay.resolve_unknown_code", logger_module(), crypto_module(), zmq_module());
}

int resolve_offline_instance()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            auto created = relay.claims->create_claim("srv-offline", "user-1");
            ASSERT_TRUE(created.is_ok());

            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));
            auto resolved = client.resolve_claim(created.content().code);
            ASSERT_TRUE(resolved.is_error());
            EXPECT_EQ(resolved.error(), TunnelError::NotConnected);
            EXPECT_EQ(client.last_error().value("code", ""), "instance_offline");

            // The failed attempt did not take the lock.
            auto listed = relay.claims->list_claims("srv-offline", true, true);
            ASSERT_TRUE(listed.is_ok());
            ASSERT_EQ(listed.content().size(), 1u);
            EXPECT_FALSE(listed.content()[0].locked_at.has_value());
        },
        "relay.resolve_offline_instance", logger_module(), crypto_module(), zmq_module());
}

int relay_request_round_trip()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient instance(fast_options());
            ASSERT_TRUE(instance.connect(relay.endpoint));
            instance.on_message([&instance](const SignalMessage &msg) {
                if (msg.type != SignalType::Request)
                    return;
                nlohmann::json echo = {{"method", msg.body.value("method", "")},
                                       {"path", msg.body.value("path", "")},
                                       {"sent", msg.body.value("body", nlohmann::json())}};
                instance.send_response(msg.body.value("id", ""),
                                       {{"status", 201},
                                        {"headers", {{"content-type", "application/json"}}},
                                        {"body", echo}});
            });
            ASSERT_TRUE(instance.register_instance("srv-1").is_ok());

            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));
            auto resp = client.relay_request("srv-1", "POST", "/api/graphql",
                                             {{"authorization", "Bearer t"}},
                                             {{"query", "{ me { id } }"}}, 5s);
            ASSERT_TRUE(resp.is_ok());
            EXPECT_EQ(resp.content().value("status", 0), 201);
            EXPECT_EQ(resp.content()["headers"].value("content-type", ""), "application/json");
            EXPECT_EQ(resp.content()["body"].value("method", ""), "POST");
            EXPECT_EQ(resp.content()["body"].value("path", ""), "/api/graphql");
            EXPECT_EQ(resp.content()["body"]["sent"].value("query", ""), "{ me { id } }");

            EXPECT_TRUE(wait_until([&] { return relay.service->ledger().count() == 0; }));

            auto offline = client.relay_request("srv-2", "GET", "/health");
            ASSERT_TRUE(offline.is_ok());
            EXPECT_EQ(offline.content().value("status", 0), 502);
        },
        "relay.relay_request_round_trip", logger_module(), crypto_module(), zmq_module());
}

int relay_request_fails_on_instance_disconnect()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient instance(fast_options());
            ASSERT_TRUE(instance.connect(relay.endpoint));
            std::promise<void> got_request;
            auto got_request_future = got_request.get_future();
            std::once_flag once;
            instance.on_message([&](const SignalMessage &msg) {
                if (msg.type == SignalType::Request)
                    std::call_once(once, [&] { got_request.set_value(); });
            });
            ASSERT_TRUE(instance.register_instance("srv-1").is_ok());

            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));
            auto pending = std::async(std::launch::async, [&] {
                return client.relay_request("srv-1", "GET", "/api/slow", {}, nullptr, 10s);
            });

            ASSERT_EQ(got_request_future.wait_for(5s), std::future_status::ready);
            EXPECT_EQ(relay.service->ledger().count_for_instance("srv-1"), 1u);

            instance.disconnect();

            ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
            auto resp = pending.get();
            ASSERT_TRUE(resp.is_ok());
            EXPECT_EQ(resp.content().value("status", 0), 502);
            EXPECT_EQ(resp.content().value("error", ""), "tunnel_disconnected");
            EXPECT_EQ(relay.service->ledger().count(), 0u);
            EXPECT_FALSE(relay.service->registry().online("srv-1"));
        },
        "relay.relay_request_fails_on_instance_disconnect", logger_module(), crypto_module(),
        zmq_module());
}

int relay_request_times_out()
{
    return run_gtest_worker(
        []()
        {
            RelayService::Config cfg;
            cfg.request_timeout = 300ms;
            RunningRelay relay(std::move(cfg));

            RelayClient instance(fast_options());
            ASSERT_TRUE(instance.connect(relay.endpoint));
            ASSERT_TRUE(instance.register_instance("srv-1").is_ok());

            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));
            auto resp = client.relay_request("srv-1", "GET", "/api/never", {}, nullptr, 5s);
            ASSERT_TRUE(resp.is_ok());
            EXPECT_EQ(resp.content().value("status", 0), 504);
            EXPECT_EQ(resp.content().value("error", ""), "Timeout");
            EXPECT_EQ(relay.service->ledger().count(), 0u);

            // The instance is still registered after a timeout.
            EXPECT_TRUE(relay.service->registry().online("srv-1"));
        },
        "relay.relay_request_times_out", logger_module(), crypto_module(), zmq_module());
}

int relay_request_capped()
{
    return run_gtest_worker(
        []()
        {
            RelayService::Config cfg;
            cfg.max_relay_requests = 3;
            cfg.max_relay_requests_per_session = 2;
            RunningRelay relay(std::move(cfg));

            // Holds /api/hold until the test answers it; answers anything else at once.
            RelayClient instance(fast_options());
            ASSERT_TRUE(instance.connect(relay.endpoint));
            std::mutex held_mutex;
            std::vector<std::string> held;
            instance.on_message([&](const SignalMessage &msg) {
                if (msg.type != SignalType::Request)
                    return;
                const std::string id = msg.body.value("id", "");
                if (msg.body.value("path", "") == "/api/hold")
                {
                    std::lock_guard<std::mutex> lock(held_mutex);
                    held.push_back(id);
                    return;
                }
                instance.send_response(id, {{"status", 200}, {"body", "ok"}});
            });
            ASSERT_TRUE(instance.register_instance("srv-1").is_ok());

            RelayClient first(fast_options());
            RelayClient second(fast_options());
            ASSERT_TRUE(first.connect(relay.endpoint));
            ASSERT_TRUE(second.connect(relay.endpoint));
            auto hold = [](RelayClient &client) {
                return std::async(std::launch::async, [&client] {
                    return client.relay_request("srv-1", "GET", "/api/hold", {}, nullptr, 10s);
                });
            };
            auto count = [&relay] { return relay.service->ledger().count_for_instance("srv-1"); };

            auto a1 = hold(first);
            auto a2 = hold(first);
            ASSERT_TRUE(wait_until([&] { return count() == 2; }));

            auto over_session = first.relay_request("srv-1", "GET", "/api/ok", {}, nullptr, 5s);
            ASSERT_TRUE(over_session.is_ok());
            EXPECT_EQ(over_session.content().value("status", 0), 503);
            EXPECT_EQ(over_session.content().value("error", ""), "Too many requests");

            // Another session still has room until the relay-wide cap.
            auto b1 = hold(second);
            ASSERT_TRUE(wait_until([&] { return count() == 3; }));
            auto over_total = second.relay_request("srv-1", "GET", "/api/ok", {}, nullptr, 5s);
            ASSERT_TRUE(over_total.is_ok());
            EXPECT_EQ(over_total.content().value("status", 0), 503);

            std::vector<std::string> ids;
            {
                std::lock_guard<std::mutex> lock(held_mutex);
                ids = held;
            }
            ASSERT_EQ(ids.size(), 3u);
            for (const auto &id : ids)
                instance.send_response(id, {{"status", 204}});
            for (auto *pending : {&a1, &a2, &b1})
            {
                auto resp = pending->get();
                ASSERT_TRUE(resp.is_ok());
                EXPECT_EQ(resp.content().value("status", 0), 204);
            }

            auto after = first.relay_request("srv-1", "GET", "/api/ok", {}, nullptr, 5s);
            ASSERT_TRUE(after.is_ok());
            EXPECT_EQ(after.content().value("status", 0), 200);
            EXPECT_EQ(after.content().value("body", ""), "ok");
        },
        "relay.relay_request_capped", logger_module(), crypto_module(), zmq_module());
}

int join_rejects_foreign_namespace()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            // A different secret makes the previous-epoch retry derive a namespace the
            // relay rejects as well.
            RelayClient::Options outsider_opts = fast_options();
            outsider_opts.namespace_secret = "some-other-secret";
            RelayClient outsider(outsider_opts);
            ASSERT_TRUE(outsider.connect(relay.endpoint));

            const auto &namespaces = relay.claims->namespaces();
            const std::string other = namespaces.derive_namespace("BBBBCCCC");

            auto foreign = outsider.join(other, "AAAADDDD");
            ASSERT_TRUE(foreign.is_error());
            EXPECT_EQ(foreign.error(), TunnelError::InvalidNamespace);
            EXPECT_EQ(outsider.last_error().value("code", ""), "invalid_namespace");

            auto garbage = outsider.join("mydia-claim:not-hex", "AAAADDDD");
            ASSERT_TRUE(garbage.is_error());
            EXPECT_EQ(garbage.error(), TunnelError::InvalidNamespace);

            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));

            auto missing = client.join("", "AAAADDDD");
            ASSERT_TRUE(missing.is_error());
            EXPECT_EQ(missing.error(), TunnelError::ProtocolError);

            // The previous epoch's namespace is still accepted.
            const int64_t epoch = current_epoch();
            auto previous = client.join(namespaces.derive_namespace("AAAADDDD", epoch - 1),
                                        "aaaa-dddd");
            ASSERT_TRUE(previous.is_ok());
            EXPECT_EQ(previous.content().value("peers", -1), 0);

            auto stale = client.join(namespaces.derive_namespace("AAAADDDD", epoch - 2),
                                     "AAAADDDD");
            ASSERT_TRUE(stale.is_ok());
            EXPECT_EQ(stale.content().value("namespace", ""),
                      namespaces.derive_namespace("AAAADDDD", epoch - 1));
        },
        "relay.join_rejects_foreign_namespace", logger_module(), crypto_module(), zmq_module());
}

int signaling_forwarded_between_peers()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient instance(fast_options());
            Inbox instance_inbox;
            instance_inbox.attach(instance);
            ASSERT_TRUE(instance.connect(relay.endpoint));
            ASSERT_TRUE(instance.register_instance("srv-1").is_ok());
            auto created = instance.create_claim("user-1");
            ASSERT_TRUE(created.is_ok());
            const std::string code = created.content().value("code", "");

            RelayClient client(fast_options());
            Inbox client_inbox;
            client_inbox.attach(client);
            ASSERT_TRUE(client.connect(relay.endpoint));
            auto resolved = client.resolve_claim(code);
            ASSERT_TRUE(resolved.is_ok());
            const std::string ns = resolved.content().value("namespace", "");

            // The client speaks first; the relay holds the offer until the instance joins.
            ASSERT_TRUE(client.join(ns, code).is_ok());
            client.send_signal(SignalType::WebrtcOffer, ns, {{"sdp", "v=0 offer"}, {"type", "offer"}});
            ASSERT_TRUE(client.ping().is_ok());

            auto connected = instance_inbox.wait_for(SignalType::ClientConnected);
            ASSERT_TRUE(connected.has_value());
            auto joined = instance.join(connected->body.value("namespace", ""),
                                        connected->body.value("code", ""));
            ASSERT_TRUE(joined.is_ok());
            EXPECT_EQ(joined.content().value("peers", 0), 1);

            auto offer = instance_inbox.wait_for(SignalType::WebrtcOffer);
            ASSERT_TRUE(offer.has_value());
            EXPECT_EQ(offer->body.value("sdp", ""), "v=0 offer");
            EXPECT_EQ(offer->body.value("namespace", ""), ns);
            EXPECT_EQ(offer->body.value("from", ""), resolved.content().value("session_id", ""));

            auto peer_joined = client_inbox.wait_for(SignalType::PeerJoined);
            ASSERT_TRUE(peer_joined.has_value());
            EXPECT_EQ(peer_joined->body.value("role", ""), "instance");

            instance.send_signal(SignalType::WebrtcAnswer, ns, {{"sdp", "v=0 answer"}, {"type", "answer"}});
            instance.send_signal(SignalType::WebrtcCandidate, ns,
                                 {{"candidate", "candidate:1 1 udp 1 127.0.0.1 9 typ host"},
                                  {"sdpMid", "0"},
                                  {"sdpMLineIndex", 0}});
            auto answer = client_inbox.wait_for(SignalType::WebrtcAnswer);
            ASSERT_TRUE(answer.has_value());
            EXPECT_EQ(answer->body.value("sdp", ""), "v=0 answer");
            auto candidate = client_inbox.wait_for(SignalType::WebrtcCandidate);
            ASSERT_TRUE(candidate.has_value());
            EXPECT_EQ(candidate->body.value("sdpMid", ""), "0");

            client.leave(ns);
            auto left = instance_inbox.wait_for(SignalType::PeerLeft);
            ASSERT_TRUE(left.has_value());
            EXPECT_EQ(left->body.value("namespace", ""), ns);
        },
        "relay.signaling_forwarded_between_peers", logger_module(), crypto_module(),
        zmq_module());
}

int connect_by_instance_id()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient instance(fast_options());
            Inbox instance_inbox;
            instance_inbox.attach(instance);
            ASSERT_TRUE(instance.connect(relay.endpoint));
            ASSERT_TRUE(instance.register_instance("srv-1").is_ok());
            instance.update_urls({"https://home.example:4443"});
            ASSERT_TRUE(instance.ping().is_ok());

            RelayClient client(fast_options());
            ASSERT_TRUE(client.connect(relay.endpoint));
            auto connected = client.connect_instance("srv-1");
            ASSERT_TRUE(connected.is_ok());
            const auto &body = connected.content();
            EXPECT_EQ(body.value("instance_id", ""), "srv-1");
            ASSERT_EQ(body["direct_urls"].size(), 1u);
            EXPECT_EQ(body["direct_urls"][0], "https://home.example:4443");
            const std::string ns = body.value("namespace", "");
            const std::string code = body.value("code", "");
            EXPECT_TRUE(relay.claims->namespaces().valid_namespace(code, ns));

            auto pushed = instance_inbox.wait_for(SignalType::ClientConnected);
            ASSERT_TRUE(pushed.has_value());
            EXPECT_EQ(pushed->body.value("namespace", ""), ns);

            auto unknown = client.connect_instance("srv-404");
            ASSERT_TRUE(unknown.is_error());
            EXPECT_EQ(unknown.error(), TunnelError::NotConnected);
            EXPECT_EQ(client.last_error().value("code", ""), "instance_not_found");
        },
        "relay.connect_by_instance_id", logger_module(), crypto_module(), zmq_module());
}

int reregister_replaces_entry()
{
    return run_gtest_worker(
        []()
        {
            RunningRelay relay;
            RelayClient first(fast_options());
            ASSERT_TRUE(first.connect(relay.endpoint));
            ASSERT_TRUE(first.register_instance("srv-1").is_ok());

            RelayClient second(fast_options());
            ASSERT_TRUE(second.connect(relay.endpoint));
            ASSERT_TRUE(second.register_instance("srv-1").is_ok());
            EXPECT_EQ(relay.service->registry().count(), 1u);

            // The stale connection no longer owns the registration.
            auto claim = first.create_claim("user-1");
            ASSERT_TRUE(claim.is_error());
            EXPECT_EQ(claim.error(), TunnelError::Unauthorized);

            first.disconnect();
            EXPECT_TRUE(wait_until([&] { return relay.status().value("sessions", 0) == 1; }));
            EXPECT_TRUE(relay.service->registry().online("srv-1"));
            EXPECT_TRUE(second.create_claim("user-1").is_ok());
        },
        "relay.reregister_replaces_entry", logger_module(), crypto_module(), zmq_module());
}

int instance_token_required()
{
    return run_gtest_worker(
        []()
        {
            RelayService::Config cfg;
            cfg.token_secret = "relay-token-secret";
            RunningRelay relay(std::move(cfg));
            InstanceTokenIssuer issuer("relay-token-secret");

            RelayClient instance(fast_options());
            ASSERT_TRUE(instance.connect(relay.endpoint));

            auto bare = instance.register_instance("srv-1");
            ASSERT_TRUE(bare.is_error());
            EXPECT_EQ(bare.error(), TunnelError::Unauthorized);

            auto wrong = instance.register_instance("srv-1", {{"token", issuer.generate("srv-2")}});
            ASSERT_TRUE(wrong.is_error());
            EXPECT_EQ(wrong.error(), TunnelError::Unauthorized);
            EXPECT_FALSE(relay.service->registry().online("srv-1"));

            auto good = instance.register_instance("srv-1", {{"token", issuer.generate("srv-1")}});
            ASSERT_TRUE(good.is_ok());
            EXPECT_TRUE(relay.service->registry().online("srv-1"));
        },
        "relay.instance_token_required", logger_module(), crypto_module(), zmq_module());
}

} // namespace mydiarelay::tests::worker::relay

namespace
{
struct RelayWorkerRegistrar
{
    RelayWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "relay")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace mydiarelay::tests::worker::relay;
                if (scenario == "register_and_status")
                    return register_and_status();
                if (scenario == "pairing_over_claim_code")
                    return pairing_over_claim_code();
                if (scenario == "resolve_unknown_code")
                    return resolve_unknown_code();
                if (scenario == "resolve_offline_instance")
                    return resolve_offline_instance();
                if (scenario == "relay_request_round_trip")
                    return relay_request_round_trip();
                if (scenario == "relay_request_fails_on_instance_disconnect")
                    return relay_request_fails_on_instance_disconnect();
                if (scenario == "relay_request_times_out")
                    return relay_request_times_out();
                if (scenario == "relay_request_capped")
                    return relay_request_capped();
                if (scenario == "join_rejects_foreign_namespace")
                    return join_rejects_foreign_namespace();
                if (scenario == "signaling_forwarded_between_peers")
                    return signaling_forwarded_between_peers();
                if (scenario == "connect_by_instance_id")
                    return connect_by_instance_id();
                if (scenario == "reregister_replaces_entry")
                    return reregister_replaces_entry();
                if (scenario == "instance_token_required")
                    return instance_token_required();
                fmt::print(stderr, "ERROR: Unknown relay scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static RelayWorkerRegistrar g_relay_registrar;
} // namespace
