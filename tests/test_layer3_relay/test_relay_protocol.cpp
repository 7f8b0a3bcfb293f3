/**
 * @file test_relay_protocol.cpp
 * @brief Signal type names, error bodies, version negotiation and instance tokens.
 */
#include "relay/instance_token.hpp"
#include "relay/protocol_version.hpp"
#include "relay/signal_message.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace mydiarelay::tests;
using namespace mydiarelay::relay;
using mydiarelay::utils::ClaimError;
using mydiarelay::utils::TokenError;
using namespace std::chrono_literals;

class SignalMessageTest : public PureApiTest
{
};

TEST_F(SignalMessageTest, WireNamesRoundTrip)
{
    for (auto t : {SignalType::Register, SignalType::ClientConnected, SignalType::ResolveClaim,
                   SignalType::Join, SignalType::PeerLeft, SignalType::WebrtcCandidate,
                   SignalType::Disconnect, SignalType::Error})
    {
        auto parsed = signal_type_from_wire(to_wire(t));
        ASSERT_TRUE(parsed.has_value()) << to_wire(t);
        EXPECT_EQ(*parsed, t);
    }
    EXPECT_STREQ(to_wire(SignalType::WebrtcOffer), "webrtc_offer");
    EXPECT_STREQ(to_wire(SignalType::ClaimResolved), "claim_resolved");
    EXPECT_FALSE(signal_type_from_wire("no_such_type").has_value());
}

TEST_F(SignalMessageTest, OnlyOfferAnswerCandidateAreWebrtc)
{
    EXPECT_TRUE(is_webrtc_signal(SignalType::WebrtcOffer));
    EXPECT_TRUE(is_webrtc_signal(SignalType::WebrtcAnswer));
    EXPECT_TRUE(is_webrtc_signal(SignalType::WebrtcCandidate));
    EXPECT_FALSE(is_webrtc_signal(SignalType::Join));
    EXPECT_FALSE(is_webrtc_signal(SignalType::Request));
}

TEST_F(SignalMessageTest, ErrorBodyEchoesRef)
{
    auto body = make_error_body("invalid_namespace", "bad", "r-7");
    EXPECT_EQ(body.at("code"), "invalid_namespace");
    EXPECT_EQ(body.at("message"), "bad");
    EXPECT_EQ(body.at("ref"), "r-7");
    EXPECT_FALSE(make_error_body("x", "y").contains("ref"));
}

TEST_F(SignalMessageTest, ClaimErrorsRoundTripThroughWire)
{
    for (auto e : {ClaimError::NotFound, ClaimError::Expired, ClaimError::AlreadyConsumed,
                   ClaimError::Locked, ClaimError::Unauthorized})
    {
        auto body = make_claim_error_body(e);
        EXPECT_EQ(body.at("message"), claim_error_message(e));
        auto parsed = claim_error_from_wire(body.at("code").get<std::string>());
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, e);
    }
    EXPECT_FALSE(claim_error_from_wire("tunnel_disconnected").has_value());
}

class ProtocolVersionTest : public PureApiTest
{
};

TEST_F(ProtocolVersionTest, AllLayersSupportOneZero)
{
    const auto &v = supported_versions();
    ASSERT_EQ(v.size(), 4u);
    for (const auto &layer : {"relay_protocol", "encryption_protocol", "pairing_protocol",
                              "api_protocol"})
        EXPECT_EQ(v.at(layer), std::vector<std::string>{"1.0"});
}

TEST_F(ProtocolVersionTest, PicksHighestCompatibleMinor)
{
    EXPECT_EQ(negotiate_layer("api_protocol", {"1.0", "1.3", "2.0"}), "1.3");
    EXPECT_EQ(negotiate_layer("api_protocol", {"2.0"}), std::nullopt);
    EXPECT_EQ(negotiate_layer("unknown_layer", {"1.0"}), std::nullopt);
    EXPECT_EQ(negotiate_layer("api_protocol", {"garbage", "1"}), "1");
}

TEST_F(ProtocolVersionTest, NegotiateReportsIncompatibleLayers)
{
    auto outcome = negotiate(version_map_from_json(
        {{"relay_protocol", {"1.0"}}, {"api_protocol", {"2.0"}}, {"extra", {"9.9"}}}));
    EXPECT_FALSE(outcome.compatible());
    EXPECT_EQ(outcome.negotiated.at("relay_protocol"), "1.0");
    ASSERT_EQ(outcome.incompatible_layers.size(), 1u);
    EXPECT_EQ(outcome.incompatible_layers[0], "api_protocol");

    auto response = update_required_response(outcome.incompatible_layers);
    EXPECT_EQ(response.at("code"), "update_required");
    EXPECT_EQ(response.at("incompatible_layers")[0].at("layer"), "api_protocol");
}

TEST_F(ProtocolVersionTest, MissingLayersAreNotIncompatible)
{
    EXPECT_TRUE(negotiate({}).compatible());
    EXPECT_TRUE(version_map_from_json("not an object").empty());
}

class InstanceTokenTest : public PureApiTest
{
  protected:
    InstanceTokenIssuer issuer{"token-secret"};
};

TEST_F(InstanceTokenTest, GeneratedTokenVerifies)
{
    auto r = issuer.verify(issuer.generate("srv-1"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content(), "srv-1");
}

TEST_F(InstanceTokenTest, ExpiresAfterSevenDays)
{
    const auto issued = std::chrono::system_clock::now();
    const std::string token = issuer.generate("srv-1", issued);
    EXPECT_TRUE(issuer.verify(token, issued + kInstanceTokenLifetime - 1s).is_ok());
    auto late = issuer.verify(token, issued + kInstanceTokenLifetime + 1s);
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error(), TokenError::Expired);
}

TEST_F(InstanceTokenTest, ForeignOrGarbageTokensAreInvalid)
{
    InstanceTokenIssuer other{"other-secret"};
    EXPECT_EQ(issuer.verify(other.generate("srv-1")).error(), TokenError::InvalidToken);
    EXPECT_EQ(issuer.verify("").error(), TokenError::InvalidToken);
    EXPECT_EQ(issuer.verify("!!!not-base64!!!").error(), TokenError::InvalidToken);
    EXPECT_THROW(InstanceTokenIssuer{""}, std::invalid_argument);
}
