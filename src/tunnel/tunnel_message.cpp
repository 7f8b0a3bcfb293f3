#include "mdr_service.hpp"
#include "tunnel/tunnel_message.hpp"

#include <array>
#include <limits>
#include <utility>

namespace mydiarelay::tunnel
{

namespace
{
constexpr std::array<std::pair<TunnelMessageType, std::string_view>, 12> kWireNames{{
    {TunnelMessageType::Request, "request"},
    {TunnelMessageType::Response, "response"},
    {TunnelMessageType::Auth, "auth"},
    {TunnelMessageType::AuthResponse, "auth_response"},
    {TunnelMessageType::ClaimCode, "claim_code"},
    {TunnelMessageType::PairingComplete, "pairing_complete"},
    {TunnelMessageType::Ping, "ping"},
    {TunnelMessageType::Pong, "pong"},
    {TunnelMessageType::StreamRequest, "stream_request"},
    {TunnelMessageType::ResponseHeader, "response_header"},
    {TunnelMessageType::End, "end"},
    {TunnelMessageType::Error, "error"},
}};
} // namespace

std::string string_field(const nlohmann::json &body, const char *key, std::string_view fallback)
{
    if (!body.is_object())
        return std::string(fallback);
    auto it = body.find(key);
    if (it == body.end() || !it->is_string())
        return std::string(fallback);
    return it->get<std::string>();
}

int int_field(const nlohmann::json &body, const char *key, int fallback)
{
    if (!body.is_object())
        return fallback;
    auto it = body.find(key);
    if (it == body.end() || !it->is_number_integer())
        return fallback;
    if (it->is_number_unsigned())
        return it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                   ? fallback
                   : static_cast<int>(it->get<uint64_t>());
    const auto v = it->get<int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return fallback;
    return static_cast<int>(v);
}

bool bool_field(const nlohmann::json &body, const char *key, bool fallback)
{
    if (!body.is_object())
        return fallback;
    auto it = body.find(key);
    return it != body.end() && it->is_boolean() ? it->get<bool>() : fallback;
}

nlohmann::json object_field(const nlohmann::json &body, const char *key)
{
    if (body.is_object())
        if (auto it = body.find(key); it != body.end() && it->is_object())
            return *it;
    return nlohmann::json::object();
}

std::string id_field(const nlohmann::json &body, const char *key)
{
    if (!body.is_object())
        return {};
    auto it = body.find(key);
    if (it == body.end())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number_integer())
        return it->dump();
    return {};
}

bool string_or_absent(const nlohmann::json &body, const char *key)
{
    auto it = body.find(key);
    return it == body.end() || it->is_null() || it->is_string();
}

const char *to_wire(TunnelMessageType type) noexcept
{
    for (const auto &[t, name] : kWireNames)
        if (t == type)
            return name.data();
    return "error";
}

std::optional<TunnelMessageType> tunnel_type_from_wire(std::string_view name)
{
    for (const auto &[t, wire] : kWireNames)
        if (wire == name)
            return t;
    return std::nullopt;
}

std::string encode_message(const TunnelMessage &msg)
{
    nlohmann::json out = msg.body.is_object() ? msg.body : nlohmann::json::object();
    out["type"] = to_wire(msg.type);
    return out.dump();
}

utils::Result<TunnelMessage, utils::TunnelError> decode_message(std::string_view text)
{
    using R = utils::Result<TunnelMessage, utils::TunnelError>;
    nlohmann::json body = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded() || !body.is_object())
        return R::error(utils::TunnelError::ProtocolError);

    auto it = body.find("type");
    if (it == body.end() || !it->is_string())
        return R::error(utils::TunnelError::ProtocolError);
    const auto type = tunnel_type_from_wire(it->get<std::string>());
    if (!type)
        return R::error(utils::TunnelError::ProtocolError);

    body.erase(it);
    return R::ok(TunnelMessage{*type, std::move(body)});
}

TunnelMessage make_request(const ApiRequest &req)
{
    return {TunnelMessageType::Request,
            {{"id", req.id},
             {"method", req.method},
             {"path", req.path},
             {"headers", req.headers},
             {"body", req.body}}};
}

TunnelMessage make_response(const ApiResponse &resp)
{
    return {TunnelMessageType::Response,
            {{"id", resp.id},
             {"status", resp.status},
             {"headers", resp.headers},
             {"body", resp.body}}};
}

ApiRequest request_from_body(const nlohmann::json &body)
{
    ApiRequest req;
    req.id = id_field(body, "id");
    req.method = string_field(body, "method", "GET");
    req.path = string_field(body, "path", "/");
    if (auto it = body.find("headers"); it != body.end() && it->is_object())
        req.headers = *it;
    if (auto it = body.find("body"); it != body.end())
        req.body = *it;
    return req;
}

bool well_formed_request(const nlohmann::json &body)
{
    if (!body.is_object() || !string_or_absent(body, "method") || !string_or_absent(body, "path"))
        return false;
    auto it = body.find("headers");
    return it == body.end() || it->is_null() || it->is_object();
}

ApiResponse response_from_body(const nlohmann::json &body)
{
    ApiResponse resp;
    resp.id = id_field(body, "id");
    resp.status = int_field(body, "status", 0);
    if (auto it = body.find("headers"); it != body.end() && it->is_object())
        resp.headers = *it;
    if (auto it = body.find("body"); it != body.end())
        resp.body = *it;
    return resp;
}

TunnelMessage make_pairing_success(const PairingGrant &grant)
{
    return {TunnelMessageType::PairingComplete,
            {{"success", true},
             {"device_id", grant.device_id},
             {"media_token", grant.media_token},
             {"access_token", grant.access_token},
             {"device_token", grant.device_token}}};
}

TunnelMessage make_pairing_failure(std::string_view reason)
{
    return {TunnelMessageType::PairingComplete,
            {{"success", false}, {"error", fmt::format("Pairing failed: {}", reason)}}};
}

TunnelMessage make_stream_request(const StreamRequest &req)
{
    nlohmann::json body = {{"request_id", req.request_id},
                           {"file_id", req.file_id},
                           {"range_start", req.range_start},
                           {"range_end", nullptr}};
    if (req.range_end)
        body["range_end"] = *req.range_end;
    return {TunnelMessageType::StreamRequest, std::move(body)};
}

StreamRequest stream_request_from_body(const nlohmann::json &body)
{
    StreamRequest req;
    req.request_id = id_field(body, "request_id");
    req.file_id = id_field(body, "file_id");
    if (auto it = body.find("range_start"); it != body.end() && it->is_number_unsigned())
        req.range_start = it->get<uint64_t>();
    if (auto it = body.find("range_end"); it != body.end() && it->is_number_unsigned())
        req.range_end = it->get<uint64_t>();
    return req;
}

TunnelMessage make_stream_error(const std::string &request_id, int status,
                                std::string_view message)
{
    return {TunnelMessageType::Error,
            {{"request_id", request_id}, {"status", status}, {"message", message}}};
}

} // namespace mydiarelay::tunnel
