#pragma once
/**
 * @file claim.hpp
 * @brief Claim entity, code generation and the timestamp predicates shared by every
 *        storage backend.
 */
#include "mydiarelay_utils_export.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mydiarelay::relay
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Code symbols. `0`, `O`, `1` and `I` are excluded.
inline constexpr std::string_view kClaimAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
inline constexpr size_t kDefaultCodeLength = 8;

/// A single-use pairing invitation owned by one instance.
struct Claim
{
    int64_t id{0};
    std::string code;
    std::string instance_id;
    std::string requester_ref;
    TimePoint expires_at{};
    std::optional<TimePoint> locked_at;
    std::optional<TimePoint> lock_expires_at;
    std::optional<TimePoint> consumed_at;
    std::optional<std::string> device_id;
    TimePoint inserted_at{};
};

/**
 * @brief Draws @p length symbols uniformly from kClaimAlphabet with `randombytes_uniform`.
 * @throws std::invalid_argument if @p length is 0.
 */
MYDIARELAY_UTILS_EXPORT std::string generate_code(size_t length = kDefaultCodeLength);

/// @brief Uppercases and removes spaces and dashes ("abcd-efgh" -> "ABCDEFGH").
MYDIARELAY_UTILS_EXPORT std::string normalize_code(std::string_view code);

// The predicates below mirror the WHERE clauses of the storage backends.

MYDIARELAY_UTILS_EXPORT bool is_consumed(const Claim &claim) noexcept;
MYDIARELAY_UTILS_EXPORT bool is_expired(const Claim &claim, TimePoint now) noexcept;
/// Not consumed and not expired.
MYDIARELAY_UTILS_EXPORT bool is_valid(const Claim &claim, TimePoint now) noexcept;
/// A lock is held and has not run out.
MYDIARELAY_UTILS_EXPORT bool is_locked(const Claim &claim, TimePoint now) noexcept;
MYDIARELAY_UTILS_EXPORT bool is_lockable(const Claim &claim, TimePoint now) noexcept;

inline bool is_expired(const Claim &claim) noexcept { return is_expired(claim, Clock::now()); }
inline bool is_valid(const Claim &claim) noexcept { return is_valid(claim, Clock::now()); }
inline bool is_locked(const Claim &claim) noexcept { return is_locked(claim, Clock::now()); }

/// Wire form: ISO-8601 timestamps, absent optionals as null.
MYDIARELAY_UTILS_EXPORT nlohmann::json to_json(const Claim &claim);

} // namespace mydiarelay::relay
