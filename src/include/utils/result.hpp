/**
 * @file result.hpp
 * @brief Result<T, E> for expected failures, plus the domain error enums.
 *
 * Expected failures (a lost lock race, an unknown request id, a missing media file) are
 * returned as values. Exceptions are reserved for invariant violations and I/O setup.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mydiarelay::utils
{

/// Claim Store outcomes. The wire names are those returned by to_string().
enum class ClaimError
{
    NotFound,
    Expired,
    AlreadyConsumed,
    Locked,       ///< Someone else is mid-redemption; retryable.
    Unauthorized, ///< Claim belongs to a different instance.
    StorageFailure
};

/// Connection Registry lookups.
enum class RegistryError
{
    NotFound
};

/// Pending Request Ledger outcomes.
enum class LedgerError
{
    NotFound,           ///< Benign: already resolved, timed out or never registered.
    DuplicateId,
    Timeout,
    TunnelDisconnected, ///< The owning instance dropped; distinct from an error response.
    Cancelled
};

/// Signaling and data-channel outcomes.
enum class TunnelError
{
    NegotiationFailed,
    TunnelDisconnected,
    Timeout,
    InvalidNamespace,
    ClaimRejected,
    NotConnected,
    ProtocolError,
    Unauthorized
};

/// Media range reads.
enum class MediaError
{
    NotFound,      ///< The media id does not resolve.
    FileMissing,   ///< Resolved, but nothing on disk.
    OutsideRoot,   ///< Path escapes the allowed root.
    InvalidRange,
    ReadFailed
};

/// Instance token verification.
enum class TokenError
{
    InvalidToken,
    Expired
};

/// Binary media frame decoding.
enum class FrameError
{
    TooShort,
    BadMarker,
    IdTooLong
};

inline const char *to_string(ClaimError err) noexcept
{
    switch (err)
    {
    case ClaimError::NotFound:
        return "not_found";
    case ClaimError::Expired:
        return "expired";
    case ClaimError::AlreadyConsumed:
        return "already_consumed";
    case ClaimError::Locked:
        return "locked";
    case ClaimError::Unauthorized:
        return "unauthorized";
    case ClaimError::StorageFailure:
        return "storage_failure";
    }
    return "unknown";
}

inline const char *to_string(RegistryError err) noexcept
{
    switch (err)
    {
    case RegistryError::NotFound:
        return "not_found";
    }
    return "unknown";
}

inline const char *to_string(LedgerError err) noexcept
{
    switch (err)
    {
    case LedgerError::NotFound:
        return "not_found";
    case LedgerError::DuplicateId:
        return "duplicate_id";
    case LedgerError::Timeout:
        return "timeout";
    case LedgerError::TunnelDisconnected:
        return "tunnel_disconnected";
    case LedgerError::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

inline const char *to_string(TunnelError err) noexcept
{
    switch (err)
    {
    case TunnelError::NegotiationFailed:
        return "negotiation_failed";
    case TunnelError::TunnelDisconnected:
        return "tunnel_disconnected";
    case TunnelError::Timeout:
        return "timeout";
    case TunnelError::InvalidNamespace:
        return "invalid_namespace";
    case TunnelError::ClaimRejected:
        return "claim_rejected";
    case TunnelError::NotConnected:
        return "not_connected";
    case TunnelError::ProtocolError:
        return "protocol_error";
    case TunnelError::Unauthorized:
        return "unauthorized";
    }
    return "unknown";
}

inline const char *to_string(MediaError err) noexcept
{
    switch (err)
    {
    case MediaError::NotFound:
        return "File not found";
    case MediaError::FileMissing:
        return "File missing on disk";
    case MediaError::OutsideRoot:
        return "Access denied";
    case MediaError::InvalidRange:
        return "Invalid range";
    case MediaError::ReadFailed:
        return "Read failed";
    }
    return "unknown";
}

inline const char *to_string(TokenError err) noexcept
{
    switch (err)
    {
    case TokenError::InvalidToken:
        return "invalid_token";
    case TokenError::Expired:
        return "expired";
    }
    return "unknown";
}

inline const char *to_string(FrameError err) noexcept
{
    switch (err)
    {
    case FrameError::TooShort:
        return "too_short";
    case FrameError::BadMarker:
        return "bad_marker";
    case FrameError::IdTooLong:
        return "id_too_long";
    }
    return "unknown";
}

/**
 * @class Result
 * @brief Either a success value of type T or an error enum E with an optional code.
 *
 * Movable, not copyable. Use `std::monostate` for T when there is no value.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @param err The error enum value
     * @param code Optional detailed error code (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @throws std::logic_error if Result is in error state. Check is_ok() first.
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @throws std::logic_error if Result is in success state. Check is_error() first.
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

/// Result with no success payload.
template <typename E> using Status = Result<std::monostate, E>;

} // namespace mydiarelay::utils
