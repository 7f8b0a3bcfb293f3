#pragma once
/**
 * @file media_frame.hpp
 * @brief Binary frame carrying one chunk of a media stream.
 *
 * Layout:
 * @code
 *   [0x01][id_len : u8][request_id : id_len bytes][payload ...]
 * @endcode
 * Several streams may share the media channel, so each chunk names its request.
 */
#include "mydiarelay_utils_export.h"
#include "utils/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mydiarelay::tunnel
{

inline constexpr uint8_t kMediaFrameMarker = 0x01;
inline constexpr size_t kMediaFrameHeaderSize = 2;
inline constexpr size_t kMaxFrameRequestIdLength = 255;

/// Views into the buffer passed to decode_media_frame(); valid only while it is.
struct MediaFrameView
{
    std::string_view request_id;
    std::string_view payload;
};

/// @return IdTooLong if @p request_id does not fit the one-byte length field.
MYDIARELAY_UTILS_EXPORT utils::Result<std::string, utils::FrameError>
encode_media_frame(std::string_view request_id, std::string_view payload);

MYDIARELAY_UTILS_EXPORT utils::Result<MediaFrameView, utils::FrameError>
decode_media_frame(std::string_view frame) noexcept;

} // namespace mydiarelay::tunnel
