#include "tunnel/media_frame.hpp"

namespace mydiarelay::tunnel
{

utils::Result<std::string, utils::FrameError> encode_media_frame(std::string_view request_id,
                                                                 std::string_view payload)
{
    using R = utils::Result<std::string, utils::FrameError>;
    if (request_id.size() > kMaxFrameRequestIdLength)
        return R::error(utils::FrameError::IdTooLong);

    std::string frame;
    frame.reserve(kMediaFrameHeaderSize + request_id.size() + payload.size());
    frame.push_back(static_cast<char>(kMediaFrameMarker));
    frame.push_back(static_cast<char>(static_cast<uint8_t>(request_id.size())));
    frame.append(request_id);
    frame.append(payload);
    return R::ok(std::move(frame));
}

utils::Result<MediaFrameView, utils::FrameError>
decode_media_frame(std::string_view frame) noexcept
{
    using R = utils::Result<MediaFrameView, utils::FrameError>;
    if (frame.size() < kMediaFrameHeaderSize)
        return R::error(utils::FrameError::TooShort);
    if (static_cast<uint8_t>(frame[0]) != kMediaFrameMarker)
        return R::error(utils::FrameError::BadMarker);

    const size_t id_len = static_cast<uint8_t>(frame[1]);
    if (frame.size() < kMediaFrameHeaderSize + id_len)
        return R::error(utils::FrameError::TooShort);

    return R::ok(MediaFrameView{frame.substr(kMediaFrameHeaderSize, id_len),
                                frame.substr(kMediaFrameHeaderSize + id_len)});
}

} // namespace mydiarelay::tunnel
