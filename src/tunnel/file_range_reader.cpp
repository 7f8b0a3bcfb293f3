#include "mdr_service.hpp"
#include "tunnel/file_range_reader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace mydiarelay::tunnel
{

using utils::MediaError;

namespace
{
constexpr std::array<std::pair<std::string_view, std::string_view>, 14> kMimeTypes{{
    {".mp4", "video/mp4"},
    {".m4v", "video/x-m4v"},
    {".mkv", "video/x-matroska"},
    {".webm", "video/webm"},
    {".avi", "video/x-msvideo"},
    {".mov", "video/quicktime"},
    {".ts", "video/mp2t"},
    {".mp3", "audio/mpeg"},
    {".flac", "audio/flac"},
    {".m4a", "audio/mp4"},
    {".srt", "application/x-subrip"},
    {".vtt", "text/vtt"},
    {".jpg", "image/jpeg"},
    {".png", "image/png"},
}};

fs::path normalize(const fs::path &p)
{
    std::error_code ec;
    fs::path out = fs::weakly_canonical(p, ec);
    if (ec)
        out = p.lexically_normal();
    return out;
}

bool is_under(const fs::path &root, const fs::path &p)
{
    const auto root_end = std::mismatch(root.begin(), root.end(), p.begin(), p.end()).first;
    if (root_end == root.end())
        return true;
    // A trailing separator on root yields one empty final element.
    return std::next(root_end) == root.end() && root_end->empty();
}
} // namespace

FileRangeReader::FileRangeReader(fs::path root) : m_root(normalize(fs::absolute(root))) {}

utils::Result<fs::path, MediaError> FileRangeReader::constrain(const fs::path &candidate) const
{
    using R = utils::Result<fs::path, MediaError>;
    const fs::path joined = candidate.is_absolute() ? candidate : m_root / candidate;
    fs::path resolved = normalize(joined);
    if (!is_under(m_root, resolved))
    {
        LOGGER_WARN("FileRangeReader: '{}' is outside '{}'", candidate.string(), m_root.string());
        return R::error(MediaError::OutsideRoot);
    }
    return R::ok(std::move(resolved));
}

utils::Result<uint64_t, MediaError> FileRangeReader::file_size(const fs::path &path) const
{
    using R = utils::Result<uint64_t, MediaError>;
    auto constrained = constrain(path);
    if (constrained.is_error())
        return R::error(constrained.error());

    std::error_code ec;
    const fs::path &p = constrained.content();
    if (!fs::is_regular_file(p, ec))
        return R::error(MediaError::FileMissing);
    const auto size = fs::file_size(p, ec);
    if (ec)
        return R::error(MediaError::FileMissing);
    return R::ok(static_cast<uint64_t>(size));
}

utils::Result<std::string, MediaError>
FileRangeReader::read_file_range(const fs::path &path, uint64_t offset, size_t length) const
{
    using R = utils::Result<std::string, MediaError>;
    auto size = file_size(path);
    if (size.is_error())
        return R::error(size.error());
    if (offset > size.content())
        return R::error(MediaError::InvalidRange);

    const uint64_t available = size.content() - offset;
    const size_t to_read = static_cast<size_t>(std::min<uint64_t>(available, length));
    std::string data(to_read, '\0');
    if (to_read == 0)
        return R::ok(std::move(data));

    std::ifstream in(constrain(path).content(), std::ios::binary);
    if (!in)
    {
        LOGGER_ERROR("FileRangeReader: cannot open '{}'", path.string());
        return R::error(MediaError::ReadFailed);
    }
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(data.data(), static_cast<std::streamsize>(to_read));
    const auto got = in.gcount();
    if (got <= 0 || in.bad())
    {
        LOGGER_ERROR("FileRangeReader: read of '{}' at {} failed", path.string(), offset);
        return R::error(MediaError::ReadFailed);
    }
    data.resize(static_cast<size_t>(got));
    return R::ok(std::move(data));
}

std::string FileRangeReader::content_type(const fs::path &path)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto &[suffix, mime] : kMimeTypes)
        if (suffix == ext)
            return std::string(mime);
    return "application/octet-stream";
}

} // namespace mydiarelay::tunnel
