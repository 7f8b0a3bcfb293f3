#include "mdr_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace mydiarelay::utils
{

FileSink::FileSink(const std::string &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
    std::error_code ec;
    const auto parent = m_path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec))
    {
        std::filesystem::create_directories(parent, ec);
    }
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        const std::error_code open_ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, open_ec.message()));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const auto content = format_logmsg(msg, mode);
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t bytes_written = ::write(m_fd, content.c_str(), content.length());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.length())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
}

void FileSink::flush()
{
    if (m_fd != -1)
    {
        ::fsync(m_fd);
    }
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace mydiarelay::utils
