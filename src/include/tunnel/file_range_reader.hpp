#pragma once
/**
 * @file file_range_reader.hpp
 * @brief Byte-range reads of media files, confined to one library root.
 */
#include "mydiarelay_utils_export.h"
#include "utils/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace mydiarelay::tunnel
{

class MYDIARELAY_UTILS_EXPORT FileRangeReader
{
  public:
    /// @param root Directory all reads are confined to. Normalized, need not exist yet.
    explicit FileRangeReader(std::filesystem::path root);

    const std::filesystem::path &root() const noexcept { return m_root; }

    /**
     * @brief Resolves @p candidate (relative paths against root()) and checks that it
     *        stays under root() after `..` and symlinks are resolved.
     * @return OutsideRoot otherwise.
     */
    utils::Result<std::filesystem::path, utils::MediaError>
    constrain(const std::filesystem::path &candidate) const;

    /// @return OutsideRoot, or FileMissing if there is no regular file at @p path.
    utils::Result<uint64_t, utils::MediaError> file_size(const std::filesystem::path &path) const;

    /**
     * @brief Reads up to @p length bytes at @p offset. Short only at end of file.
     * @return InvalidRange if @p offset is past the end, ReadFailed on an I/O error.
     */
    utils::Result<std::string, utils::MediaError>
    read_file_range(const std::filesystem::path &path, uint64_t offset, size_t length) const;

    /// @brief MIME type from the extension; application/octet-stream when unknown.
    static std::string content_type(const std::filesystem::path &path);

  private:
    std::filesystem::path m_root;
};

} // namespace mydiarelay::tunnel
