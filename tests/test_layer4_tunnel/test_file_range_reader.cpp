/**
 * @file test_file_range_reader.cpp
 * @brief Range reads confined to a library root.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "tunnel/file_range_reader.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

using namespace mydiarelay::tests;
using namespace mydiarelay::tests::helper;
using namespace mydiarelay::tunnel;
using mydiarelay::utils::MediaError;

class FileRangeReaderTest : public PureApiTest
{
  protected:
    void SetUp() override
    {
        dir = make_temp_dir("file_range_reader");
        root = dir / "library";
        fs::create_directories(root / "shows");
        content.resize(1000);
        for (size_t i = 0; i < content.size(); ++i)
            content[i] = static_cast<char>('a' + i % 26);
        write(root / "shows" / "episode.mkv", content);
        write(dir / "secret.txt", "outside");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static void write(const fs::path &p, const std::string &data)
    {
        std::ofstream out(p, std::ios::binary);
        out << data;
    }

    fs::path dir;
    fs::path root;
    std::string content;
};

TEST_F(FileRangeReaderTest, RelativePathsResolveAgainstRoot)
{
    FileRangeReader reader(root);
    auto p = reader.constrain("shows/episode.mkv");
    ASSERT_TRUE(p.is_ok());
    EXPECT_EQ(p.content(), fs::weakly_canonical(root / "shows" / "episode.mkv"));

    auto size = reader.file_size("shows/episode.mkv");
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.content(), content.size());
}

TEST_F(FileRangeReaderTest, DotDotEscapeIsRejected)
{
    FileRangeReader reader(root);
    auto escaped = reader.constrain("shows/../../secret.txt");
    ASSERT_TRUE(escaped.is_error());
    EXPECT_EQ(escaped.error(), MediaError::OutsideRoot);

    auto absolute = reader.read_file_range(dir / "secret.txt", 0, 10);
    ASSERT_TRUE(absolute.is_error());
    EXPECT_EQ(absolute.error(), MediaError::OutsideRoot);
}

TEST_F(FileRangeReaderTest, SiblingWithCommonPrefixIsOutside)
{
    fs::create_directories(dir / "library-other");
    write(dir / "library-other" / "a.mp4", "x");
    FileRangeReader reader(root);
    auto sibling = reader.constrain(dir / "library-other" / "a.mp4");
    ASSERT_TRUE(sibling.is_error());
    EXPECT_EQ(sibling.error(), MediaError::OutsideRoot);
}

TEST_F(FileRangeReaderTest, SymlinkOutOfRootIsRejected)
{
    std::error_code ec;
    fs::create_symlink(dir / "secret.txt", root / "link.mp4", ec);
    if (ec)
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    FileRangeReader reader(root);
    auto linked = reader.file_size("link.mp4");
    ASSERT_TRUE(linked.is_error());
    EXPECT_EQ(linked.error(), MediaError::OutsideRoot);
}

TEST_F(FileRangeReaderTest, MissingFileAndDirectory)
{
    FileRangeReader reader(root);
    auto missing = reader.file_size("shows/gone.mkv");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error(), MediaError::FileMissing);

    auto directory = reader.file_size("shows");
    ASSERT_TRUE(directory.is_error());
    EXPECT_EQ(directory.error(), MediaError::FileMissing);
}

TEST_F(FileRangeReaderTest, ReadsRequestedRange)
{
    FileRangeReader reader(root);
    auto head = reader.read_file_range("shows/episode.mkv", 0, 10);
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.content(), content.substr(0, 10));

    auto middle = reader.read_file_range("shows/episode.mkv", 500, 26);
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(middle.content(), content.substr(500, 26));
}

TEST_F(FileRangeReaderTest, ShortReadOnlyAtEndOfFile)
{
    FileRangeReader reader(root);
    auto tail = reader.read_file_range("shows/episode.mkv", 990, 100);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(tail.content(), content.substr(990));

    auto at_end = reader.read_file_range("shows/episode.mkv", 1000, 100);
    ASSERT_TRUE(at_end.is_ok());
    EXPECT_TRUE(at_end.content().empty());

    auto past_end = reader.read_file_range("shows/episode.mkv", 1001, 1);
    ASSERT_TRUE(past_end.is_error());
    EXPECT_EQ(past_end.error(), MediaError::InvalidRange);
}

TEST_F(FileRangeReaderTest, ContentTypeByExtension)
{
    EXPECT_EQ(FileRangeReader::content_type("a/b/movie.mp4"), "video/mp4");
    EXPECT_EQ(FileRangeReader::content_type("episode.MKV"), "video/x-matroska");
    EXPECT_EQ(FileRangeReader::content_type("subs.vtt"), "text/vtt");
    EXPECT_EQ(FileRangeReader::content_type("track.flac"), "audio/flac");
    EXPECT_EQ(FileRangeReader::content_type("README"), "application/octet-stream");
    EXPECT_EQ(FileRangeReader::content_type("archive.tar.gz"), "application/octet-stream");
}

TEST_F(FileRangeReaderTest, MediaErrorMessages)
{
    using mydiarelay::utils::to_string;
    EXPECT_STREQ(to_string(MediaError::NotFound), "File not found");
    EXPECT_STREQ(to_string(MediaError::FileMissing), "File missing on disk");
    EXPECT_STREQ(to_string(MediaError::OutsideRoot), "Access denied");
}
