// tests/test_framework/shared_test_helpers.cpp
#include "shared_test_helpers.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace mydiarelay::tests::helper
{

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }

    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    return wait_until(
        [&]
        {
            std::string contents;
            return read_file_contents(path.string(), contents) &&
                   contents.find(expected) != std::string::npos;
        },
        timeout);
}

bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

fs::path make_temp_dir(const char *test_name)
{
    auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   fmt::format("mydiarelay_{}_{}_{}", test_name, platform::get_pid(), ts);
    fs::create_directories(dir);
    return dir;
}

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4996) // 'getenv': This function or variable may be unsafe.
#endif
std::string test_scale()
{
    const char *v = std::getenv("MYDIARELAY_TEST_SCALE");
    return v ? std::string(v) : std::string();
}
#if defined(_MSC_VER)
#pragma warning(pop)
#endif

int scaled_value(int original, int small_value)
{
    if (test_scale() == "small")
        return small_value;
    return original;
}

} // namespace mydiarelay::tests::helper
