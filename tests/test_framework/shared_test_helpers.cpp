// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions and utilities for test cases.
 */

#include "lp_base.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

#include "shared_test_helpers.h"

namespace livepreview::tests::helper
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

bool write_file_contents(const fs::path &path, std::string_view contents)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
        return false;
    ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    return static_cast<bool>(ofs);
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
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout)
    {
        std::string contents;
        if (read_file_contents(path.string(), contents))
        {
            if (contents.find(expected) != std::string::npos)
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

fs::path unique_temp_path(const std::string &name, const std::string &extension)
{
    static std::atomic<unsigned> counter{0};
    return fs::temp_directory_path() /
           fmt::format("livepreview_test_{}_{}_{}{}", name, platform::get_pid(),
                       counter.fetch_add(1), extension);
}

TempFileGuard::~TempFileGuard()
{
    for (const auto &p : paths_)
    {
        std::error_code ec;
        fs::remove(p, ec);
    }
}

fs::path TempFileGuard::make(const std::string &name, const std::string &extension)
{
    paths_.push_back(unique_temp_path(name, extension));
    return paths_.back();
}

} // namespace livepreview::tests::helper
