#include "lp_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <stdexcept>
#include <system_error>

#ifndef LIVEPREVIEW_PLATFORM_WIN64
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace livepreview::utils
{

FileSink::FileSink(const std::string &path) : m_path(path)
{
#ifdef LIVEPREVIEW_PLATFORM_WIN64
    std::wstring wpath = format_tools::s2ws(path);
    m_file_handle = CreateFileW(wpath.c_str(), FILE_APPEND_DATA,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (m_file_handle == INVALID_HANDLE_VALUE)
    {
        m_file_handle = nullptr;
        std::system_error err(static_cast<int>(GetLastError()), std::system_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, err.what()));
    }
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        std::system_error err(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, err.what()));
    }
#endif
}

FileSink::~FileSink()
{
    close();
}

void FileSink::close() noexcept
{
#ifdef LIVEPREVIEW_PLATFORM_WIN64
    if (m_file_handle != nullptr)
    {
        CloseHandle(m_file_handle);
        m_file_handle = nullptr;
    }
#else
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
#endif
}

void FileSink::write(const LogRecord &record)
{
    const std::string content = render_line(record);
#ifdef LIVEPREVIEW_PLATFORM_WIN64
    DWORD bytes_written = 0;
    if (!WriteFile(m_file_handle, content.c_str(), static_cast<DWORD>(content.length()),
                   &bytes_written, nullptr) ||
        bytes_written != content.length())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to write complete log message to file");
    }
#else
    ssize_t bytes_written = ::write(m_fd, content.c_str(), content.length());
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.length())
    {
        throw std::system_error(errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#ifdef LIVEPREVIEW_PLATFORM_WIN64
    FlushFileBuffers(m_file_handle);
#else
    ::fsync(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace livepreview::utils
