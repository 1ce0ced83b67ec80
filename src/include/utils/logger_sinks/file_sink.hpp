#pragma once

#include "sink.hpp"
#include <filesystem>
#include <string>

namespace livepreview::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log records to a file.
 *
 * The file is opened with append semantics, so records from several processes
 * writing the same log are not interleaved mid-line.
 */
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /**
     * @throws std::system_error on a short or failed write.
     */
    void write(const LogRecord &record) override;
    void flush() override;
    std::string description() const override;

  private:
    void close() noexcept;

    std::filesystem::path m_path;
#ifdef LIVEPREVIEW_PLATFORM_WIN64
    void *m_file_handle = nullptr;
#else
    int m_fd = -1;
#endif
};

} // namespace livepreview::utils
