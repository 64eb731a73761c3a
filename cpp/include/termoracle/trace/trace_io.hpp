#pragma once

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "termoracle/core/buffer.hpp"
#include "termoracle/core/errors.hpp"

namespace termoracle::trace {
    using termoracle::core::Status;

    // Whole file as bytes. NotFound when the path does not exist, Io (errno
    // in aux) for any other open or read failure.
    Status read_text_file(const std::string& path, std::string* out);

    // Splits on '\n'; a trailing '\r' is kept (callers strip whitespace).
    // A final line without a newline is included.
    Status read_lines(const std::string& path, std::vector<std::string>* out);
    void split_lines(std::string_view text, std::vector<std::string>* out);

    Status write_file(const std::string& path, termoracle::core::BufferView data);

    [[nodiscard]] bool file_exists(const std::string& path) noexcept;

    // Append-only JSONL sink. Every line is flushed as soon as it is written
    // so a concurrently tailing reader sees complete events.
    class TraceSink {
    public:
        TraceSink() = default;
        ~TraceSink();

        TraceSink(const TraceSink&) = delete;
        TraceSink& operator=(const TraceSink&) = delete;

        Status open(const std::string& path);
        Status write_line(std::string_view line);
        void close() noexcept;

        [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }

    private:
        std::FILE* file_{nullptr};
    };
} // namespace termoracle::trace
