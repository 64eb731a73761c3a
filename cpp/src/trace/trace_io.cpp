#include "termoracle/trace/trace_io.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace termoracle::trace {
    using termoracle::core::StatusCode;
    using termoracle::core::StatusDomain;
    using termoracle::core::make_status;

    Status read_text_file(const std::string& path, std::string* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Trace, StatusCode::Invalid);
        }

        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            const int err = errno;
            const StatusCode code = err == ENOENT ? StatusCode::NotFound : StatusCode::Io;
            return make_status(StatusDomain::Trace, code, static_cast<termoracle::core::u32>(err));
        }

        std::string data;
        char buf[8192];
        for (;;) {
            const size_t n = std::fread(buf, 1, sizeof(buf), f);
            data.append(buf, n);
            if (n < sizeof(buf)) {
                break;
            }
        }
        const bool failed = std::ferror(f) != 0;
        const int read_errno = errno;
        std::fclose(f);

        if (failed) {
            return make_status(StatusDomain::Trace, StatusCode::Io, static_cast<termoracle::core::u32>(read_errno));
        }
        *out = std::move(data);
        return termoracle::core::ok_status();
    }

    void split_lines(std::string_view text, std::vector<std::string>* out) {
        out->clear();
        size_t start = 0;
        while (start < text.size()) {
            const size_t nl = text.find('\n', start);
            if (nl == std::string_view::npos) {
                out->emplace_back(text.substr(start));
                break;
            }
            out->emplace_back(text.substr(start, nl - start));
            start = nl + 1;
        }
    }

    Status read_lines(const std::string& path, std::vector<std::string>* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Trace, StatusCode::Invalid);
        }
        std::string text;
        const Status s = read_text_file(path, &text);
        if (!termoracle::core::is_ok(s)) {
            return s;
        }
        split_lines(text, out);
        return termoracle::core::ok_status();
    }

    Status write_file(const std::string& path, termoracle::core::BufferView data) {
        if (!termoracle::core::buffer_ok(data)) {
            return make_status(StatusDomain::Trace, StatusCode::Invalid);
        }
        std::FILE* f = std::fopen(path.c_str(), "wb");
        if (!f) {
            return make_status(StatusDomain::Trace, StatusCode::Io, static_cast<termoracle::core::u32>(errno));
        }

        const size_t written = data.len > 0 ? std::fwrite(data.data, 1, static_cast<size_t>(data.len), f) : 0;
        const int rc = std::fclose(f);

        if (written != static_cast<size_t>(data.len) || rc != 0) {
            return make_status(StatusDomain::Trace, StatusCode::Io);
        }
        return termoracle::core::ok_status();
    }

    bool file_exists(const std::string& path) noexcept {
        struct stat st {};
        return ::stat(path.c_str(), &st) == 0;
    }

    TraceSink::~TraceSink() {
        close();
    }

    Status TraceSink::open(const std::string& path) {
        if (file_ != nullptr) {
            return make_status(StatusDomain::Trace, StatusCode::Busy);
        }
        file_ = std::fopen(path.c_str(), "a");
        if (!file_) {
            return make_status(StatusDomain::Trace, StatusCode::Io, static_cast<termoracle::core::u32>(errno));
        }
        return termoracle::core::ok_status();
    }

    Status TraceSink::write_line(std::string_view line) {
        if (file_ == nullptr) {
            return make_status(StatusDomain::Trace, StatusCode::Closed);
        }
        const size_t n = std::fwrite(line.data(), 1, line.size(), file_);
        if (n != line.size() || std::fputc('\n', file_) == EOF || std::fflush(file_) != 0) {
            return make_status(StatusDomain::Trace, StatusCode::Io, static_cast<termoracle::core::u32>(errno));
        }
        return termoracle::core::ok_status();
    }

    void TraceSink::close() noexcept {
        if (file_ != nullptr) {
            std::fclose(file_);
            file_ = nullptr;
        }
    }
} // namespace termoracle::trace
