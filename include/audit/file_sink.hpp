#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <string>

namespace privgate {

/**
 * @brief File-based audit sink with size-based rotation
 *
 * Appends rendered records to a file. When the file reaches
 * max_file_size_bytes it is renamed with a numeric suffix
 * (redactions.jsonl.1, .2, ...); files beyond max_files are deleted.
 * A non-empty header is written at the top of every fresh file.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "redactions.jsonl";
        size_t max_file_size_bytes = 10ULL * 1024 * 1024;  // 10MB
        int max_files = 5;
        std::string header;  // e.g. CSV column row
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view data) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    /// Number of rotations performed (for stats/testing)
    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }

    /// Current file size in bytes
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void open_file();
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace privgate
