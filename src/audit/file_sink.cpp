#include "audit/file_sink.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace privgate {

FileSink::FileSink(const Config& config)
    : config_(config) {
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    open_file();
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }
}

FileSink::~FileSink() {
    shutdown();
}

void FileSink::open_file() {
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) return;

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(file_size);

    if (current_file_size_ == 0 && !config_.header.empty()) {
        file_stream_ << config_.header;
        current_file_size_ = config_.header.size();
    }
}

bool FileSink::write(std::string_view data) {
    if (config_.max_file_size_bytes > 0 &&
        current_file_size_ + data.size() > config_.max_file_size_bytes &&
        current_file_size_ > config_.header.size()) {
        rotate_file();
    }
    if (!file_stream_.is_open()) {
        return false;
    }
    file_stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
    current_file_size_ += data.size();
    return file_stream_.good();
}

void FileSink::flush() {
    file_stream_.flush();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

void FileSink::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    // Delete the oldest file if it exceeds max_files
    const auto oldest = std::format("{}.{}", config_.output_file, config_.max_files);
    std::filesystem::remove(oldest, ec);

    // Shift existing rotated files: .N -> .N+1
    for (int i = config_.max_files - 1; i >= 1; --i) {
        const auto old_name = std::format("{}.{}", config_.output_file, i);
        const auto new_name = std::format("{}.{}", config_.output_file, i + 1);
        std::filesystem::rename(old_name, new_name, ec);
    }

    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);

    current_file_size_ = 0;
    open_file();
    ++rotation_count_;
}

} // namespace privgate
