#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace llmshield {

/**
 * @brief Append-only JSON-lines journal with size-based rotation
 *
 * Rotated files get numeric suffixes: audit.jsonl.1, audit.jsonl.2, ...
 * Files beyond max_files are deleted.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "audit-fallback.jsonl";
        size_t max_file_size_bytes = 50ULL * 1024 * 1024;
        int max_files = 5;
    };

    explicit FileSink(Config config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const;

private:
    void rotate_file();

    Config config_;
    mutable std::mutex mutex_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace llmshield
