#pragma once
#include "process.hpp"
#include "server.hpp"
#include <cstdint>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace procrt {

using RowImage = std::variant<ProcessRecord, ServerRow>;

std::string encode_row(const ProcessRecord& rec);
std::string encode_row(const ServerRow& row);
std::optional<RowImage> decode_row(const std::string& payload);

/// Append-only log of committed row images. Every line carries the crc32 of its
/// payload and each batch ends with a commit marker, so a torn tail is detected
/// and dropped on recovery. compact() folds everything into a zlib-compressed
/// snapshot at <path>.snap and empties the log.
class Journal {
public:
    explicit Journal(std::string path);
    ~Journal();

    const std::string& path() const { return path_; }
    std::string snapshot_path() const { return path_ + ".snap"; }

    // Snapshot first, then every complete batch of the log, in order.
    void recover(const std::function<void(const std::vector<RowImage>&)>& apply);

    // Durable before it returns; throws StoreError and leaves the log as it was.
    void append(const std::vector<std::string>& payloads);

    void write_snapshot(const std::vector<std::string>& payloads);

    uint64_t batches_recovered() const { return recovered_; }
    uint64_t damaged_lines() const { return damaged_; }

private:
    bool load_snapshot(const std::function<void(const std::vector<RowImage>&)>& apply);
    void replay_log(const std::function<void(const std::vector<RowImage>&)>& apply);
    void open_for_append();
    void rewind_to(uint64_t size);

    std::string path_;
    std::ofstream out_;
    bool regular_file_{true};
    bool broken_{false};
    uint64_t size_{0};
    uint64_t seq_{0};
    uint64_t recovered_{0};
    uint64_t damaged_{0};
};

} // namespace procrt
