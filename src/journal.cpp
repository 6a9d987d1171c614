#include "procrt/journal.hpp"
#include "procrt/errors.hpp"
#include "procrt/reporting.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <zlib.h>

namespace procrt {

namespace {

constexpr const char* kSnapshotMagic = "PRSNAP1";
constexpr uint64_t kMaxSnapshotBytes = uint64_t{1} << 30;

uint32_t checksum(const std::string& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

std::string format_line(const std::string& payload) {
    char crc[16];
    std::snprintf(crc, sizeof(crc), "%08x ", checksum(payload));
    return std::string(crc) + payload + "\n";
}

bool check_line(const std::string& line, std::string& payload) {
    if (line.size() < 10 || line[8] != ' ') return false;
    uint32_t expected = 0;
    try {
        expected = static_cast<uint32_t>(std::stoul(line.substr(0, 8), nullptr, 16));
    } catch (const std::exception&) {
        return false;
    }
    payload = line.substr(9);
    return checksum(payload) == expected;
}

void write_resources(std::ostream& os, const Resources& r) {
    os << ' ' << r.cpu << ' ' << r.ram << ' ' << r.hdd << ' ' << r.net;
}

bool read_resources(std::istream& is, Resources& r) {
    return static_cast<bool>(is >> r.cpu >> r.ram >> r.hdd >> r.net);
}

} // namespace

std::string encode_row(const ProcessRecord& rec) {
    std::ostringstream os;
    os << std::setprecision(17);
    os << "P " << rec.id << ' ' << rec.owner_id << ' ' << rec.gateway_server_id << ' '
       << rec.target_server_id << ' ' << to_string(rec.type) << ' ' << to_string(rec.state);
    write_resources(os, rec.reservation);
    os << ' ' << rec.progress << ' ' << rec.required_work << ' ' << to_millis(rec.created_at) << ' '
       << to_millis(rec.last_checkpoint_at) << ' '
       << (rec.completed_at ? to_millis(*rec.completed_at) : -1) << ' ' << to_millis(rec.updated_at);
    return os.str();
}

std::string encode_row(const ServerRow& row) {
    std::ostringstream os;
    os << "S " << row.id << ' ' << row.owner_id;
    write_resources(os, row.pool.total);
    write_resources(os, row.pool.available);
    os << ' ' << (row.online ? 1 : 0) << ' ' << to_millis(row.updated_at);
    return os.str();
}

std::optional<RowImage> decode_row(const std::string& payload) {
    std::istringstream is(payload);
    std::string tag;
    if (!(is >> tag)) return std::nullopt;
    if (tag == "P") {
        ProcessRecord rec;
        std::string type, state;
        int64_t created = 0, checkpoint = 0, completed = 0, updated = 0;
        if (!(is >> rec.id >> rec.owner_id >> rec.gateway_server_id >> rec.target_server_id >> type >> state))
            return std::nullopt;
        if (!read_resources(is, rec.reservation)) return std::nullopt;
        if (!(is >> rec.progress >> rec.required_work >> created >> checkpoint >> completed >> updated))
            return std::nullopt;
        auto t = parse_process_type(type);
        auto s = parse_state(state);
        if (!t || !s) return std::nullopt;
        rec.type = *t;
        rec.state = *s;
        rec.created_at = from_millis(created);
        rec.last_checkpoint_at = from_millis(checkpoint);
        if (completed >= 0) rec.completed_at = from_millis(completed);
        rec.updated_at = from_millis(updated);
        return RowImage{rec};
    }
    if (tag == "S") {
        ServerRow row;
        int online = 0;
        int64_t updated = 0;
        if (!(is >> row.id >> row.owner_id)) return std::nullopt;
        if (!read_resources(is, row.pool.total) || !read_resources(is, row.pool.available)) return std::nullopt;
        if (!(is >> online >> updated)) return std::nullopt;
        row.online = online != 0;
        row.updated_at = from_millis(updated);
        return RowImage{row};
    }
    return std::nullopt;
}

Journal::Journal(std::string path) : path_(std::move(path)) {}

Journal::~Journal() {
    if (out_.is_open()) out_.close();
}

void Journal::recover(const std::function<void(const std::vector<RowImage>&)>& apply) {
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) regular_file_ = std::filesystem::is_regular_file(path_, ec);
    if (regular_file_) {
        load_snapshot(apply);
        replay_log(apply);
    }
    open_for_append();
}

bool Journal::load_snapshot(const std::function<void(const std::vector<RowImage>&)>& apply) {
    std::ifstream in(snapshot_path(), std::ios::binary);
    if (!in) return false;

    std::string header;
    std::getline(in, header);
    std::istringstream hs(header);
    std::string magic, crc_hex;
    uint64_t raw_len = 0, seq = 0;
    uint32_t expected_crc = 0;
    if (!(hs >> magic >> raw_len >> crc_hex >> seq) || magic != kSnapshotMagic)
        throw StoreError("snapshot: bad header in " + snapshot_path());
    if (raw_len > kMaxSnapshotBytes)
        throw StoreError("snapshot: length " + std::to_string(raw_len) + " exceeds limit in " + snapshot_path());
    try {
        size_t used = 0;
        unsigned long crc = std::stoul(crc_hex, &used, 16);
        if (used != crc_hex.size() || crc > 0xffffffffUL) throw std::out_of_range(crc_hex);
        expected_crc = static_cast<uint32_t>(crc);
    } catch (const std::logic_error&) {
        throw StoreError("snapshot: bad checksum field '" + crc_hex + "' in " + snapshot_path());
    }

    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::string raw(raw_len, '\0');
    if (raw_len > 0) {
        uLongf dest_len = static_cast<uLongf>(raw_len);
        int ret = uncompress(reinterpret_cast<Bytef*>(&raw[0]), &dest_len,
                             reinterpret_cast<const Bytef*>(body.data()), static_cast<uLong>(body.size()));
        if (ret != Z_OK || dest_len != raw_len)
            throw StoreError("snapshot: zlib error " + std::to_string(ret));
    }
    if (expected_crc != checksum(raw))
        throw StoreError("snapshot: checksum mismatch in " + snapshot_path());

    std::vector<RowImage> batch;
    std::istringstream rows(raw);
    std::string line;
    while (std::getline(rows, line)) {
        auto row = decode_row(line);
        if (!row) throw StoreError("snapshot: unreadable row '" + line + "'");
        batch.push_back(*row);
    }
    apply(batch);
    seq_ = seq;
    reporting::debug("journal", "snapshot loaded, " + std::to_string(batch.size()) + " rows");
    return true;
}

void Journal::replay_log(const std::function<void(const std::vector<RowImage>&)>& apply) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) return;

    std::vector<RowImage> batch;
    std::string line, payload;
    uint64_t offset = 0;
    uint64_t good = 0;
    while (std::getline(in, line)) {
        bool terminated = !in.eof();
        if (!terminated || !check_line(line, payload)) {
            ++damaged_;
            break;
        }
        offset += line.size() + 1;
        if (payload.rfind("C ", 0) == 0) {
            uint64_t seq = 0;
            std::istringstream ms(payload.substr(2));
            if (!(ms >> seq)) {
                ++damaged_;
                break;
            }
            apply(batch);
            batch.clear();
            good = offset;
            ++recovered_;
            seq_ = std::max(seq_, seq);
            continue;
        }
        auto row = decode_row(payload);
        if (!row) {
            ++damaged_;
            break;
        }
        batch.push_back(*row);
    }
    in.close();

    std::error_code ec;
    auto file_size = std::filesystem::file_size(path_, ec);
    if (!ec && file_size > good) {
        reporting::warn("journal", "dropping " + std::to_string(file_size - good) +
                                       " bytes of incomplete tail from " + path_);
        rewind_to(good);
    }
    size_ = good;
}

void Journal::open_for_append() {
    out_.clear();
    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_) throw StoreError("journal: cannot open " + path_);
    broken_ = false;
}

void Journal::rewind_to(uint64_t size) {
    if (!regular_file_) return;
    std::error_code ec;
    std::filesystem::resize_file(path_, size, ec);
    if (ec) reporting::warn("journal", "cannot truncate " + path_ + ": " + ec.message());
}

void Journal::append(const std::vector<std::string>& payloads) {
    if (broken_ || !out_.is_open()) open_for_append();

    std::string buf;
    for (const auto& p : payloads) buf += format_line(p);
    buf += format_line("C " + std::to_string(seq_ + 1));

    out_.write(buf.data(), static_cast<std::streamsize>(buf.size()));
    out_.flush();
    if (!out_) {
        broken_ = true;
        out_.close();
        rewind_to(size_);
        throw StoreError("journal: write failed on " + path_);
    }
    size_ += buf.size();
    ++seq_;
}

void Journal::write_snapshot(const std::vector<std::string>& payloads) {
    std::string raw;
    for (const auto& p : payloads) raw += p + "\n";

    uLongf dest_len = compressBound(static_cast<uLong>(raw.size()));
    std::string body(dest_len, '\0');
    int ret = compress2(reinterpret_cast<Bytef*>(&body[0]), &dest_len,
                        reinterpret_cast<const Bytef*>(raw.data()), static_cast<uLong>(raw.size()),
                        Z_BEST_SPEED);
    if (ret != Z_OK) throw StoreError("snapshot: zlib error " + std::to_string(ret));
    body.resize(dest_len);

    char crc[16];
    std::snprintf(crc, sizeof(crc), "%08x", checksum(raw));
    const std::string tmp = snapshot_path() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << kSnapshotMagic << ' ' << raw.size() << ' ' << crc << ' ' << seq_ << "\n";
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.flush();
        if (!out) throw StoreError("snapshot: cannot write " + tmp);
    }
    std::error_code ec;
    std::filesystem::rename(tmp, snapshot_path(), ec);
    if (ec) throw StoreError("snapshot: rename failed: " + ec.message());

    out_.close();
    rewind_to(0);
    size_ = 0;
    open_for_append();
    reporting::info("journal", "compacted " + std::to_string(payloads.size()) + " rows into " +
                                   snapshot_path() + " (" + std::to_string(raw.size()) + " -> " +
                                   std::to_string(body.size()) + " bytes)");
}

} // namespace procrt
