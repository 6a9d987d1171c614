#include "procrt/store.hpp"
#include "procrt/journal.hpp"
#include "procrt/reporting.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace procrt {
namespace detail {

struct ProcessSlot {
    std::mutex lock;
    ProcessRecord rec;
};

struct ServerSlot {
    std::mutex lock;
    ServerRow row;
};

class StoreCore {
public:
    // Guards both maps and the committed row images. Row locks are never
    // requested while this is held.
    mutable std::shared_mutex data_mu;
    std::map<ProcessId, std::unique_ptr<ProcessSlot>> processes;
    std::map<ServerId, std::unique_ptr<ServerSlot>> servers;
    std::atomic<ProcessId> next_pid{1};
    std::unique_ptr<Journal> journal;
    uint64_t commits{0};

    ProcessSlot* find_process(ProcessId id) {
        std::shared_lock<std::shared_mutex> lk(data_mu);
        auto it = processes.find(id);
        return it == processes.end() ? nullptr : it->second.get();
    }

    ServerSlot* find_server(ServerId id) {
        std::shared_lock<std::shared_mutex> lk(data_mu);
        auto it = servers.find(id);
        return it == servers.end() ? nullptr : it->second.get();
    }

    // Caller holds data_mu exclusively (or is still constructing the store).
    void put(const ProcessRecord& rec) {
        auto& slot = processes[rec.id];
        if (!slot) slot = std::make_unique<ProcessSlot>();
        slot->rec = rec;
        if (rec.id >= next_pid.load()) next_pid.store(rec.id + 1);
    }

    void put(const ServerRow& row) {
        auto& slot = servers[row.id];
        if (!slot) slot = std::make_unique<ServerSlot>();
        slot->row = row;
    }

    void apply(const std::vector<RowImage>& batch) {
        for (const auto& image : batch) {
            if (auto* rec = std::get_if<ProcessRecord>(&image)) {
                put(*rec);
            } else {
                put(std::get<ServerRow>(image));
            }
        }
    }

    void append(const std::vector<std::string>& lines) {
        if (journal && !lines.empty()) journal->append(lines);
    }
};

struct StagedProcess {
    ProcessRecord rec;
    bool dirty{false};
};

struct StagedServer {
    ServerRow row;
    bool dirty{false};
};

struct TxnState {
    StoreCore* core{nullptr};
    bool done{false};
    bool committed{false};
    std::vector<std::unique_lock<std::mutex>> held;
    std::map<ProcessId, StagedProcess> procs;
    std::map<ServerId, StagedServer> servers;

    void finish() {
        done = true;
        procs.clear();
        servers.clear();
        held.clear();
    }

    void check_open() const {
        if (done) throw std::logic_error("transaction already finished");
    }
};

} // namespace detail

// ---------------- Transaction ----------------

Transaction::Transaction(detail::StoreCore* core) : st_(std::make_unique<detail::TxnState>()) {
    st_->core = core;
}

Transaction::Transaction(Transaction&&) noexcept = default;
Transaction& Transaction::operator=(Transaction&&) noexcept = default;
Transaction::~Transaction() = default;

std::optional<ProcessRecord> Transaction::lock_process(ProcessId id, LockMode mode, const RowFilter& filter) {
    st_->check_open();
    auto staged = st_->procs.find(id);
    if (staged != st_->procs.end()) {
        if (filter && !filter(staged->second.rec)) return std::nullopt;
        return staged->second.rec;
    }

    auto* slot = st_->core->find_process(id);
    if (!slot) return std::nullopt;
    std::unique_lock<std::mutex> row_lock(slot->lock, std::defer_lock);
    if (mode == LockMode::SkipLocked) {
        if (!row_lock.try_lock()) return std::nullopt;
    } else {
        row_lock.lock();
    }

    ProcessRecord rec;
    {
        std::shared_lock<std::shared_mutex> lk(st_->core->data_mu);
        rec = slot->rec;
    }
    if (filter && !filter(rec)) return std::nullopt;

    st_->held.push_back(std::move(row_lock));
    st_->procs.emplace(id, detail::StagedProcess{rec});
    return rec;
}

std::optional<ServerRow> Transaction::lock_server(ServerId id) {
    st_->check_open();
    auto staged = st_->servers.find(id);
    if (staged != st_->servers.end()) return staged->second.row;

    auto* slot = st_->core->find_server(id);
    if (!slot) return std::nullopt;
    std::unique_lock<std::mutex> row_lock(slot->lock);
    ServerRow row;
    {
        std::shared_lock<std::shared_mutex> lk(st_->core->data_mu);
        row = slot->row;
    }
    st_->held.push_back(std::move(row_lock));
    st_->servers.emplace(id, detail::StagedServer{row});
    return row;
}

ProcessId Transaction::insert_process(ProcessRecord rec) {
    st_->check_open();
    rec.id = st_->core->next_pid.fetch_add(1);
    st_->procs[rec.id] = detail::StagedProcess{rec, true};
    return rec.id;
}

void Transaction::update_process(const ProcessRecord& rec) {
    st_->check_open();
    auto it = st_->procs.find(rec.id);
    if (it == st_->procs.end()) throw std::logic_error("process " + std::to_string(rec.id) + " is not locked");
    it->second.rec = rec;
    it->second.dirty = true;
}

void Transaction::update_server(const ServerRow& row) {
    st_->check_open();
    auto it = st_->servers.find(row.id);
    if (it == st_->servers.end()) throw std::logic_error("server " + std::to_string(row.id) + " is not locked");
    it->second.row = row;
    it->second.dirty = true;
}

void Transaction::commit() {
    st_->check_open();
    std::vector<std::string> lines;
    for (const auto& [id, staged] : st_->servers) {
        if (!staged.dirty) continue;
        if (!staged.row.pool.consistent()) {
            st_->finish();
            throw StoreError("server " + std::to_string(id) + ": available would exceed total");
        }
        lines.push_back(encode_row(staged.row));
    }
    for (const auto& [id, staged] : st_->procs) {
        if (!staged.dirty) continue;
        if (!std::isfinite(staged.rec.progress) || !std::isfinite(staged.rec.required_work)) {
            st_->finish();
            throw StoreError("process " + std::to_string(id) + ": work is not a finite number");
        }
        lines.push_back(encode_row(staged.rec));
    }

    auto* core = st_->core;
    {
        std::unique_lock<std::shared_mutex> lk(core->data_mu);
        try {
            core->append(lines);
        } catch (const StoreError&) {
            st_->finish();
            throw;
        }
        for (const auto& [id, staged] : st_->servers) {
            if (staged.dirty) core->servers.at(id)->row = staged.row;
        }
        for (const auto& [id, staged] : st_->procs) {
            if (staged.dirty) core->put(staged.rec);
        }
        if (!lines.empty()) ++core->commits;
    }
    st_->committed = true;
    st_->finish();
}

bool Transaction::committed() const { return st_ && st_->committed; }

// ---------------- Store ----------------

Store::Store(StoreOptions opts) : core_(std::make_unique<detail::StoreCore>()) {
    if (opts.journal_path.empty()) return;
    core_->journal = std::make_unique<Journal>(opts.journal_path);
    core_->journal->recover([this](const std::vector<RowImage>& batch) { core_->apply(batch); });
    reporting::info("store", "journal " + opts.journal_path + ": " +
                                 std::to_string(core_->journal->batches_recovered()) + " batches, " +
                                 std::to_string(core_->servers.size()) + " servers, " +
                                 std::to_string(core_->processes.size()) + " processes");
}

Store::~Store() = default;

Transaction Store::begin() { return Transaction(core_.get()); }

bool Store::put_server(ServerId id, OwnerId owner, const Resources& total, Timestamp now) {
    {
        std::unique_lock<std::shared_mutex> lk(core_->data_mu);
        if (core_->servers.find(id) == core_->servers.end()) {
            ServerRow row{id, owner, ResourcePool::full(total), true, now};
            core_->append({encode_row(row)});
            core_->put(row);
            ++core_->commits;
            return true;
        }
    }
    auto txn = begin();
    auto row = txn.lock_server(id);
    if (!row || !row->pool.resize(total)) return false;
    row->owner_id = owner;
    row->updated_at = now;
    txn.update_server(*row);
    txn.commit();
    return true;
}

bool Store::set_server_online(ServerId id, bool online, Timestamp now) {
    auto txn = begin();
    auto row = txn.lock_server(id);
    if (!row) return false;
    row->online = online;
    row->updated_at = now;
    txn.update_server(*row);
    txn.commit();
    return true;
}

std::optional<ServerRow> Store::server(ServerId id) const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    auto it = core_->servers.find(id);
    if (it == core_->servers.end()) return std::nullopt;
    return it->second->row;
}

std::vector<ServerRow> Store::servers() const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    std::vector<ServerRow> out;
    out.reserve(core_->servers.size());
    for (const auto& entry : core_->servers) out.push_back(entry.second->row);
    return out;
}

std::optional<ProcessRecord> Store::process(ProcessId id) const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    auto it = core_->processes.find(id);
    if (it == core_->processes.end()) return std::nullopt;
    return it->second->rec;
}

std::vector<ProcessRecord> Store::processes() const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    std::vector<ProcessRecord> out;
    out.reserve(core_->processes.size());
    for (const auto& entry : core_->processes) out.push_back(entry.second->rec);
    return out;
}

std::vector<ProcessRecord> Store::active_processes() const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    std::vector<ProcessRecord> out;
    for (const auto& entry : core_->processes) {
        if (!is_terminal(entry.second->rec.state)) out.push_back(entry.second->rec);
    }
    return out;
}

std::vector<ProcessRecord> Store::processes_for_owner(OwnerId owner) const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    std::vector<ProcessRecord> out;
    for (const auto& entry : core_->processes) {
        if (entry.second->rec.owner_id == owner) out.push_back(entry.second->rec);
    }
    return out;
}

std::vector<AuditViolation> Store::audit() const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    std::map<ServerId, Resources> reserved;
    for (const auto& entry : core_->processes) {
        const auto& rec = entry.second->rec;
        if (holds_reservation(rec.state))
            reserved[rec.gateway_server_id] = reserved[rec.gateway_server_id] + rec.reservation;
    }

    std::vector<AuditViolation> out;
    for (const auto& entry : core_->servers) {
        const auto& row = entry.second->row;
        Resources held = reserved[row.id];
        if (row.pool.available + held != row.pool.total)
            out.push_back({row.id, row.pool.total, row.pool.available, held});
    }
    for (const auto& [id, held] : reserved) {
        if (core_->servers.find(id) == core_->servers.end() && !held.is_zero())
            out.push_back({id, Resources{}, Resources{}, held});
    }
    return out;
}

void Store::compact() {
    std::unique_lock<std::shared_mutex> lk(core_->data_mu);
    if (!core_->journal) return;
    std::vector<std::string> rows;
    rows.reserve(core_->servers.size() + core_->processes.size());
    for (const auto& entry : core_->servers) rows.push_back(encode_row(entry.second->row));
    for (const auto& entry : core_->processes) rows.push_back(encode_row(entry.second->rec));
    core_->journal->write_snapshot(rows);
}

bool Store::durable() const { return core_->journal != nullptr; }

uint64_t Store::commits() const {
    std::shared_lock<std::shared_mutex> lk(core_->data_mu);
    return core_->commits;
}

} // namespace procrt
