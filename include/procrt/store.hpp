#pragma once
#include "errors.hpp"
#include "process.hpp"
#include "server.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace procrt {

enum class LockMode {
    Blocking,    // wait for the row lock
    SkipLocked,  // give up immediately if another transaction holds it
};

using RowFilter = std::function<bool(const ProcessRecord&)>;

struct StoreOptions {
    std::string journal_path;  // empty keeps everything in memory
};

struct AuditViolation {
    ServerId server_id{};
    Resources total{};
    Resources available{};
    Resources reserved{};  // sum of reservations still held against the server
};

namespace detail {
class StoreCore;
struct TxnState;
}

/// Unit of work against the store. Rows are locked as they are read and stay
/// locked until commit() or destruction; a transaction destroyed without
/// commit() is rolled back and nothing it staged becomes visible.
/// Lock process rows before server rows.
class Transaction {
public:
    Transaction(Transaction&&) noexcept;
    Transaction& operator=(Transaction&&) noexcept;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    ~Transaction();

    // std::nullopt when the row is missing, was skipped, or fails the filter;
    // in all three cases no lock is kept.
    std::optional<ProcessRecord> lock_process(ProcessId id, LockMode mode = LockMode::Blocking,
                                              const RowFilter& filter = {});
    std::optional<ServerRow> lock_server(ServerId id);

    // Assigns the id. The row stays invisible to everyone else until commit.
    ProcessId insert_process(ProcessRecord rec);
    void update_process(const ProcessRecord& rec);
    void update_server(const ServerRow& row);

    // Journals then applies every staged row. Throws StoreError with nothing
    // applied; the transaction is then finished and its locks released.
    void commit();
    bool committed() const;

private:
    friend class Store;
    explicit Transaction(detail::StoreCore* core);
    std::unique_ptr<detail::TxnState> st_;
};

class Store {
public:
    // Recovers from the journal when one is configured; throws StoreError if the
    // snapshot is unreadable or the journal cannot be opened.
    explicit Store(StoreOptions opts = {});
    ~Store();
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    Transaction begin();

    // Inserts a server or replaces its capacity; outstanding reservations are
    // kept, so a new total below what is in use is refused. Throws StoreError.
    bool put_server(ServerId id, OwnerId owner, const Resources& total, Timestamp now);
    bool set_server_online(ServerId id, bool online, Timestamp now);

    std::optional<ServerRow> server(ServerId id) const;
    std::vector<ServerRow> servers() const;
    std::optional<ProcessRecord> process(ProcessId id) const;
    std::vector<ProcessRecord> processes() const;
    std::vector<ProcessRecord> active_processes() const;
    std::vector<ProcessRecord> processes_for_owner(OwnerId owner) const;

    // available + reserved == total for every server, checked on one consistent view.
    std::vector<AuditViolation> audit() const;

    // Writes a compressed snapshot and empties the journal.
    void compact();

    bool durable() const;
    uint64_t commits() const;

private:
    std::unique_ptr<detail::StoreCore> core_;
};

} // namespace procrt
