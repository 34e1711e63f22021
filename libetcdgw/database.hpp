#pragma once

#include <glog/logging.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "client.hpp"
#include "errors.hpp"
#include "key_range.hpp"
#include "types.hpp"

namespace libetcdgw {

// Caller-owned counters of buffered writes.
struct TransactionStats
{
    uint64_t puts = 0;
    uint64_t dels = 0;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    std::chrono::steady_clock::duration duration() const
    {
        return std::chrono::steady_clock::now() - started;
    }

    void reset()
    {
        puts = 0;
        dels = 0;
        started = std::chrono::steady_clock::now();
    }
};


// A unit of work over the store. Reads are served at the revision captured
// when the transaction was opened; writes are buffered and sent as a single
// store transaction on commit, guarded by comparisons that fail if any key
// the transaction read or wrote was modified after that revision.
class DbTransaction
{
public:
    using Duration = std::chrono::milliseconds;

    enum class State
    {
        CREATED,
        OPEN,
        COMMITTED,
        ABORTED,
    };

private:
    std::shared_ptr<Client> client_;
    bool write_;
    TransactionStats *stats_;
    Duration timeout_;

    State state_ = State::CREATED;
    int64_t base_revision_ = 0;
    std::optional<int64_t> committed_revision_;

    // physical key -> value to put, or nullopt to delete
    std::map<std::string, std::optional<std::string>> buffer_;
    // physical key -> create revision observed at base_revision_ (0: absent)
    std::map<std::string, int64_t> reads_;


    const std::string& tag_() const { return client_->observability().tag; }

    void ensure_open_() const
    {
        if (state_ != State::OPEN)
            throw InvalidTxnState("transaction is not open");
    }

    void ensure_writable_() const
    {
        ensure_open_();
        if (!write_)
            throw InvalidTxnState("transaction is read-only");
    }

    void track_read_(const std::string &key, int64_t create_revision)
    {
        reads_.emplace(key, create_revision);
    }

    GetOptions at_base_(GetOptions options = {}) const
    {
        options.revision = base_revision_;
        return options;
    }

    Transaction build_commit_() const
    {
        Transaction txn;

        std::set<std::string> touched;
        for (const auto &entry : buffer_)
            touched.insert(entry.first);
        for (const auto &entry : reads_)
            touched.insert(entry.first);

        for (const auto &key : touched)
            txn.compare.push_back(Comparator::modified(key, Comparator::Op::LESS, base_revision_ + 1));
        for (const auto &[key, create_revision] : reads_)
            txn.compare.push_back(Comparator::created(key, Comparator::Op::EQUAL, create_revision));

        for (const auto &[key, value] : buffer_) {
            if (value)
                txn.success.emplace_back(OpSet(key, *value));
            else
                txn.success.emplace_back(OpDel(KeyRange::single(key)));
        }
        return txn;
    }

public:
    DbTransaction(std::shared_ptr<Client> client, bool write, TransactionStats *stats = nullptr,
                  Duration timeout = Duration::zero())
        : client_(std::move(client))
        , write_{write}
        , stats_{stats}
        , timeout_{timeout}
    {}

    DbTransaction(const DbTransaction &) = delete;
    DbTransaction& operator =(const DbTransaction &) = delete;
    DbTransaction(DbTransaction &&) = default;
    DbTransaction& operator =(DbTransaction &&) = default;

    // Captures the base revision. A transaction is opened exactly once.
    void open()
    {
        if (state_ != State::CREATED)
            throw InvalidTxnState("transaction scope may be entered only once");

        base_revision_ = client_->status(timeout_).header.revision;
        state_ = State::OPEN;
    }

    State state() const { return state_; }

    bool writable() const { return write_; }

    int64_t base_revision() const { return base_revision_; }

    const std::optional<int64_t>& committed_revision() const { return committed_revision_; }

    size_t pending() const { return buffer_.size(); }

    std::optional<std::string> get(const std::string &key)
    {
        ensure_open_();

        if (auto it = buffer_.find(key); it != buffer_.end())
            return it->second;

        auto range = client_->get(KeyRange::single(key), at_base_(), timeout_);
        if (range.kvs.empty()) {
            track_read_(key, 0);
            return std::nullopt;
        }

        track_read_(key, range.kvs.front().create_revision);
        return std::move(range.kvs.front().value);
    }

    // Entries of `range` as this transaction sees them, ordered by key.
    std::vector<std::pair<std::string, std::string>> scan(const KeyRange &range)
    {
        ensure_open_();

        std::map<std::string, std::string> entries;
        for (auto &kv : client_->get(range, at_base_(), timeout_).kvs) {
            track_read_(kv.key, kv.create_revision);
            entries.emplace(std::move(kv.key), std::move(kv.value));
        }

        for (const auto &[key, value] : buffer_) {
            if (!range.contains(key))
                continue;
            if (value)
                entries[key] = *value;
            else
                entries.erase(key);
        }

        return {entries.begin(), entries.end()};
    }

    int64_t count(const KeyRange &range)
    {
        ensure_open_();

        for (const auto &entry : buffer_) {
            if (range.contains(entry.first))
                return static_cast<int64_t>(scan(range).size());
        }

        GetOptions options;
        options.count_only = true;
        return client_->get(range, at_base_(options), timeout_).count;
    }

    void put(const std::string &key, std::string value)
    {
        ensure_writable_();
        buffer_[key] = std::move(value);
        if (stats_)
            stats_->puts++;
    }

    void erase(const std::string &key)
    {
        ensure_writable_();
        buffer_[key] = std::nullopt;
        if (stats_)
            stats_->dels++;
    }

    // Sends the buffer as one store transaction. Nothing is applied and
    // TxnFailed is raised if another writer got in first.
    void commit()
    {
        ensure_open_();

        if (buffer_.empty()) {
            state_ = State::COMMITTED;
            return;
        }

        TxnOutcome outcome;
        try {
            outcome = client_->submit(build_commit_(), timeout_);
        } catch (const Error &) {
            state_ = State::ABORTED;
            buffer_.clear();
            throw;
        }

        buffer_.clear();
        if (!outcome) {
            state_ = State::ABORTED;
            VLOG(1) << "[" << tag_() << "] transaction based on revision " << base_revision_
                    << " lost to a concurrent writer at revision " << outcome.header.revision;
            throw TxnFailed(outcome.header.revision);
        }

        committed_revision_ = outcome.header.revision;
        state_ = State::COMMITTED;
        VLOG(1) << "[" << tag_() << "] transaction committed at revision " << *committed_revision_;
    }

    // Drops the buffer without contacting the store.
    void rollback() noexcept
    {
        if (state_ == State::COMMITTED || state_ == State::ABORTED)
            return;
        buffer_.clear();
        state_ = State::ABORTED;
    }
};


// Rolls the transaction back unless it was committed through the guard.
class TransactionGuard
{
    DbTransaction &txn_;

public:
    explicit TransactionGuard(DbTransaction &txn) : txn_(txn) {}

    TransactionGuard(const TransactionGuard &) = delete;
    TransactionGuard& operator =(const TransactionGuard &) = delete;

    void commit() { txn_.commit(); }

    ~TransactionGuard() { txn_.rollback(); }
};


class Database
{
    std::shared_ptr<Client> client_;
    bool readonly_;

public:
    explicit Database(std::shared_ptr<Client> client, bool readonly = false)
        : client_(std::move(client))
        , readonly_{readonly}
    {
        if (!client_)
            throw InvalidArgument("client must not be null");
    }

    const std::shared_ptr<Client>& client() const { return client_; }

    bool readonly() const { return readonly_; }

    Status status() { return client_->status(); }

    DbTransaction begin(bool write = false, TransactionStats *stats = nullptr,
                        DbTransaction::Duration timeout = DbTransaction::Duration::zero())
    {
        if (write && readonly_)
            throw InvalidArgument("database is opened read-only");

        DbTransaction txn(client_, write, stats, timeout);
        txn.open();
        return txn;
    }

    // Runs `fn(txn)` and commits; any exception leaving `fn` rolls back.
    template<class Fn>
    auto run(Fn &&fn, bool write = false, TransactionStats *stats = nullptr)
    {
        auto txn = begin(write, stats);
        TransactionGuard guard(txn);

        if constexpr (std::is_void_v<std::invoke_result_t<Fn &, DbTransaction &>>) {
            fn(txn);
            guard.commit();
        } else {
            auto result = fn(txn);
            guard.commit();
            return result;
        }
    }
};

} // namespace libetcdgw
