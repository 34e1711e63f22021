#pragma once

#include <stdint.h>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "key_range.hpp"

namespace libetcdgw {

// Attached to every reply; `revision` is the store-wide logical clock.
struct Header
{
    int64_t revision = 0;
    uint64_t raft_term = 0;
    uint64_t cluster_id = 0;
    uint64_t member_id = 0;
};

struct KeyValue
{
    std::string key;
    std::string value;
    int64_t version = 0;
    int64_t create_revision = 0;
    int64_t mod_revision = 0;
    int64_t lease = 0;
};

struct Status
{
    Header header;
    std::string version;
    int64_t db_size = 0;
    uint64_t leader = 0;
    uint64_t raft_index = 0;
    uint64_t raft_term = 0;
};

// result of a put
struct Revision
{
    Header header;
    std::optional<KeyValue> previous;
};

// result of a delete-range
struct Deleted
{
    Header header;
    int64_t deleted = 0;
    std::vector<KeyValue> previous;
};

// result of a range-get
struct Range
{
    Header header;
    std::vector<KeyValue> kvs;
    int64_t count = 0;
    bool more = false;
};

using OpResult = std::variant<Revision, Deleted, Range>;


struct Comparator
{
    enum class Op
    {
        EQUAL,
        NOT_EQUAL,
        GREATER,
        LESS,
    };

    enum class Target
    {
        VALUE,
        VERSION,
        CREATE,
        MOD,
    };

    std::string key;
    Op op;
    Target target;
    std::string bytes;  // VALUE
    int64_t number;     // VERSION, CREATE, MOD

    Comparator(std::string key_, Op op_, Target target_, std::string bytes_, int64_t number_)
        : key(std::move(key_))
        , op{op_}
        , target{target_}
        , bytes(std::move(bytes_))
        , number{number_}
    {}

    static Comparator value(std::string key, Op op, std::string value)
    {
        return {std::move(key), op, Target::VALUE, std::move(value), 0};
    }

    static Comparator version(std::string key, Op op, int64_t version)
    {
        return {std::move(key), op, Target::VERSION, "", version};
    }

    static Comparator created(std::string key, Op op, int64_t create_revision)
    {
        return {std::move(key), op, Target::CREATE, "", create_revision};
    }

    static Comparator modified(std::string key, Op op, int64_t mod_revision)
    {
        return {std::move(key), op, Target::MOD, "", mod_revision};
    }
};


struct GetOptions
{
    enum class SortOrder
    {
        NONE,
        ASCEND,
        DESCEND,
    };

    enum class SortTarget
    {
        KEY,
        VERSION,
        CREATE,
        MOD,
        VALUE,
    };

    bool count_only = false;
    bool keys_only = false;
    int64_t limit = 0;
    int64_t revision = 0;
    int64_t min_create_revision = 0;
    int64_t max_create_revision = 0;
    int64_t min_mod_revision = 0;
    int64_t max_mod_revision = 0;
    bool serializable = false;
    SortOrder sort_order = SortOrder::NONE;
    SortTarget sort_target = SortTarget::KEY;
};

struct OpGet
{
    KeyRange range;
    GetOptions options;

    explicit OpGet(KeyRange range_, GetOptions options_ = {})
        : range(std::move(range_))
        , options(std::move(options_))
    {}
};

struct OpSet
{
    std::string key;
    std::string value;
    int64_t lease;
    bool return_previous;

    OpSet(std::string key_, std::string value_, int64_t lease_ = 0, bool return_previous_ = false)
        : key(std::move(key_))
        , value(std::move(value_))
        , lease{lease_}
        , return_previous{return_previous_}
    {}
};

struct OpDel
{
    KeyRange range;
    bool return_previous;

    explicit OpDel(KeyRange range_, bool return_previous_ = false)
        : range(std::move(range_))
        , return_previous{return_previous_}
    {}
};

using Operation = std::variant<OpGet, OpSet, OpDel>;

// Comparators are conjoined; `success` runs when all of them hold, `failure`
// otherwise.
struct Transaction
{
    std::vector<Comparator> compare;
    std::vector<Operation> success;
    std::vector<Operation> failure;
};

// Outcome of a submit. `responses` come from whichever branch the store ran,
// in branch order.
struct TxnOutcome
{
    bool succeeded = false;
    Header header;
    std::vector<OpResult> responses;

    operator bool() const { return succeeded; }

    const TxnOutcome& ensure_succeeded() const
    {
        if (!succeeded)
            throw TxnFailed(header.revision);
        return *this;
    }
};

} // namespace libetcdgw
