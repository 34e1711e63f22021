#pragma once

#include <stdint.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codecs.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "key_range.hpp"
#include "util.hpp"

namespace libetcdgw {

namespace detail {

// selects the reserved slot 0
struct MetadataSlot {};

} // namespace detail

template<class K, class V>
struct Selection
{
    std::vector<K> keys;
    std::vector<V> values;
};

// Secondary index of a PersistentMap<K, V>, kept up to date from inside the
// primary map's writes.
template<class K, class V>
class Index
{
public:
    virtual const std::string& name() const = 0;

    virtual void on_put(DbTransaction &txn, const K &key, const std::optional<V> &previous, const V &value) = 0;

    virtual void on_erase(DbTransaction &txn, const K &key, const V &value) = 0;

    virtual int64_t truncate(DbTransaction &txn) = 0;

    virtual ~Index() = default;
};

template<class K, class V, class IK>
class TypedIndex;


// Typed map stored in the flat keyspace under a two-byte slot prefix:
// physical key = big-endian slot ++ encoded key. All access goes through a
// DbTransaction, so primary and index entries commit together.
template<class K, class V>
class PersistentMap
{
public:
    using key_type = K;
    using value_type = V;

private:
    uint16_t slot_;
    std::shared_ptr<const KeyCodec<K>> key_codec_;
    std::shared_ptr<const ValueCodec<V>> value_codec_;
    Compression compression_;
    std::map<std::string, std::unique_ptr<Index<K, V>>> indexes_;


    std::string prefix_() const { return util::pack_u16(slot_); }

    std::string slot_end_() const
    {
        if (slot_ == 0xFFFF)
            return std::string(1, '\0');
        return util::pack_u16(static_cast<uint16_t>(slot_ + 1));
    }

    K decode_key_(std::string_view physical) const
    {
        if (physical.size() < 2)
            throw CodecError("physical key shorter than its slot prefix");
        physical.remove_prefix(2);
        return key_codec_->decode(physical);
    }

    V decode_value_(std::string_view data) const
    {
        return value_codec_->decode(decompress(data, compression_));
    }

    Index<K, V>& index_(const std::string &name) const
    {
        auto it = indexes_.find(name);
        if (it == indexes_.end())
            throw InvalidArgument("no index named '" + name + "' is attached");
        return *it->second;
    }

    void validate_codecs_() const
    {
        if (!key_codec_ || !value_codec_)
            throw InvalidArgument("persistent map needs both a key and a value codec");
    }

public:
    PersistentMap(uint16_t slot, std::shared_ptr<const KeyCodec<K>> key_codec,
                  std::shared_ptr<const ValueCodec<V>> value_codec, Compression compression = Compression::NONE)
        : slot_{slot}
        , key_codec_(std::move(key_codec))
        , value_codec_(std::move(value_codec))
        , compression_{compression}
    {
        if (slot_ == 0)
            throw InvalidArgument("slot 0 is reserved for the slot table");
        validate_codecs_();
    }

    PersistentMap(detail::MetadataSlot, std::shared_ptr<const KeyCodec<K>> key_codec,
                  std::shared_ptr<const ValueCodec<V>> value_codec)
        : slot_{0}
        , key_codec_(std::move(key_codec))
        , value_codec_(std::move(value_codec))
        , compression_{Compression::NONE}
    {
        validate_codecs_();
    }

    PersistentMap(const PersistentMap &) = delete;
    PersistentMap& operator =(const PersistentMap &) = delete;

    uint16_t slot() const { return slot_; }

    Compression compression() const { return compression_; }

    std::string physical_key(const K &key) const { return prefix_() + key_codec_->encode(key); }

    // the whole slot
    KeyRange key_range() const { return KeyRange::range(prefix_(), slot_end_()); }

    std::optional<V> get(DbTransaction &txn, const K &key) const
    {
        auto data = txn.get(physical_key(key));
        if (!data)
            return std::nullopt;
        return decode_value_(*data);
    }

    void put(DbTransaction &txn, const K &key, const V &value)
    {
        std::optional<V> previous;
        if (!indexes_.empty())
            previous = get(txn, key);

        txn.put(physical_key(key), compress(value_codec_->encode(value), compression_));

        for (auto &[_, index] : indexes_)
            index->on_put(txn, key, previous, value);
    }

    // Entries of indexes attached to the map are removed as well, which takes
    // a read of the current value.
    void erase(DbTransaction &txn, const K &key)
    {
        std::optional<V> previous;
        if (!indexes_.empty())
            previous = get(txn, key);

        txn.erase(physical_key(key));

        if (previous) {
            for (auto &[_, index] : indexes_)
                index->on_erase(txn, key, *previous);
        }
    }

    // Entries with from <= key < to, ordered by encoded key. Missing bounds
    // default to the ends of the slot; a zero limit means no limit.
    Selection<K, V> select(DbTransaction &txn, const std::optional<K> &from = std::nullopt,
                           const std::optional<K> &to = std::nullopt, bool return_keys = true,
                           bool return_values = true, size_t limit = 0) const
    {
        auto range = KeyRange::range(from ? physical_key(*from) : prefix_(),
                                     to ? physical_key(*to) : slot_end_());

        Selection<K, V> selection;
        size_t taken = 0;
        for (const auto &[physical, data] : txn.scan(range)) {
            if (limit && taken == limit)
                break;
            ++taken;
            if (return_keys)
                selection.keys.push_back(decode_key_(physical));
            if (return_values)
                selection.values.push_back(decode_value_(data));
        }
        return selection;
    }

    // Entries whose encoded key starts with the encoding of `prefix`.
    int64_t count(DbTransaction &txn, const std::optional<K> &prefix = std::nullopt) const
    {
        if (!prefix)
            return txn.count(key_range());

        auto start = physical_key(*prefix);
        auto end = util::successor_of_prefix(start);
        return txn.count(KeyRange::range(std::move(start), end.empty() ? std::string(1, '\0') : std::move(end)));
    }

    // Deletes every entry of the slot and returns how many there were. Unless
    // `rebuild_indexes` is false the attached indexes are emptied too.
    int64_t truncate(DbTransaction &txn, bool rebuild_indexes = true)
    {
        auto entries = txn.scan(key_range());
        for (const auto &entry : entries)
            txn.erase(entry.first);

        if (rebuild_indexes) {
            for (auto &[_, index] : indexes_)
                index->truncate(txn);
        }
        return static_cast<int64_t>(entries.size());
    }

    // Bookkeeping only: existing entries are not indexed until rebuild_index.
    template<class IK>
    void attach_index(const std::string &name, std::shared_ptr<PersistentMap<IK, K>> target,
                      std::function<std::optional<IK>(const V &)> fkey)
    {
        if (!target)
            throw InvalidArgument("index '" + name + "' needs a target map");
        if (!fkey)
            throw InvalidArgument("index '" + name + "' needs a key function");
        if (indexes_.count(name))
            throw InvalidArgument("index '" + name + "' is already attached");

        indexes_.emplace(name, std::make_unique<TypedIndex<K, V, IK>>(name, std::move(target), std::move(fkey)));
    }

    void detach_index(const std::string &name)
    {
        if (!indexes_.erase(name))
            throw InvalidArgument("no index named '" + name + "' is attached");
    }

    std::vector<std::string> indexes() const
    {
        std::vector<std::string> names;
        for (const auto &entry : indexes_)
            names.push_back(entry.first);
        return names;
    }

    // Empties the index and repopulates it from every primary entry.
    int64_t rebuild_index(DbTransaction &txn, const std::string &name)
    {
        auto &index = index_(name);
        index.truncate(txn);

        auto selection = select(txn);
        for (size_t i = 0; i < selection.keys.size(); ++i)
            index.on_put(txn, selection.keys[i], std::nullopt, selection.values[i]);
        return static_cast<int64_t>(selection.keys.size());
    }

    int64_t rebuild_indexes(DbTransaction &txn)
    {
        int64_t total = 0;
        for (const auto &entry : indexes_)
            total += rebuild_index(txn, entry.first);
        return total;
    }
};


// Index whose entries live in a PersistentMap<IK, K>: fkey(value) -> key.
// Values for which fkey yields nothing are not indexed.
template<class K, class V, class IK>
class TypedIndex : public Index<K, V>
{
    std::string name_;
    std::shared_ptr<PersistentMap<IK, K>> target_;
    std::function<std::optional<IK>(const V &)> fkey_;

    // the entry may already point at another record that took the index key
    void erase_if_owned_(DbTransaction &txn, const IK &index_key, const K &key)
    {
        auto owner = target_->get(txn, index_key);
        if (owner && *owner == key)
            target_->erase(txn, index_key);
    }

public:
    TypedIndex(std::string name, std::shared_ptr<PersistentMap<IK, K>> target,
               std::function<std::optional<IK>(const V &)> fkey)
        : name_(std::move(name))
        , target_(std::move(target))
        , fkey_(std::move(fkey))
    {}

    const std::string& name() const override { return name_; }

    void on_put(DbTransaction &txn, const K &key, const std::optional<V> &previous, const V &value) override
    {
        auto index_key = fkey_(value);

        if (previous) {
            auto stale = fkey_(*previous);
            if (stale && (!index_key || target_->physical_key(*stale) != target_->physical_key(*index_key)))
                erase_if_owned_(txn, *stale, key);
        }

        if (index_key)
            target_->put(txn, *index_key, key);
    }

    void on_erase(DbTransaction &txn, const K &key, const V &value) override
    {
        if (auto index_key = fkey_(value))
            erase_if_owned_(txn, *index_key, key);
    }

    int64_t truncate(DbTransaction &txn) override
    {
        return target_->truncate(txn, true);
    }
};


template<class KC, class VC>
std::shared_ptr<PersistentMap<typename KC::key_type, typename VC::value_type>>
make_map(uint16_t slot, Compression compression = Compression::NONE)
{
    return std::make_shared<PersistentMap<typename KC::key_type, typename VC::value_type>>(
        slot, std::make_shared<KC>(), std::make_shared<VC>(), compression);
}

using MapStringString = PersistentMap<std::string, std::string>;
using MapStringUuid = PersistentMap<std::string, Uuid>;
using MapStringOid = PersistentMap<std::string, uint64_t>;
using MapUuidString = PersistentMap<Uuid, std::string>;
using MapUuidUuid = PersistentMap<Uuid, Uuid>;
using MapUuidOid = PersistentMap<Uuid, uint64_t>;
using MapOidString = PersistentMap<uint64_t, std::string>;
using MapOidOid = PersistentMap<uint64_t, uint64_t>;
using MapUuidUuidSet = PersistentMap<Uuid, std::set<Uuid>>;
using MapUuidStringUuid = PersistentMap<std::pair<Uuid, std::string>, Uuid>;
using MapUuidUuidUuid = PersistentMap<std::pair<Uuid, Uuid>, Uuid>;
template<class M> using MapUuidProto = PersistentMap<Uuid, M>;
template<class M> using MapOidProto = PersistentMap<uint64_t, M>;
template<class M> using MapStringProto = PersistentMap<std::string, M>;
template<class M> using MapUuidJson = PersistentMap<Uuid, M>;

inline auto map_string_string(uint16_t slot, Compression c = Compression::NONE) { return make_map<StringCodec, StringCodec>(slot, c); }
inline auto map_string_uuid(uint16_t slot, Compression c = Compression::NONE) { return make_map<StringCodec, UuidCodec>(slot, c); }
inline auto map_string_oid(uint16_t slot, Compression c = Compression::NONE) { return make_map<StringCodec, OidCodec>(slot, c); }
inline auto map_uuid_string(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidCodec, StringCodec>(slot, c); }
inline auto map_uuid_uuid(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidCodec, UuidCodec>(slot, c); }
inline auto map_uuid_oid(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidCodec, OidCodec>(slot, c); }
inline auto map_oid_string(uint16_t slot, Compression c = Compression::NONE) { return make_map<OidCodec, StringCodec>(slot, c); }
inline auto map_oid_oid(uint16_t slot, Compression c = Compression::NONE) { return make_map<OidCodec, OidCodec>(slot, c); }
inline auto map_uuid_uuid_set(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidCodec, UuidSetCodec>(slot, c); }
inline auto map_uuid_string_uuid(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidStringCodec, UuidCodec>(slot, c); }
inline auto map_uuid_uuid_uuid(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidUuidCodec, UuidCodec>(slot, c); }

template<class M>
auto map_uuid_proto(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidCodec, ProtoCodec<M>>(slot, c); }

template<class M>
auto map_oid_proto(uint16_t slot, Compression c = Compression::NONE) { return make_map<OidCodec, ProtoCodec<M>>(slot, c); }

template<class M>
auto map_string_proto(uint16_t slot, Compression c = Compression::NONE) { return make_map<StringCodec, ProtoCodec<M>>(slot, c); }

template<class M>
auto map_uuid_json(uint16_t slot, Compression c = Compression::NONE) { return make_map<UuidCodec, JsonCodec<M>>(slot, c); }

} // namespace libetcdgw
