#pragma once

#include <libetcdgw/slot.pb.h>

#include <stdint.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "codecs.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "pmap.hpp"

namespace libetcdgw {

// Binds a stable map identity to the numeric slot its entries live under.
struct Slot
{
    Uuid oid;
    uint16_t slot = 0;
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    std::string creator;
};

// Metadata table at slot 0, keyed by slot index.
class SlotTable
{
    using Records = PersistentMap<uint16_t, pb::SlotRecord>;

    std::shared_ptr<Records> records_;

    static pb::SlotRecord to_record_(const Slot &slot)
    {
        pb::SlotRecord record;
        record.set_oid(UuidCodec{}.encode(slot.oid));
        record.set_slot(slot.slot);
        record.set_name(slot.name);
        record.set_description(slot.description);
        for (const auto &tag : slot.tags)
            record.add_tags(tag);
        record.set_creator(slot.creator);
        return record;
    }

    static Slot from_record_(const pb::SlotRecord &record)
    {
        if (record.slot() == 0 || record.slot() > 0xFFFF)
            throw CodecError("slot record carries invalid slot index " + std::to_string(record.slot()));

        Slot slot;
        slot.oid = UuidCodec{}.decode(record.oid());
        slot.slot = static_cast<uint16_t>(record.slot());
        slot.name = record.name();
        slot.description = record.description();
        slot.tags.assign(record.tags().begin(), record.tags().end());
        slot.creator = record.creator();
        return slot;
    }

public:
    SlotTable()
        : records_(std::make_shared<Records>(detail::MetadataSlot{}, std::make_shared<Uint16Codec>(),
                                             std::make_shared<ProtoCodec<pb::SlotRecord>>()))
    {}

    // Creates or replaces the record of `slot.slot`.
    void put(DbTransaction &txn, const Slot &slot)
    {
        if (slot.slot == 0)
            throw InvalidArgument("slot index must be in [1, 65535]");

        if (auto bound = find(txn, slot.oid); bound && bound->slot != slot.slot)
            throw InvalidArgument("map is already bound to slot " + std::to_string(bound->slot));

        records_->put(txn, slot.slot, to_record_(slot));
    }

    std::optional<Slot> get(DbTransaction &txn, uint16_t index) const
    {
        auto record = records_->get(txn, index);
        if (!record)
            return std::nullopt;
        return from_record_(*record);
    }

    std::optional<Slot> find(DbTransaction &txn, const Uuid &oid) const
    {
        for (const auto &slot : list(txn)) {
            if (slot.oid == oid)
                return slot;
        }
        return std::nullopt;
    }

    std::vector<Slot> list(DbTransaction &txn) const
    {
        std::vector<Slot> slots;
        for (const auto &record : records_->select(txn, std::nullopt, std::nullopt, false, true).values)
            slots.push_back(from_record_(record));
        return slots;
    }

    void erase(DbTransaction &txn, uint16_t index)
    {
        records_->erase(txn, index);
    }

    // lowest unused index
    uint16_t next_free_index(DbTransaction &txn) const
    {
        uint16_t candidate = 1;
        for (const auto &index : records_->select(txn, std::nullopt, std::nullopt, true, false).keys) {
            if (index != candidate)
                break;
            if (candidate == 0xFFFF)
                throw InvalidArgument("all slots are in use");
            ++candidate;
        }
        return candidate;
    }
};

} // namespace libetcdgw
