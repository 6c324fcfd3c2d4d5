//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <PartitionStore.h>
#include <stdexcept>

namespace skein {

    PartitionStore::Entry& PartitionStore::entry(PartitionID id) {
        auto it = _entries.find(id);
        if(it == _entries.end())
            throw std::out_of_range("unknown partition " + std::to_string(id));
        return it->second;
    }

    const PartitionStore::Entry& PartitionStore::entry(PartitionID id) const {
        auto it = _entries.find(id);
        if(it == _entries.end())
            throw std::out_of_range("unknown partition " + std::to_string(id));
        return it->second;
    }

    void PartitionStore::add(PartitionID id, TaskID producer, size_t outputIndex) {
        if(contains(id))
            throw std::logic_error("partition " + std::to_string(id) + " registered twice");
        Entry e;
        e.ref = PartitionRef(id, producer, outputIndex);
        _entries[id] = e;
    }

    void PartitionStore::checkGarbage(PartitionID id, Entry &e) {
        if(e.ref.state == PartitionState::MATERIALIZED && 0 == e.consumers && 0 == e.pins)
            _garbage.push_back(id);
    }

    void PartitionStore::markMaterializing(PartitionID id) {
        auto& e = entry(id);
        if(e.ref.state == PartitionState::PENDING)
            e.ref.state = PartitionState::MATERIALIZING;
    }

    bool PartitionStore::markMaterialized(const MaterializedPartition &partition) {
        auto& e = entry(partition.id);
        if(e.ref.state == PartitionState::MATERIALIZED || e.ref.state == PartitionState::RELEASED)
            return false;
        e.ref.state = PartitionState::MATERIALIZED;
        e.ref.data = partition.data;
        e.ref.location = partition.location;
        e.ref.numRows = partition.numRows;
        e.ref.numBytes = partition.numBytes;
        checkGarbage(partition.id, e);
        return true;
    }

    bool PartitionStore::markLost(PartitionID id) {
        auto& e = entry(id);
        if(e.ref.state != PartitionState::MATERIALIZED)
            return false;
        e.ref.state = PartitionState::LOST;
        e.ref.data.reset();
        e.ref.location.clear();
        return true;
    }

    void PartitionStore::markPending(PartitionID id) {
        auto& e = entry(id);
        if(e.ref.state == PartitionState::LOST || e.ref.state == PartitionState::RELEASED) {
            e.ref.state = PartitionState::PENDING;
            e.ref.data.reset();
            e.ref.location.clear();
        }
    }

    void PartitionStore::addConsumer(PartitionID id, size_t count) {
        entry(id).consumers += count;
    }

    void PartitionStore::releaseConsumer(PartitionID id) {
        auto& e = entry(id);
        if(0 == e.consumers)
            throw std::logic_error("releasing consumer of partition " + std::to_string(id) + " without consumers");
        e.consumers--;
        checkGarbage(id, e);
    }

    void PartitionStore::pin(PartitionID id) {
        entry(id).pins++;
    }

    void PartitionStore::unpin(PartitionID id) {
        auto& e = entry(id);
        if(0 == e.pins)
            throw std::logic_error("unpinning partition " + std::to_string(id) + " which is not pinned");
        e.pins--;
        checkGarbage(id, e);
    }

    bool PartitionStore::needed(PartitionID id) const {
        auto& e = entry(id);
        return e.consumers > 0 || e.pins > 0;
    }

    std::vector<PartitionID> PartitionStore::collectGarbage() {
        std::vector<PartitionID> released;
        for(auto id : _garbage) {
            auto it = _entries.find(id);
            if(it == _entries.end())
                continue;
            auto& e = it->second;
            // counts may have changed since the entry was queued
            if(e.ref.state != PartitionState::MATERIALIZED || e.consumers > 0 || e.pins > 0)
                continue;
            e.ref.state = PartitionState::RELEASED;
            e.ref.data.reset();
            released.push_back(id);
        }
        _garbage.clear();
        return released;
    }

    std::vector<PartitionID> PartitionStore::releaseAll() {
        std::vector<PartitionID> released;
        for(auto& kv : _entries) {
            auto& ref = kv.second.ref;
            if(ref.state == PartitionState::MATERIALIZED)
                released.push_back(kv.first);
            ref.state = PartitionState::RELEASED;
            ref.data.reset();
            kv.second.consumers = 0;
            kv.second.pins = 0;
        }
        _garbage.clear();
        return released;
    }

    size_t PartitionStore::count(PartitionState state) const {
        size_t n = 0;
        for(const auto& kv : _entries)
            if(kv.second.ref.state == state)
                n++;
        return n;
    }

    size_t PartitionStore::numHeld() const {
        size_t n = 0;
        for(const auto& kv : _entries)
            if(kv.second.ref.data || (kv.second.ref.state == PartitionState::MATERIALIZED && !kv.second.ref.location.empty()))
                n++;
        return n;
    }

    std::vector<PartitionID> PartitionStore::onLocation(const std::string &location) const {
        std::vector<PartitionID> ids;
        for(const auto& kv : _entries)
            if(kv.second.ref.state == PartitionState::MATERIALIZED && kv.second.ref.location == location)
                ids.push_back(kv.first);
        return ids;
    }
}
