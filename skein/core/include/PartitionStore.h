//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_PARTITIONSTORE_H
#define SKEIN_PARTITIONSTORE_H

#include <unordered_map>
#include <vector>
#include "Partition.h"

namespace skein {

    /*!
     * arena of all partitions of one execution, keyed by id. Each entry carries an explicit dependency count
     * (number of consuming tasks which have not finished yet) and pins (result stream markers, pending stage
     * instantiations). An entry becomes garbage once both drop to zero.
     * Not thread-safe, owned by the scheduler's event loop.
     */
    class PartitionStore {
    private:
        struct Entry {
            PartitionRef ref;
            size_t consumers;
            size_t pins;

            Entry() : consumers(0), pins(0) {}
        };

        std::unordered_map<PartitionID, Entry> _entries;
        std::vector<PartitionID> _garbage;

        Entry& entry(PartitionID id);
        const Entry& entry(PartitionID id) const;
        void checkGarbage(PartitionID id, Entry& e);
    public:
        PartitionStore() = default;
        PartitionStore(const PartitionStore& other) = delete;
        PartitionStore& operator = (const PartitionStore& other) = delete;

        /*!
         * registers a new partition in state PENDING
         */
        void add(PartitionID id, TaskID producer, size_t outputIndex);

        bool contains(PartitionID id) const { return _entries.find(id) != _entries.end(); }

        const PartitionRef& get(PartitionID id) const { return entry(id).ref; }
        PartitionState state(PartitionID id) const { return entry(id).ref.state; }

        void markMaterializing(PartitionID id);

        /*!
         * stores result of the producer. Materialized data never mutates, if the partition is already
         * materialized the call is ignored and false returned.
         */
        bool markMaterialized(const MaterializedPartition& partition);

        /*!
         * data is not available anymore. Only materialized partitions can get lost.
         * @return true if state changed
         */
        bool markLost(PartitionID id);

        /*!
         * partition (lost or released) is going to be recomputed
         */
        void markPending(PartitionID id);

        void addConsumer(PartitionID id, size_t count=1);
        void releaseConsumer(PartitionID id);
        size_t consumers(PartitionID id) const { return entry(id).consumers; }

        void pin(PartitionID id);
        void unpin(PartitionID id);
        size_t pins(PartitionID id) const { return entry(id).pins; }

        /*!
         * whether some consumer or pin still needs this partition
         */
        bool needed(PartitionID id) const;

        /*!
         * releases all materialized partitions with zero consumers and zero pins
         * @return ids of released partitions (backend storage may be freed for them)
         */
        std::vector<PartitionID> collectGarbage();

        /*!
         * releases all partitions regardless of counts (abort/cancel)
         * @return ids of partitions which held data
         */
        std::vector<PartitionID> releaseAll();

        size_t size() const { return _entries.size(); }
        size_t count(PartitionState state) const;

        /*!
         * number of partitions which currently hold data or a remote location
         */
        size_t numHeld() const;

        /*!
         * materialized partitions stored at location
         */
        std::vector<PartitionID> onLocation(const std::string& location) const;
    };
}

#endif //SKEIN_PARTITIONSTORE_H
