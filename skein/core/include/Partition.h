//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_PARTITION_H
#define SKEIN_PARTITION_H

#include <memory>
#include <string>
#include <vector>
#include <Utils.h>
#include <optional.h>
#include "Defs.h"

namespace skein {

    /*!
     * an immutable chunk of data produced by a compute kernel. The core never interprets the bytes,
     * kernels agree on their format. Shared read-only across threads via PartitionPtr.
     */
    class Partition {
    private:
        std::vector<uint8_t> _buffer;
        size_t _numRows;
        uniqueid_t _uuid;
    public:
        Partition(std::vector<uint8_t> buffer, size_t numRows) : _buffer(std::move(buffer)),
        _numRows(numRows), _uuid(getUniqueID()) {}

        Partition(const Partition& other) = delete;
        Partition& operator = (const Partition& other) = delete;

        const uint8_t* data() const { return _buffer.data(); }
        const std::vector<uint8_t>& buffer() const { return _buffer; }
        size_t size() const { return _buffer.size(); }
        size_t numRows() const { return _numRows; }
        uniqueid_t uuid() const { return _uuid; }
    };

    using PartitionPtr = std::shared_ptr<const Partition>;

    enum class PartitionState {
        PENDING,        //! producer has not run yet
        MATERIALIZING,  //! producer is running
        MATERIALIZED,   //! data available, never mutates
        LOST,           //! data was materialized once, but is not available anymore
        RELEASED        //! no consumer needs the data anymore, storage was freed
    };

    extern std::string partitionStateToString(PartitionState state);

    /*!
     * handle to a (possibly not yet resident) partition
     */
    struct PartitionRef {
        PartitionID id;
        PartitionState state;
        TaskID producer;            //! task producing this partition
        size_t outputIndex;         //! which output of the producer
        option<size_t> numRows;     //! size estimates, known once materialized
        option<size_t> numBytes;
        PartitionPtr data;          //! resident data, may be null for remote partitions
        std::string location;       //! where remote data lives, empty for local partitions

        PartitionRef() : id(INVALID_PARTITION), state(PartitionState::PENDING), producer(INVALID_TASK), outputIndex(0) {}
        PartitionRef(PartitionID id, TaskID producer, size_t outputIndex) : id(id), state(PartitionState::PENDING),
        producer(producer), outputIndex(outputIndex) {}

        bool materialized() const { return state == PartitionState::MATERIALIZED; }
        bool resident() const { return data != nullptr; }
    };

    /*!
     * description of a partition which was just materialized by a backend
     */
    struct MaterializedPartition {
        PartitionID id;
        PartitionPtr data;
        std::string location;
        option<size_t> numRows;
        option<size_t> numBytes;

        MaterializedPartition() : id(INVALID_PARTITION) {}
        MaterializedPartition(PartitionID id, const PartitionPtr& data) : id(id), data(data) {
            if(data) {
                numRows = data->numRows();
                numBytes = data->size();
            }
        }
    };
}

#endif //SKEIN_PARTITION_H
