//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ee/cluster/Messages.h>

namespace skein {

    void fillResources(messages::Resources* msg, const ResourceRequest& request) {
        msg->set_num_cpus(request.numCPUs());
        msg->set_num_gpus(request.numGPUs());
        msg->set_has_memory(request.memoryBytes().has_value());
        msg->set_memory_bytes(request.memoryBytes().has_value() ? request.memoryBytes().value() : 0);
    }

    void fillResources(messages::Resources* msg, const ResourceSummary& summary) {
        msg->set_num_cpus(summary.cpus);
        msg->set_num_gpus(summary.gpus);
        msg->set_memory_bytes(summary.memory);
        msg->set_has_memory(true);
    }

    ResourceRequest requestFromMessage(const messages::Resources& msg) {
        option<size_t> memory;
        if(msg.has_memory())
            memory = static_cast<size_t>(msg.memory_bytes());
        return ResourceRequest(msg.num_cpus(), msg.num_gpus(), memory);
    }

    ResourceSummary summaryFromMessage(const messages::Resources& msg) {
        return ResourceSummary(msg.num_cpus(), msg.num_gpus(), msg.memory_bytes());
    }

    void fillPartitionInfo(messages::PartitionInfo* msg, const PartitionRef& ref) {
        msg->set_id(ref.id);
        msg->set_location(ref.location);
        if(ref.numRows.has_value())
            msg->set_num_rows(ref.numRows.value());
        if(ref.numBytes.has_value())
            msg->set_num_bytes(ref.numBytes.value());
    }

    MaterializedPartition partitionFromMessage(const messages::PartitionInfo& msg) {
        MaterializedPartition p;
        p.id = msg.id();
        p.location = msg.location();
        p.numRows = static_cast<size_t>(msg.num_rows());
        p.numBytes = static_cast<size_t>(msg.num_bytes());
        return p;
    }

    std::string taskStatusToString(messages::TaskStatus status) {
        return messages::TaskStatus_Name(status);
    }
}
