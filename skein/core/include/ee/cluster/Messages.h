//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_MESSAGES_H
#define SKEIN_MESSAGES_H

#include <Cluster.pb.h>
#include <Partition.h>
#include <ResourceRequest.h>

namespace skein {

    // conversion between protobuf messages and core types
    extern void fillResources(messages::Resources* msg, const ResourceRequest& request);
    extern void fillResources(messages::Resources* msg, const ResourceSummary& summary);
    extern ResourceRequest requestFromMessage(const messages::Resources& msg);
    extern ResourceSummary summaryFromMessage(const messages::Resources& msg);

    extern void fillPartitionInfo(messages::PartitionInfo* msg, const PartitionRef& ref);
    extern MaterializedPartition partitionFromMessage(const messages::PartitionInfo& msg);

    extern std::string taskStatusToString(messages::TaskStatus status);
}

#endif //SKEIN_MESSAGES_H
