//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <Partition.h>

namespace skein {
    std::string partitionStateToString(PartitionState state) {
        switch(state) {
            case PartitionState::PENDING:
                return "pending";
            case PartitionState::MATERIALIZING:
                return "materializing";
            case PartitionState::MATERIALIZED:
                return "materialized";
            case PartitionState::LOST:
                return "lost";
            case PartitionState::RELEASED:
                return "released";
        }
        return "unknown";
    }
}
