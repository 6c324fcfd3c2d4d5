//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_DEFS_H
#define SKEIN_DEFS_H

#include <cstdint>
#include <cstddef>

namespace skein {

    using TaskID = int64_t;
    using StageID = int64_t;
    using PartitionID = int64_t;
    using OperatorID = int64_t;

    const TaskID INVALID_TASK = -1;
    const StageID INVALID_STAGE = -1;
    const PartitionID INVALID_PARTITION = -1;

    // partition count of an exchange operator which is decided at runtime (or from configuration)
    const int64_t AUTO_PARTITIONS = 0;
}

#endif //SKEIN_DEFS_H
