//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <physical/Task.h>
#include <StringUtils.h>

namespace skein {

    std::string taskStateToString(TaskState state) {
        switch(state) {
            case TaskState::PENDING:
                return "pending";
            case TaskState::READY:
                return "ready";
            case TaskState::SUBMITTED:
                return "submitted";
            case TaskState::RUNNING:
                return "running";
            case TaskState::SUCCEEDED:
                return "succeeded";
            case TaskState::FAILED:
                return "failed";
            case TaskState::CANCELLED:
                return "cancelled";
        }
        return "unknown";
    }

    std::string Task::description() const {
        return "task " + std::to_string(id) + " (stage " + std::to_string(stage) + ", partition " +
               std::to_string(partitionIndex) + ": " + join(operatorNames, "->") + ")";
    }
}
