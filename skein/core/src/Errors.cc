//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <Errors.h>
#include <StringUtils.h>
#include <sstream>

namespace skein {

    std::string failureKindToString(FailureKind kind) {
        switch(kind) {
            case FailureKind::TRANSIENT:
                return "transient";
            case FailureKind::TERMINAL:
                return "terminal";
            case FailureKind::INPUT_LOST:
                return "input lost";
            case FailureKind::TIMEOUT:
                return "timeout";
            case FailureKind::CANCELLED:
                return "cancelled";
            case FailureKind::UNSATISFIABLE:
                return "unsatisfiable";
            default:
                return "unknown";
        }
    }

    std::string TaskFailure::toString() const {
        std::stringstream ss;
        ss<<"attempt "<<attempt<<" of task "<<taskID<<" failed ("<<failureKindToString(kind)<<")";
        if(!worker.empty())
            ss<<" on "<<worker;
        if(!message.empty())
            ss<<": "<<message;
        return ss.str();
    }

    static std::string describeTerminal(const std::string& message, const TaskFailureContext& context) {
        std::stringstream ss;
        ss<<message<<" [task "<<context.taskID<<", stage "<<context.stageID
          <<", partition "<<context.partitionIndex;
        if(!context.operators.empty())
            ss<<", operators "<<join(context.operators, " -> ");
        if(!context.history.empty())
            ss<<", "<<pluralize(context.history.size(), "failed attempt");
        ss<<"]";
        return ss.str();
    }

    TaskTerminalError::TaskTerminalError(const std::string &message,
                                         const TaskFailureContext &context) : SkeinException(describeTerminal(message, context)),
                                         _context(context) {}
}
