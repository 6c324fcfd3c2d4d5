//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <scheduler/ExecutionMetrics.h>
#include <StringUtils.h>
#include <sstream>
#include <iomanip>

namespace skein {

    nlohmann::json ExecutionMetrics::getJSON() const {
        nlohmann::json j;
        j["numTasks"] = numTasks;
        j["numSubmitted"] = numSubmitted;
        j["numSucceeded"] = numSucceeded;
        j["numFailedAttempts"] = numFailedAttempts;
        j["numRetries"] = numRetries;
        j["numTimeouts"] = numTimeouts;
        j["numRecomputed"] = numRecomputed;
        j["numLostPartitions"] = numLostPartitions;
        j["numCancelledTasks"] = numCancelledTasks;
        j["numRuntimeStages"] = numRuntimeStages;
        j["numOutputs"] = numOutputs;
        j["maxInFlight"] = maxInFlight;
        j["wallTime"] = wallTime;
        j["timeToFirstOutput"] = timeToFirstOutput;

        auto stages = nlohmann::json::array();
        for(const auto& kv : _stageMetrics) {
            nlohmann::json s;
            s["stage"] = kv.first;
            s["numTasks"] = kv.second.numTasks;
            s["numSucceeded"] = kv.second.numSucceeded;
            s["taskTime"] = kv.second.taskTime;
            stages.push_back(s);
        }
        j["stages"] = stages;
        return j;
    }

    std::string ExecutionMetrics::summary() const {
        std::stringstream ss;
        ss<<pluralize(numSucceeded, "task")<<" of "<<numTasks<<" succeeded in "
          <<std::fixed<<std::setprecision(3)<<wallTime<<"s, "
          <<pluralize(numSubmitted, "submission")<<", "
          <<numRetries<<" retried, "
          <<numRecomputed<<" recomputed, "
          <<"max "<<maxInFlight<<" in flight";
        return ss.str();
    }
}
