//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_EXECUTIONMETRICS_H
#define SKEIN_EXECUTIONMETRICS_H

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include <Defs.h>

namespace skein {

    // counters of one execution, updated by the scheduler's event loop.
    // When adding a new member variable, make sure to update getJSON as well.
    class ExecutionMetrics {
    private:
        struct StageMetrics {
            size_t numTasks = 0;
            size_t numSucceeded = 0;
            double taskTime = 0.0;  //! sum of reported task runtimes in s
        };
        std::map<StageID, StageMetrics> _stageMetrics;
    public:
        size_t numTasks = 0;            //! tasks known to the scheduler (static + instantiated at runtime)
        size_t numSubmitted = 0;        //! attempts handed to the backend
        size_t numSucceeded = 0;
        size_t numFailedAttempts = 0;
        size_t numRetries = 0;          //! resubmissions after transient failures or timeouts
        size_t numTimeouts = 0;
        size_t numRecomputed = 0;       //! succeeded tasks scheduled again to rematerialize lost partitions
        size_t numLostPartitions = 0;
        size_t numCancelledTasks = 0;
        size_t numRuntimeStages = 0;    //! stages instantiated during execution
        size_t numOutputs = 0;          //! partitions delivered to the stream
        size_t maxInFlight = 0;
        double wallTime = 0.0;          //! in s, until completion, failure or cancellation
        double timeToFirstOutput = 0.0;

        void addStageTasks(StageID stage, size_t n) {
            _stageMetrics[stage].numTasks += n;
            numTasks += n;
        }

        void taskSucceeded(StageID stage, double runtime) {
            auto& m = _stageMetrics[stage];
            m.numSucceeded++;
            m.taskTime += runtime;
            numSucceeded++;
        }

        nlohmann::json getJSON() const;

        /*!
         * one line summary for the log
         */
        std::string summary() const;
    };
}

#endif //SKEIN_EXECUTIONMETRICS_H
