//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_SCHEDULER_H
#define SKEIN_SCHEDULER_H

#include <chrono>
#include <deque>
#include <exception>
#include <map>
#include <set>
#include <ContextOptions.h>
#include <PartitionStore.h>
#include <ee/IBackend.h>
#include <physical/StageGraph.h>
#include "ExecutionMetrics.h"
#include "RetryPolicy.h"
#include "SchedulerEvent.h"

namespace skein {

    enum class ExecutionStatus {
        RUNNING,
        SUCCEEDED,  //! all root partitions were delivered
        FAILED,
        CANCELLED
    };

    extern std::string executionStatusToString(ExecutionStatus status);

    /*!
     * drives a stage graph to completion on a backend. A single-threaded cooperative event loop, run by the
     * thread pulling results: tasks become ready once all their inputs are materialized, are submitted within a
     * window bounded by max-concurrent-tasks and the backend's advertised capacity, and are retried, recomputed
     * or aborted depending on how they fail. Backend threads only push events into the channel.
     */
    class Scheduler {
    public:
        using clock = std::chrono::steady_clock;

        Scheduler(const ContextOptions& options, const std::shared_ptr<IBackend>& backend,
                  const std::shared_ptr<const StageGraph>& graph);
        ~Scheduler();

        Scheduler(const Scheduler& other) = delete;
        Scheduler& operator = (const Scheduler& other) = delete;

        /*!
         * one iteration of the event loop: waits up to timeout for backend events, processes them and
         * submits ready tasks
         * @param timeout max time to wait for an event in s
         * @return false if the execution is finished (succeeded, failed or cancelled)
         */
        bool step(double timeout);

        /*!
         * blocks until the next root partition is available
         * @return partition, nullptr once all partitions were delivered or after the failure was reported.
         * Throws TaskTerminalError/ResourceUnsatisfiable/CancellationError once when the execution failed or got cancelled.
         */
        PartitionPtr nextOutput();

        /*!
         * cancels the execution from the consuming thread. Waits up to the grace period for in-flight tasks.
         */
        void cancel();

        /*!
         * thread-safe cancellation request, observed at the next loop iteration
         */
        void requestCancel();

        ExecutionStatus status() const { return _status; }

        TaskState taskState(TaskID id) const;
        size_t countTasks(TaskState state) const;

        /*!
         * attempts handed to the backend which did not report back yet
         */
        size_t numInFlight() const { return _inFlight.size(); }

        /*!
         * failed attempts of a task, oldest first
         */
        std::vector<TaskFailure> failures(TaskID id) const;

        const ExecutionMetrics& metrics() const { return _metrics; }
        const PartitionStore& partitions() const { return _store; }
        const StageGraph& graph() const { return *_graph; }

        /*!
         * whether root partitions are delivered in plan order
         */
        bool ordered() const { return _ordered; }

    private:
        struct TaskRun {
            TaskPtr task;
            TaskState state;
            size_t unmaterialized;  //! inputs not materialized yet
            size_t attempt;         //! number of the last submitted attempt
            size_t retries;         //! resubmissions used
            std::vector<TaskFailure> history;
            uint64_t readySeq;
            clock::time_point notBefore;
            clock::time_point submittedAt;
            size_t recomputeDepth;

            TaskRun() : state(TaskState::PENDING), unmaterialized(0), attempt(0), retries(0), readySeq(0),
            recomputeDepth(0) {}
        };

        ContextOptions _options;
        std::shared_ptr<IBackend> _backend;
        std::shared_ptr<const StageGraph> _graph;

        RetryPolicy _retryPolicy;
        size_t _maxConcurrentTasks;
        double _taskTimeout;
        double _pollInterval;
        size_t _recomputeDepthLimit;
        bool _ordered;
        bool _handleSignals;

        EventChannelPtr _channel;
        std::shared_ptr<ChannelTaskListener> _taskListener;
        std::shared_ptr<ChannelBackendListener> _backendListener;

        PartitionStore _store;
        ResourceBudget _budget;
        std::vector<WorkerClass> _workerClasses;

        std::map<StageID, StageInstance> _instances;
        IDAllocator _ids;
        std::map<TaskID, TaskRun> _runs;
        std::map<PartitionID, std::vector<TaskID>> _consumersOf;
        std::map<StageID, std::deque<TaskID>> _ready;
        std::map<TaskID, size_t> _inFlight; //! task -> attempt
        std::map<StageID, std::vector<PartitionID>> _pinnedFor; //! deferred stage -> producer outputs pinned for it
        uint64_t _readyCounter;

        // root partitions
        std::vector<PartitionID> _rootOutputs;
        std::set<PartitionID> _delivered;
        std::deque<PartitionID> _completedRoots; //! completion order, unordered mode
        size_t _nextRoot;

        ExecutionStatus _status;
        std::exception_ptr _error;
        bool _errorReported;
        bool _started;
        clock::time_point _startTime;
        ExecutionMetrics _metrics;

        MessageHandler& logger() const { return Logger::instance().logger("scheduler"); }

        void start();
        bool finished() const { return _status != ExecutionStatus::RUNNING; }
        void maintain();
        double waitTime(double timeout) const;

        void addInstance(StageID id, const StageInstance& instance);
        void pinForDeferredSuccessors(StageID id);
        void instantiateDeferred();
        bool readyToInstantiate(const Stage& stage) const;

        void makeReady(TaskRun& run, double delay=0.0);
        void removeFromReady(const TaskRun& run);
        size_t unblockScore(const TaskRun& run) const;
        void schedule();
        void submit(TaskRun& run);
        void settle(TaskID id);

        void process(const SchedulerEvent& event);
        void onTaskStarted(const SchedulerEvent& event);
        void onTaskSucceeded(const SchedulerEvent& event);
        void onTaskFailed(const SchedulerEvent& event);
        void onWorkerLost(const SchedulerEvent& event);
        void checkTimeouts();
        void retryOrAbort(TaskRun& run, const TaskFailure& failure);

        void partitionMaterialized(PartitionID id);
        void partitionLost(PartitionID id);
        void recompute(TaskID producer, size_t depth);

        void collectGarbage();
        void releasePartitions(const std::vector<PartitionID>& ids);
        void discardResult(const TaskResult& result);
        bool isStale(const SchedulerEvent& event) const;
        bool isRoot(PartitionID id) const;

        void abort(std::exception_ptr error, const std::string& reason);
        void terminalFailure(const TaskRun& run, const std::string& message);
        void teardown(ExecutionStatus status);

        bool rootComplete() const;
        bool stalled() const;
        bool nextDeliverable(PartitionID& id);
        void finish();
    };
}

#endif //SKEIN_SCHEDULER_H
