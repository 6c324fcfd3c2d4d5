//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_LOCALBACKEND_H
#define SKEIN_LOCALBACKEND_H

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <ContextOptions.h>
#include <ee/IBackend.h>
#include "Executor.h"

namespace skein {

    /*!
     * runs tasks in-process on a bounded pool of executor threads. Failures are terminal unless a kernel
     * signals a transient condition or a lost input.
     */
    class LocalBackend : public IBackend {
    private:
        ContextOptions _options;
        ResourceSummary _capacity;
        WorkQueue _queue;
        std::vector<std::unique_ptr<Executor>> _executors;

        std::mutex _mutex;
        std::unordered_map<TaskID, std::vector<std::shared_ptr<std::atomic_bool>>> _cancelFlags;
        std::atomic_int _numRunning;

        MessageHandler& logger() const { return Logger::instance().logger("local ee"); }

        friend class LocalTask;
        void taskStarted();
        void taskDone(TaskID id, const std::shared_ptr<std::atomic_bool>& flag, bool started);
    public:
        explicit LocalBackend(const ContextOptions& options);
        ~LocalBackend() override;

        std::string name() const override { return "local"; }

        void submit(const TaskSubmission& submission, const std::shared_ptr<ITaskListener>& listener) override;
        ResourceSummary advertiseCapacity() const override { return _capacity; }
        std::vector<WorkerClass> workerClasses() const override;
        void cancel(TaskID id) override;
        PartitionPtr fetch(const PartitionRef& ref) override;

        size_t numExecutors() const { return _executors.size(); }

        /*!
         * tasks currently executing a kernel
         */
        size_t numRunningTasks() const { return static_cast<size_t>(_numRunning.load()); }

        /*!
         * tasks waiting for an executor
         */
        size_t numQueuedTasks() const { return _queue.numPendingTasks() - numRunningTasks(); }
    };
}

#endif //SKEIN_LOCALBACKEND_H
