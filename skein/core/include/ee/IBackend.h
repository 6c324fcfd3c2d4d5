//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_IBACKEND_H
#define SKEIN_IBACKEND_H

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/thread/shared_mutex.hpp>
#include <Errors.h>
#include <Partition.h>
#include <ResourceRequest.h>
#include <physical/Task.h>

namespace skein {

    /*!
     * one attempt of a task handed to a backend
     */
    struct TaskSubmission {
        TaskPtr task;
        size_t attempt;                     //! 1 for the first attempt
        std::vector<PartitionRef> inputs;   //! in the order of task->inputs
        double timeout;                     //! in s, 0 for none. Backends may use it to abort remotely.

        TaskSubmission() : attempt(1), timeout(0.0) {}
    };

    struct TaskResult {
        TaskID taskID;
        size_t attempt;
        std::vector<MaterializedPartition> outputs; //! in the order of task->outputs
        std::string worker;
        double runtime;

        TaskResult() : taskID(INVALID_TASK), attempt(0), runtime(0.0) {}
    };

    /*!
     * receives the outcome of one submission. Called from backend threads.
     */
    class ITaskListener {
    public:
        virtual ~ITaskListener() = default;
        virtual void onStarted(TaskID id, size_t attempt, const std::string& worker) = 0;
        virtual void onSuccess(const TaskResult& result) = 0;
        virtual void onFailure(const TaskFailure& failure) = 0;
    };

    /*!
     * receives unsolicited backend events. Called from backend threads.
     */
    class IBackendListener {
    public:
        virtual ~IBackendListener() = default;
        virtual void onCapacityChanged(const ResourceSummary& capacity) = 0;

        /*!
         * worker died, all partitions stored there are gone
         * @param worker location of the worker
         * @param partitions partitions known to be stored there
         */
        virtual void onWorkerLost(const std::string& worker, const std::vector<PartitionID>& partitions) = 0;
    };

    /*!
     * capability interface of an execution backend. Submissions never throw, their outcome is reported
     * asynchronously to the listener.
     */
    class IBackend {
    public:
        IBackend() = default;
        IBackend(const IBackend& other) = delete;
        IBackend& operator = (const IBackend& other) = delete;

        virtual ~IBackend() {} // virtual destructor needed b.c. of smart pointers

        virtual std::string name() const = 0;

        /*!
         * run one attempt of a task. Requests no worker class can satisfy fail with FailureKind::UNSATISFIABLE.
         */
        virtual void submit(const TaskSubmission& submission, const std::shared_ptr<ITaskListener>& listener) = 0;

        /*!
         * resources which can be in use at the same time, i.e. the resources of all live workers
         */
        virtual ResourceSummary advertiseCapacity() const = 0;

        virtual std::vector<WorkerClass> workerClasses() const = 0;

        /*!
         * best-effort abort of a submitted task. The listener receives a failure (or a late result).
         */
        virtual void cancel(TaskID id) = 0;

        /*!
         * retrieve data of a materialized partition, throws PartitionLostError if it is gone
         */
        virtual PartitionPtr fetch(const PartitionRef& ref) = 0;

        /*!
         * partitions are not needed anymore, storage may be freed
         */
        virtual void release(const std::vector<PartitionRef>& partitions) {}

        void subscribe(const std::shared_ptr<IBackendListener>& listener);
        void unsubscribe(const IBackendListener* listener);
    protected:
        void notifyCapacityChanged(const ResourceSummary& capacity);
        void notifyWorkerLost(const std::string& worker, const std::vector<PartitionID>& partitions);
    private:
        boost::shared_mutex _listenerMutex;
        std::vector<std::weak_ptr<IBackendListener>> _listeners;

        std::vector<std::shared_ptr<IBackendListener>> listeners();
    };
}
#endif //SKEIN_IBACKEND_H
