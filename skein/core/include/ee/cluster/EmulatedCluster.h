//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_EMULATEDCLUSTER_H
#define SKEIN_EMULATEDCLUSTER_H

#include <deque>
#include <map>
#include <mutex>
#include <ee/local/Executor.h>
#include "ClusterConfig.h"
#include "IClusterClient.h"

namespace skein {

    /*!
     * in-process stand-in for a remote cluster scheduler. Workers are started from a cluster description,
     * each with its own resources and partition store. Tasks are placed first-fit on live workers with free
     * resources and run on a shared pool of executor threads. Supports fault injection (worker loss,
     * unreachable network, dropped requests).
     */
    class EmulatedCluster : public IClusterClient {
    public:
        /*!
         * called on the executor thread right before a task reads its inputs
         */
        using TaskHook = std::function<void(const messages::TaskRequest& request, const std::string& worker)>;

        explicit EmulatedCluster(const ClusterConfig& config, size_t numThreads=0);
        ~EmulatedCluster() override;

        std::vector<WorkerClass> workerClasses() const override { return _config.workerClasses(); }
        messages::ClusterState pollState() override;
        void registerKernel(const std::string& key, const KernelPtr& kernel) override;
        bool invokeAsync(const messages::TaskRequest& request, ResponseCallback callback) override;
        void abort(TaskID id) override;
        PartitionPtr fetch(const messages::PartitionInfo& info) override;
        void release(const std::vector<messages::PartitionInfo>& partitions) override;
        void setEventHandler(EventCallback handler) override;

        /*!
         * stops a worker. Tasks running on it fail with WORKER_LOST, partitions stored on it are gone.
         * @return false if there is no live worker with this id
         */
        bool killWorker(const std::string& id);

        /*!
         * starts a new worker of a class, throws SkeinException if the class is at max_workers
         * @return id of the new worker
         */
        std::string addWorker(const std::string& className);

        /*!
         * while partitioned, requests can not be delivered (invokeAsync returns false)
         */
        void setNetworkPartitioned(bool partitioned);

        /*!
         * the next n requests are accepted but lost on their way, i.e. never acknowledged
         */
        void dropNextRequests(size_t n);

        void setTaskHook(TaskHook hook);

        std::vector<std::string> liveWorkers() const;

        /*!
         * live worker storing a partition, empty if none
         */
        std::string locationOf(PartitionID id) const;

        size_t numStoredPartitions() const;
        size_t numRunningTasks() const;
        size_t numQueuedTasks() const;

    private:
        struct Worker {
            std::string id;
            std::string className;
            ResourceSummary resources;
            ResourceSummary used;
            bool alive;
            std::map<PartitionID, PartitionPtr> store;

            Worker() : alive(true) {}
            ResourceSummary free() const {
                return ResourceSummary(resources.cpus - used.cpus, resources.gpus - used.gpus,
                                       resources.memory > used.memory ? resources.memory - used.memory : 0);
            }
        };

        struct Attempt {
            messages::TaskRequest request;
            ResponseCallback callback;
            std::shared_ptr<std::atomic_bool> cancelFlag;
            std::string worker; // empty while queued
            bool done;

            Attempt() : cancelFlag(std::make_shared<std::atomic_bool>(false)), done(false) {}
        };
        using AttemptPtr = std::shared_ptr<Attempt>;

        friend class ClusterTask;

        ClusterConfig _config;
        mutable std::mutex _mutex;
        std::map<std::string, Worker> _workers;
        std::map<std::string, size_t> _workerCounter; // per class, used for naming
        std::map<std::string, KernelPtr> _kernels;
        std::deque<AttemptPtr> _queued;
        std::vector<AttemptPtr> _active;
        std::mutex _eventMutex;
        EventCallback _eventHandler;
        TaskHook _taskHook;
        bool _partitioned;
        size_t _dropRequests;
        bool _shutdown;

        WorkQueue _workQueue;
        std::vector<std::unique_ptr<Executor>> _executors;

        MessageHandler& logger() const { return Logger::instance().logger("cluster"); }

        std::string startWorker(const std::string& className);
        messages::ClusterState stateWithoutLock() const;
        void emit(const messages::ClusterEvent& event);

        /*!
         * places queued attempts on live workers with enough free resources
         */
        void dispatch();

        /*!
         * runs an attempt on the executor thread
         */
        void run(const AttemptPtr& attempt);

        /*!
         * completes an attempt exactly once, frees resources of the worker
         * @return false if the attempt was completed before
         */
        bool finish(const AttemptPtr& attempt, messages::TaskResponse& response,
                    const std::vector<std::pair<PartitionID, PartitionPtr>>& outputs={});

        messages::TaskResponse responseFor(const AttemptPtr& attempt, messages::TaskStatus status,
                                           const std::string& message="") const;
    };
}

#endif //SKEIN_EMULATEDCLUSTER_H
