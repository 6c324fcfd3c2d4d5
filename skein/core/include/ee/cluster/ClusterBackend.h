//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_CLUSTERBACKEND_H
#define SKEIN_CLUSTERBACKEND_H

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <ContextOptions.h>
#include <Logger.h>
#include <ee/IBackend.h>
#include "IClusterClient.h"

namespace skein {

    /*!
     * submits tasks to a remote cluster scheduler. Capacity is polled from the cluster and streamed via its
     * events. Worker loss and undeliverable or unacknowledged submissions are reported as transient failures,
     * requests larger than any free worker stay queued in the cluster.
     */
    class ClusterBackend : public IBackend {
    public:
        ClusterBackend(const ContextOptions& options, const std::shared_ptr<IClusterClient>& client);
        ~ClusterBackend() override;

        std::string name() const override { return "cluster"; }

        void submit(const TaskSubmission& submission, const std::shared_ptr<ITaskListener>& listener) override;
        ResourceSummary advertiseCapacity() const override;
        std::vector<WorkerClass> workerClasses() const override { return _client->workerClasses(); }
        void cancel(TaskID id) override;
        PartitionPtr fetch(const PartitionRef& ref) override;
        void release(const std::vector<PartitionRef>& partitions) override;

        std::shared_ptr<IClusterClient> client() const { return _client; }

        /*!
         * submissions without a final response
         */
        size_t numPendingRequests() const;

    private:
        struct Request {
            TaskSubmission submission;
            std::shared_ptr<ITaskListener> listener;
            std::chrono::steady_clock::time_point sentAt;
            bool acknowledged;

            Request() : acknowledged(false) {}
        };

        // outlives the backend if the cluster still holds callbacks
        struct RequestTable {
            std::mutex mutex;
            std::map<std::pair<TaskID, size_t>, Request> requests;
        };

        ContextOptions _options;
        std::shared_ptr<IClusterClient> _client;
        std::shared_ptr<RequestTable> _table;

        std::mutex _kernelMutex;
        std::map<const IComputeKernel*, std::pair<std::string, KernelPtr>> _kernels;

        mutable std::mutex _capacityMutex;
        ResourceSummary _capacity;

        std::thread _monitor;
        std::mutex _monitorMutex;
        std::condition_variable _monitorCV;
        bool _done;

        MessageHandler& logger() const { return Logger::instance().logger("cluster ee"); }

        std::string kernelKey(const KernelPtr& kernel);
        messages::TaskRequest encode(const TaskSubmission& submission, const std::string& kernelKey) const;

        static void handleResponse(const std::shared_ptr<RequestTable>& table, const messages::TaskResponse& response);
        void handleEvent(const messages::ClusterEvent& event);

        void updateCapacity(const messages::ClusterState& state);

        /*!
         * polls capacity and fails submissions the cluster did not acknowledge in time
         */
        void monitor();
        void checkSubmitTimeouts();
    };
}

#endif //SKEIN_CLUSTERBACKEND_H
