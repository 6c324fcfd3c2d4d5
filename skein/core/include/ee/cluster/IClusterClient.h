//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_ICLUSTERCLIENT_H
#define SKEIN_ICLUSTERCLIENT_H

#include <functional>
#include <string>
#include <vector>
#include <physical/ComputeKernel.h>
#include <ResourceRequest.h>
#include "Messages.h"

namespace skein {

    /*!
     * connection to a remote cluster scheduler. Callbacks are invoked from client threads.
     */
    class IClusterClient {
    public:
        using ResponseCallback = std::function<void(const messages::TaskResponse&)>;
        using EventCallback = std::function<void(const messages::ClusterEvent&)>;

        virtual ~IClusterClient() = default;

        virtual std::vector<WorkerClass> workerClasses() const = 0;

        /*!
         * current resources of the cluster
         */
        virtual messages::ClusterState pollState() = 0;

        /*!
         * makes a kernel known to the workers under key
         */
        virtual void registerKernel(const std::string& key, const KernelPtr& kernel) = 0;

        /*!
         * sends a task request. The callback receives a TASK_RUNNING response when a worker picked up the task
         * and exactly one final response afterwards.
         * @return false if the request could not be delivered (network unreachable), the callback is not invoked then
         */
        virtual bool invokeAsync(const messages::TaskRequest& request, ResponseCallback callback) = 0;

        /*!
         * best-effort abort of a task, all its attempts
         */
        virtual void abort(TaskID id) = 0;

        /*!
         * reads partition data from the worker holding it, throws PartitionLostError if gone
         */
        virtual PartitionPtr fetch(const messages::PartitionInfo& info) = 0;

        virtual void release(const std::vector<messages::PartitionInfo>& partitions) = 0;

        virtual void setEventHandler(EventCallback handler) = 0;
    };
}

#endif //SKEIN_ICLUSTERCLIENT_H
