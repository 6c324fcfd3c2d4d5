//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_RESOURCEREQUEST_H
#define SKEIN_RESOURCEREQUEST_H

#include <atomic>
#include <string>
#include <vector>
#include <optional.h>

namespace skein {

    /*!
     * CPU/GPU/memory demands of a task. Used for admission and placement.
     */
    class ResourceRequest {
    private:
        double _numCPUs;
        double _numGPUs;
        option<size_t> _memoryBytes; //! optional upper bound
    public:
        ResourceRequest() : _numCPUs(1.0), _numGPUs(0.0) {}
        explicit ResourceRequest(double numCPUs, double numGPUs=0.0,
                                 const option<size_t>& memoryBytes=option<size_t>::none) : _numCPUs(numCPUs),
                                 _numGPUs(numGPUs), _memoryBytes(memoryBytes) {}

        double numCPUs() const { return _numCPUs; }
        double numGPUs() const { return _numGPUs; }
        option<size_t> memoryBytes() const { return _memoryBytes; }

        /*!
         * non-negative, finite amounts
         */
        bool valid() const;

        /*!
         * element-wise maximum, used when several operators are fused into one task
         */
        static ResourceRequest max(const ResourceRequest& a, const ResourceRequest& b);

        std::string toString() const;

        bool operator == (const ResourceRequest& other) const {
            return _numCPUs == other._numCPUs && _numGPUs == other._numGPUs && _memoryBytes == other._memoryBytes;
        }
    };

    /*!
     * amounts of resources, e.g. what a backend advertises or what a worker offers
     */
    struct ResourceSummary {
        double cpus;
        double gpus;
        size_t memory;

        ResourceSummary() : cpus(0.0), gpus(0.0), memory(0) {}
        ResourceSummary(double cpus, double gpus, size_t memory) : cpus(cpus), gpus(gpus), memory(memory) {}

        bool fits(const ResourceRequest& request) const;

        ResourceSummary& operator += (const ResourceSummary& other);
        ResourceSummary& operator -= (const ResourceRequest& request);
        ResourceSummary& operator += (const ResourceRequest& request);

        bool operator == (const ResourceSummary& other) const {
            return cpus == other.cpus && gpus == other.gpus && memory == other.memory;
        }
        bool operator != (const ResourceSummary& other) const { return !(*this == other); }

        std::string toString() const;
    };

    /*!
     * a homogeneous group of workers
     */
    struct WorkerClass {
        std::string name;
        ResourceSummary resources; //! per worker
        size_t minWorkers;
        size_t maxWorkers;

        WorkerClass() : minWorkers(0), maxWorkers(0) {}
        WorkerClass(const std::string& name, const ResourceSummary& resources, size_t minWorkers, size_t maxWorkers) : name(name),
        resources(resources), minWorkers(minWorkers), maxWorkers(maxWorkers) {}
    };

    /*!
     * checks whether at least one worker class could ever run a task with the given request
     */
    extern bool isSatisfiable(const ResourceRequest& request, const std::vector<WorkerClass>& classes);

    /*!
     * the scheduler's budget of in-flight resources. Acquired when submitting, released on completion.
     * Counters are atomics, so capacity updates may come from backend threads.
     */
    class ResourceBudget {
    private:
        // cpu/gpu tracked in thousandths
        std::atomic<int64_t> _milliCPUs;
        std::atomic<int64_t> _milliGPUs;
        std::atomic<int64_t> _memory;
        std::atomic<int64_t> _capacityMilliCPUs;
        std::atomic<int64_t> _capacityMilliGPUs;
        std::atomic<int64_t> _capacityMemory;
    public:
        explicit ResourceBudget(const ResourceSummary& capacity);

        /*!
         * acquires the resources of request if they are available
         * @return true if acquired, false if the budget is exhausted
         */
        bool tryAcquire(const ResourceRequest& request);

        void release(const ResourceRequest& request);

        /*!
         * changes the capacity, resources currently in use stay acquired
         */
        void resize(const ResourceSummary& capacity);

        ResourceSummary available() const;
        ResourceSummary capacity() const;
    };
}

#endif //SKEIN_RESOURCEREQUEST_H
