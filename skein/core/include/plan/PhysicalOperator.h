//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_PHYSICALOPERATOR_H
#define SKEIN_PHYSICALOPERATOR_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <Defs.h>
#include <ResourceRequest.h>
#include <physical/ComputeKernel.h>
#include "PhysicalOperatorType.h"

namespace skein {

    class PhysicalOperator;
    using OperatorPtr = std::shared_ptr<PhysicalOperator>;

    /*!
     * node of an optimized physical plan. Parents are the inputs of the operator.
     * Exchange operators (repartition, sort, aggregate, join) carry one partitioner kernel per input which
     * splits producer partitions into buckets, and a kernel which merges the buckets of one output partition.
     */
    class PhysicalOperator {
    private:
        OperatorID _id;
        PhysicalOperatorType _type;
        std::string _name;
        std::vector<OperatorPtr> _parents;
        std::vector<std::string> _columns;
        int64_t _numPartitions;
        ResourceRequest _resources;
        KernelPtr _kernel;
        std::vector<KernelPtr> _partitioners;
        bool _ordered;

        // for assigning continuously running IDs
        static std::atomic<int64_t> physicalOperatorIDGenerator;
    public:
        PhysicalOperator(PhysicalOperatorType type,
                         const std::string& name,
                         const std::vector<OperatorPtr>& parents,
                         const KernelPtr& kernel=nullptr);

        static OperatorPtr source(const std::string& name, int64_t numPartitions, const KernelPtr& kernel,
                                  const std::vector<std::string>& columns={});
        static OperatorPtr map(const OperatorPtr& parent, const std::string& name, const KernelPtr& kernel);
        static OperatorPtr filter(const OperatorPtr& parent, const std::string& name, const KernelPtr& kernel);
        static OperatorPtr project(const OperatorPtr& parent, const std::string& name, const KernelPtr& kernel,
                                   const std::vector<std::string>& columns);
        static OperatorPtr repartition(const OperatorPtr& parent, int64_t numPartitions,
                                       const KernelPtr& partitioner, const KernelPtr& merge);
        static OperatorPtr sort(const OperatorPtr& parent, int64_t numPartitions,
                                const KernelPtr& partitioner, const KernelPtr& merge);
        static OperatorPtr aggregate(const OperatorPtr& parent, int64_t numPartitions,
                                     const KernelPtr& partitioner, const KernelPtr& merge);
        static OperatorPtr join(const OperatorPtr& left, const OperatorPtr& right, int64_t numPartitions,
                                const KernelPtr& leftPartitioner, const KernelPtr& rightPartitioner,
                                const KernelPtr& probe);
        static OperatorPtr concat(const std::vector<OperatorPtr>& parents);

        OperatorID id() const { return _id; }
        PhysicalOperatorType type() const { return _type; }
        std::string name() const { return _name; }

        const std::vector<OperatorPtr>& parents() const { return _parents; }
        size_t numParents() const { return _parents.size(); }
        void setParents(const std::vector<OperatorPtr>& parents) { _parents = parents; }

        /*!
         * output schema (column names). Operators without explicit columns inherit them from their input(s).
         */
        std::vector<std::string> columns() const;
        void setColumns(const std::vector<std::string>& columns) { _columns = columns; }

        /*!
         * partition count of a source, target partition count of an exchange. AUTO_PARTITIONS means decided by
         * the translator (adaptively or from configuration).
         */
        int64_t numPartitions() const { return _numPartitions; }
        void setNumPartitions(int64_t numPartitions) { _numPartitions = numPartitions; }

        const ResourceRequest& resources() const { return _resources; }
        PhysicalOperator& setResources(const ResourceRequest& request) { _resources = request; return *this; }

        const KernelPtr& kernel() const { return _kernel; }

        /*!
         * partitioner for input side, nullptr if not an exchange operator
         */
        KernelPtr partitioner(size_t side) const;
        size_t numPartitioners() const { return _partitioners.size(); }
        void setPartitioners(const std::vector<KernelPtr>& partitioners) { _partitioners = partitioners; }

        /*!
         * whether the order of output partitions is significant
         */
        bool ordered() const { return _ordered; }
        PhysicalOperator& setOrdered(bool ordered) { _ordered = ordered; return *this; }

        /*!
         * allowed number of inputs, max of 0 means unbounded
         */
        std::pair<size_t, size_t> arity() const;
    };
}

#endif //SKEIN_PHYSICALOPERATOR_H
