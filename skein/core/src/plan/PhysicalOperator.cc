//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <plan/PhysicalOperator.h>
#include <Errors.h>

namespace skein {

    std::atomic<int64_t> PhysicalOperator::physicalOperatorIDGenerator(100000);

    std::string operatorTypeToString(PhysicalOperatorType type) {
        switch(type) {
            case PhysicalOperatorType::SOURCE:
                return "source";
            case PhysicalOperatorType::MAP:
                return "map";
            case PhysicalOperatorType::FILTER:
                return "filter";
            case PhysicalOperatorType::PROJECT:
                return "project";
            case PhysicalOperatorType::REPARTITION:
                return "repartition";
            case PhysicalOperatorType::SORT:
                return "sort";
            case PhysicalOperatorType::AGGREGATE:
                return "aggregate";
            case PhysicalOperatorType::JOIN:
                return "join";
            case PhysicalOperatorType::CONCAT:
                return "concat";
            default:
                return "unknown";
        }
    }

    PhysicalOperator::PhysicalOperator(PhysicalOperatorType type, const std::string &name,
                                       const std::vector<OperatorPtr> &parents,
                                       const KernelPtr &kernel) : _id(physicalOperatorIDGenerator++), _type(type),
                                       _name(name.empty() ? operatorTypeToString(type) : name),
                                       _parents(parents),
                                       _numPartitions(AUTO_PARTITIONS),
                                       _kernel(kernel),
                                       _ordered(true) {
    }

    OperatorPtr PhysicalOperator::source(const std::string &name, int64_t numPartitions, const KernelPtr &kernel,
                                         const std::vector<std::string> &columns) {
        auto op = std::make_shared<PhysicalOperator>(PhysicalOperatorType::SOURCE, name, std::vector<OperatorPtr>{}, kernel);
        op->_numPartitions = numPartitions;
        op->_columns = columns;
        return op;
    }

    OperatorPtr PhysicalOperator::map(const OperatorPtr &parent, const std::string &name, const KernelPtr &kernel) {
        return std::make_shared<PhysicalOperator>(PhysicalOperatorType::MAP, name, std::vector<OperatorPtr>{parent}, kernel);
    }

    OperatorPtr PhysicalOperator::filter(const OperatorPtr &parent, const std::string &name, const KernelPtr &kernel) {
        return std::make_shared<PhysicalOperator>(PhysicalOperatorType::FILTER, name, std::vector<OperatorPtr>{parent}, kernel);
    }

    OperatorPtr PhysicalOperator::project(const OperatorPtr &parent, const std::string &name, const KernelPtr &kernel,
                                          const std::vector<std::string> &columns) {
        auto op = std::make_shared<PhysicalOperator>(PhysicalOperatorType::PROJECT, name, std::vector<OperatorPtr>{parent}, kernel);
        op->_columns = columns;
        return op;
    }

    static OperatorPtr makeExchange(PhysicalOperatorType type, const std::vector<OperatorPtr>& parents,
                                    int64_t numPartitions, const std::vector<KernelPtr>& partitioners,
                                    const KernelPtr& kernel) {
        auto op = std::make_shared<PhysicalOperator>(type, "", parents, kernel);
        op->setNumPartitions(numPartitions);
        op->setPartitioners(partitioners);
        return op;
    }

    OperatorPtr PhysicalOperator::repartition(const OperatorPtr &parent, int64_t numPartitions,
                                              const KernelPtr &partitioner, const KernelPtr &merge) {
        return makeExchange(PhysicalOperatorType::REPARTITION, {parent}, numPartitions, {partitioner}, merge);
    }

    OperatorPtr PhysicalOperator::sort(const OperatorPtr &parent, int64_t numPartitions,
                                       const KernelPtr &partitioner, const KernelPtr &merge) {
        return makeExchange(PhysicalOperatorType::SORT, {parent}, numPartitions, {partitioner}, merge);
    }

    OperatorPtr PhysicalOperator::aggregate(const OperatorPtr &parent, int64_t numPartitions,
                                            const KernelPtr &partitioner, const KernelPtr &merge) {
        return makeExchange(PhysicalOperatorType::AGGREGATE, {parent}, numPartitions, {partitioner}, merge);
    }

    OperatorPtr PhysicalOperator::join(const OperatorPtr &left, const OperatorPtr &right, int64_t numPartitions,
                                       const KernelPtr &leftPartitioner, const KernelPtr &rightPartitioner,
                                       const KernelPtr &probe) {
        return makeExchange(PhysicalOperatorType::JOIN, {left, right}, numPartitions,
                            {leftPartitioner, rightPartitioner}, probe);
    }

    OperatorPtr PhysicalOperator::concat(const std::vector<OperatorPtr> &parents) {
        return std::make_shared<PhysicalOperator>(PhysicalOperatorType::CONCAT, "", parents, nullptr);
    }

    std::vector<std::string> PhysicalOperator::columns() const {
        if(!_columns.empty() || _parents.empty())
            return _columns;

        if(_type == PhysicalOperatorType::JOIN) {
            std::vector<std::string> cols;
            for(const auto& p : _parents) {
                if(!p)
                    continue;
                auto pc = p->columns();
                cols.insert(cols.end(), pc.begin(), pc.end());
            }
            return cols;
        }

        return _parents.front() ? _parents.front()->columns() : std::vector<std::string>{};
    }

    KernelPtr PhysicalOperator::partitioner(size_t side) const {
        if(_partitioners.empty())
            return nullptr;
        // a single partitioner is shared by all sides
        if(_partitioners.size() == 1)
            return _partitioners.front();
        return side < _partitioners.size() ? _partitioners[side] : nullptr;
    }

    std::pair<size_t, size_t> PhysicalOperator::arity() const {
        switch(_type) {
            case PhysicalOperatorType::SOURCE:
                return std::make_pair(0, 0);
            case PhysicalOperatorType::JOIN:
                return std::make_pair(2, 2);
            case PhysicalOperatorType::CONCAT:
                return std::make_pair(2, 0);
            default:
                return std::make_pair(1, 1);
        }
    }
}
