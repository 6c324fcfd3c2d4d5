//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <physical/PlanTranslator.h>
#include <physical/PipelineKernel.h>
#include <Errors.h>
#include <Logger.h>
#include <StringUtils.h>
#include <algorithm>
#include <set>

namespace skein {

    PlanTranslator::PlanTranslator(const ContextOptions &options) {
        _settings.adaptive = options.ADAPTIVE_REPARTITIONING();
        _settings.maxAdaptivePartitions = options.ADAPTIVE_MAX_PARTITIONS();
        _settings.targetPartitionSize = options.ADAPTIVE_TARGET_PARTITION_SIZE();
        _settings.defaultPartitions = options.DEFAULT_SHUFFLE_PARTITIONS();
    }

    static std::string describe(const PhysicalOperator& op) {
        return op.name() + " (" + std::to_string(op.id()) + ")";
    }

    void PlanTranslator::validateOperator(const PhysicalOperator &op) const {
        auto arity = op.arity();
        if(op.numParents() < arity.first || (arity.second > 0 && op.numParents() > arity.second)) {
            throw PlanTranslationError("operator " + describe(op) + " of type " + operatorTypeToString(op.type()) +
                                       " has " + pluralize(op.numParents(), "input") + ", expected " +
                                       (arity.first == arity.second ? std::to_string(arity.first) :
                                        "at least " + std::to_string(arity.first)), op.id());
        }

        if(op.type() == PhysicalOperatorType::UNKNOWN)
            throw PlanTranslationError("operator " + describe(op) + " has unknown type", op.id());

        if(op.type() != PhysicalOperatorType::CONCAT && !op.kernel())
            throw PlanTranslationError("operator " + describe(op) + " has no compute kernel", op.id());

        if(!op.resources().valid())
            throw PlanTranslationError("operator " + describe(op) + " requests invalid resources " +
                                       op.resources().toString(), op.id());

        if(op.type() == PhysicalOperatorType::SOURCE && op.numPartitions() <= 0)
            throw PlanTranslationError("source " + describe(op) + " must have a positive partition count", op.id());

        if(requiresExchange(op.type())) {
            if(op.numPartitions() < 0)
                throw PlanTranslationError("exchange " + describe(op) + " has negative partition count", op.id());
            if(op.numPartitioners() != 1 && op.numPartitioners() != op.numParents())
                throw PlanTranslationError("exchange " + describe(op) + " needs one partitioner per input", op.id());
            for(size_t i = 0; i < op.numParents(); ++i)
                if(!op.partitioner(i))
                    throw PlanTranslationError("exchange " + describe(op) + " has no partitioner for input " +
                                               std::to_string(i), op.id());
        }

        if(op.type() == PhysicalOperatorType::CONCAT) {
            auto cols = op.parents().front()->columns();
            for(const auto& p : op.parents()) {
                if(p->columns() != cols)
                    throw PlanTranslationError("concat " + describe(op) + " has inputs with different schemas: [" +
                                               join(cols, ", ") + "] vs. [" + join(p->columns(), ", ") + "]", op.id());
            }
        }
    }

    StageBranch PlanTranslator::forwardFrom(StageID stage) const {
        StageBranch b;
        b.head = BranchHead::FORWARD;
        b.inputStages = {stage};
        return b;
    }

    StageID PlanTranslator::close(const std::vector<StageBranch> &branches, StageBoundary boundary) {
        Stage st;
        st.id = static_cast<StageID>(_stages.size());
        st.boundary = boundary;
        st.branches = branches;

        std::set<StageID> preds;
        for(const auto& b : branches)
            preds.insert(b.inputStages.begin(), b.inputStages.end());
        st.predecessors = std::vector<StageID>(preds.begin(), preds.end());

        // adaptive stages and everything downstream of them are instantiated during execution
        st.deferred = st.adaptive();
        for(auto p : st.predecessors)
            st.deferred = st.deferred || _stages[p].deferred;

        _stages.push_back(st);
        return st.id;
    }

    std::vector<StageBranch> PlanTranslator::lower(const OperatorPtr &op) {
        auto it = _materialized.find(op->id());
        if(it != _materialized.end())
            return {forwardFrom(it->second)};

        std::vector<StageBranch> res;
        if(op->type() == PhysicalOperatorType::SOURCE) {
            StageBranch b;
            b.head = BranchHead::SOURCE;
            b.headOperator = op;
            b.numPartitions = op->numPartitions();
            res.push_back(b);
        } else if(isPipelined(op->type())) {
            res = lower(op->parents().front());
            for(auto& b : res)
                b.fused.push_back(op);
        } else if(op->type() == PhysicalOperatorType::CONCAT) {
            for(const auto& p : op->parents()) {
                auto branches = lower(p);
                res.insert(res.end(), branches.begin(), branches.end());
            }
        } else if(requiresExchange(op->type())) {
            bool adaptive = op->numPartitions() == AUTO_PARTITIONS && _settings.adaptive;
            size_t buckets = op->numPartitions() > 0 ? static_cast<size_t>(op->numPartitions()) :
                    (adaptive ? _settings.maxAdaptivePartitions : _settings.defaultPartitions);

            StageBranch b;
            b.head = BranchHead::EXCHANGE;
            b.headOperator = op;
            b.adaptive = adaptive;
            b.numPartitions = adaptive ? AUTO_PARTITIONS : static_cast<int64_t>(buckets);

            // map side of each input ends with the partitioner of the exchange
            for(size_t side = 0; side < op->numParents(); ++side) {
                auto branches = lower(op->parents()[side]);
                for(auto& pb : branches) {
                    pb.exchange = op;
                    pb.exchangeSide = side;
                    pb.numBuckets = buckets;
                }
                b.inputStages.push_back(close(branches, StageBoundary::MATERIALIZING));
            }
            res.push_back(b);
        } else {
            throw PlanTranslationError("can not translate operator " + describe(*op), op->id());
        }

        // several consumers read the same materialized result
        if(_consumers[op->id()] > 1) {
            auto sid = close(res, StageBoundary::MATERIALIZING);
            _materialized[op->id()] = sid;
            return {forwardFrom(sid)};
        }
        return res;
    }

    std::shared_ptr<const StageGraph> PlanTranslator::translate(const PhysicalPlan &plan) {
        auto& logger = Logger::instance().logger("translator");

        if(!plan.root())
            throw PlanTranslationError("plan has no root operator");

        // validates null inputs and cycles as well
        auto operators = plan.operators();
        for(const auto& op : operators)
            validateOperator(*op);

        _stages.clear();
        _materialized.clear();
        _consumers = plan.consumerCounts();

        auto rootBranches = lower(plan.root());
        auto rootStage = close(rootBranches, StageBoundary::PIPELINED);

        auto graph = std::make_shared<StageGraph>(plan);
        graph->_stages = _stages;
        graph->_root = rootStage;
        graph->_ordered = plan.ordered();
        graph->_settings = _settings;

        // instantiate everything which does not depend on runtime statistics
        IDAllocator ids;
        for(const auto& st : graph->_stages) {
            if(st.deferred)
                continue;
            auto instance = instantiateStage(st, graph->_instances, _settings,
                                             [](PartitionID) { return option<size_t>::none; }, ids);
            graph->addInstance(st.id, instance);
        }
        graph->_ids = ids;

        graph->validate();

        std::stringstream ss;
        ss<<"translated plan with "<<pluralize(operators.size(), "operator")<<" into "
          <<pluralize(graph->numStages(), "stage")<<" ("<<pluralize(graph->numTasks(), "static task");
        if(graph->hasDeferredStages())
            ss<<", adaptive stages are instantiated at runtime";
        ss<<")";
        logger.info(ss.str());
        return graph;
    }

    std::vector<std::pair<size_t, size_t>> PlanTranslator::coalesceBuckets(const std::vector<size_t> &bucketBytes,
                                                                           size_t targetSize) {
        std::vector<std::pair<size_t, size_t>> groups;
        if(bucketBytes.empty())
            return {std::pair<size_t, size_t>(0, 0)};

        size_t start = 0;
        size_t current = 0;
        for(size_t i = 0; i < bucketBytes.size(); ++i) {
            if(i > start && current + bucketBytes[i] > targetSize) {
                groups.push_back(std::make_pair(start, i));
                start = i;
                current = 0;
            }
            current += bucketBytes[i];
        }
        groups.push_back(std::make_pair(start, bucketBytes.size()));
        return groups;
    }

    static const StageInstance& producerInstance(const std::map<StageID, StageInstance>& instances, StageID id) {
        auto it = instances.find(id);
        if(it == instances.end())
            throw std::logic_error("stage " + std::to_string(id) + " must be instantiated before its consumers");
        return it->second;
    }

    static size_t bucketCount(const StageInstance& producer) {
        return producer.tasks.empty() ? 0 : producer.tasks.front()->outputs.size();
    }

    StageInstance PlanTranslator::instantiateStage(const Stage &stage,
                                                   const std::map<StageID, StageInstance> &instances,
                                                   const TranslationSettings &settings,
                                                   const BytesLookup &bytesOf,
                                                   IDAllocator &ids) {

        // per branch: the input partitions and per side counts of each task
        struct TaskInputs {
            std::vector<PartitionID> inputs;
            std::vector<size_t> inputsPerSide;
        };
        std::vector<std::vector<TaskInputs>> branchInputs;

        for(const auto& b : stage.branches) {
            std::vector<TaskInputs> inputs;
            if(b.head == BranchHead::SOURCE) {
                inputs.resize(static_cast<size_t>(b.numPartitions));
            } else if(b.head == BranchHead::FORWARD) {
                const auto& producer = producerInstance(instances, b.inputStages.front());
                for(auto out : producer.outputs) {
                    TaskInputs ti;
                    ti.inputs = {out};
                    ti.inputsPerSide = {1};
                    inputs.push_back(ti);
                }
            } else {
                auto numBuckets = bucketCount(producerInstance(instances, b.inputStages.front()));
                for(auto sid : b.inputStages)
                    if(bucketCount(producerInstance(instances, sid)) != numBuckets)
                        throw std::logic_error("exchange sides of " + stage.name() + " disagree on bucket count");

                std::vector<std::pair<size_t, size_t>> groups;
                if(b.adaptive) {
                    std::vector<size_t> bytes(numBuckets, 0);
                    for(auto sid : b.inputStages) {
                        for(const auto& t : producerInstance(instances, sid).tasks) {
                            for(size_t i = 0; i < numBuckets; ++i)
                                bytes[i] += bytesOf(t->outputs[i]).value_or(settings.targetPartitionSize);
                        }
                    }
                    groups = coalesceBuckets(bytes, settings.targetPartitionSize);
                } else {
                    for(size_t i = 0; i < numBuckets; ++i)
                        groups.push_back(std::make_pair(i, i + 1));
                }

                for(const auto& g : groups) {
                    TaskInputs ti;
                    for(auto sid : b.inputStages) {
                        const auto& producer = producerInstance(instances, sid);
                        for(const auto& t : producer.tasks)
                            for(size_t i = g.first; i < g.second; ++i)
                                ti.inputs.push_back(t->outputs[i]);
                        ti.inputsPerSide.push_back(producer.tasks.size() * (g.second - g.first));
                    }
                    inputs.push_back(ti);
                }
            }
            branchInputs.push_back(inputs);
        }

        size_t numTasks = 0;
        for(const auto& bi : branchInputs)
            numTasks += bi.size();

        StageInstance instance;
        size_t partitionIndex = 0;
        for(size_t bi = 0; bi < stage.branches.size(); ++bi) {
            const auto& b = stage.branches[bi];

            // one fused kernel per branch, shared by all of its tasks
            std::vector<KernelPtr> fused;
            for(const auto& op : b.fused)
                fused.push_back(op->kernel());
            auto kernel = std::make_shared<PipelineKernel>(b.headOperator ? b.headOperator->kernel() : nullptr,
                                                           fused,
                                                           b.exchange ? b.exchange->partitioner(b.exchangeSide) : nullptr);

            ResourceRequest resources;
            std::vector<OperatorID> opIDs;
            std::vector<std::string> opNames;
            bool first = true;
            for(const auto& op : b.operators()) {
                resources = first ? op->resources() : ResourceRequest::max(resources, op->resources());
                first = false;
                opIDs.push_back(op->id());
                opNames.push_back(op->name());
            }

            for(const auto& ti : branchInputs[bi]) {
                auto task = std::make_shared<Task>();
                task->id = ids.task();
                task->stage = stage.id;
                task->branch = bi;
                task->partitionIndex = partitionIndex++;
                task->numPartitions = numTasks;
                task->inputs = ti.inputs;
                task->inputsPerSide = ti.inputsPerSide;
                size_t arity = b.exchange ? b.numBuckets : 1;
                for(size_t i = 0; i < arity; ++i)
                    task->outputs.push_back(ids.partition());
                task->resources = resources;
                task->kernel = kernel;
                task->operators = opIDs;
                task->operatorNames = opNames;

                instance.outputs.insert(instance.outputs.end(), task->outputs.begin(), task->outputs.end());
                instance.tasks.push_back(task);
            }
        }
        return instance;
    }
}
