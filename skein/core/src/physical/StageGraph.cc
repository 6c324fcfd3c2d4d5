//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <physical/StageGraph.h>
#include <Errors.h>
#include <algorithm>

namespace skein {

    const Stage& StageGraph::stage(StageID id) const {
        if(id < 0 || static_cast<size_t>(id) >= _stages.size())
            throw std::out_of_range("unknown stage " + std::to_string(id));
        return _stages[id];
    }

    std::vector<StageID> StageGraph::successors(StageID id) const {
        std::vector<StageID> res;
        for(const auto& st : _stages)
            if(std::find(st.predecessors.begin(), st.predecessors.end(), id) != st.predecessors.end())
                res.push_back(st.id);
        return res;
    }

    const StageInstance& StageGraph::instance(StageID id) const {
        auto it = _instances.find(id);
        if(it == _instances.end())
            throw std::out_of_range("stage " + std::to_string(id) + " is not instantiated");
        return it->second;
    }

    bool StageGraph::hasDeferredStages() const {
        for(const auto& st : _stages)
            if(st.deferred)
                return true;
        return false;
    }

    void StageGraph::addInstance(StageID id, const StageInstance &instance) {
        _instances[id] = instance;
        for(const auto& t : instance.tasks) {
            _tasks[t->id] = t;
            for(auto out : t->outputs)
                _producers[out] = t->id;
            for(auto op : t->operators)
                _operatorTasks[op].push_back(t->id);
        }
    }

    std::vector<TaskPtr> StageGraph::tasks() const {
        std::vector<TaskPtr> res;
        res.reserve(_tasks.size());
        for(const auto& kv : _tasks)
            res.push_back(kv.second);
        return res;
    }

    TaskPtr StageGraph::task(TaskID id) const {
        auto it = _tasks.find(id);
        if(it == _tasks.end())
            return nullptr;
        return it->second;
    }

    std::vector<TaskID> StageGraph::tasksForOperator(OperatorID id) const {
        auto it = _operatorTasks.find(id);
        if(it == _operatorTasks.end())
            return {};
        return it->second;
    }

    TaskID StageGraph::producerOf(PartitionID id) const {
        auto it = _producers.find(id);
        if(it == _producers.end())
            return INVALID_TASK;
        return it->second;
    }

    void StageGraph::validate() const {
        for(size_t i = 0; i < _stages.size(); ++i) {
            const auto& st = _stages[i];
            if(st.id != static_cast<StageID>(i))
                throw PlanTranslationError("stage ids are not consecutive at stage " + std::to_string(st.id));
            for(auto p : st.predecessors)
                if(p < 0 || p >= st.id)
                    throw PlanTranslationError(st.name() + " depends on stage " + std::to_string(p) +
                                               " which is not an earlier stage");
        }

        for(const auto& kv : _tasks) {
            const auto& t = kv.second;
            for(auto in : t->inputs) {
                auto producer = producerOf(in);
                if(producer == INVALID_TASK)
                    throw PlanTranslationError(t->description() + " reads partition " + std::to_string(in) +
                                               " which no task produces");
                auto pt = task(producer);
                if(pt->stage > t->stage)
                    throw PlanTranslationError(t->description() + " reads partition " + std::to_string(in) +
                                               " of a later stage");
                if(pt->id == t->id)
                    throw PlanTranslationError(t->description() + " reads its own output");
            }
        }

        if(_root == INVALID_STAGE || _root != static_cast<StageID>(_stages.size()) - 1)
            throw PlanTranslationError("root stage must be the last stage");
    }

    nlohmann::json StageGraph::getJSON() const {
        nlohmann::json json;
        std::vector<nlohmann::json> stages;
        for(const auto& st : _stages) {
            nlohmann::json s;
            s["id"] = st.id;
            s["boundary"] = stageBoundaryToString(st.boundary);
            s["predecessors"] = st.predecessors;
            s["deferred"] = st.deferred;
            s["adaptive"] = st.adaptive();

            std::vector<nlohmann::json> branches;
            for(const auto& b : st.branches) {
                nlohmann::json jb;
                jb["head"] = branchHeadToString(b.head);
                jb["inputStages"] = b.inputStages;
                std::vector<std::string> ops;
                for(const auto& op : b.operators())
                    ops.push_back(op->name());
                jb["operators"] = ops;
                jb["numPartitions"] = b.numPartitions;
                if(b.exchange)
                    jb["buckets"] = b.numBuckets;
                branches.push_back(jb);
            }
            s["branches"] = branches;

            auto it = _instances.find(st.id);
            if(it != _instances.end()) {
                std::vector<nlohmann::json> tasks;
                for(const auto& t : it->second.tasks) {
                    nlohmann::json jt;
                    jt["id"] = t->id;
                    jt["partition"] = t->partitionIndex;
                    jt["inputs"] = t->inputs;
                    jt["outputs"] = t->outputs;
                    jt["resources"] = t->resources.toString();
                    jt["operators"] = t->operators;
                    tasks.push_back(jt);
                }
                s["tasks"] = tasks;
            }
            stages.push_back(s);
        }
        json["stages"] = stages;
        json["root"] = _root;
        json["ordered"] = _ordered;

        nlohmann::json operatorTasks;
        for(const auto& kv : _operatorTasks)
            operatorTasks[std::to_string(kv.first)] = kv.second;
        json["operatorTasks"] = operatorTasks;
        return json;
    }
}
