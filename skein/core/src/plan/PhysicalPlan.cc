//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <plan/PhysicalPlan.h>
#include <Errors.h>
#include <set>

namespace skein {

    // post-order dfs, throws on cycles and null inputs
    static void visit(const OperatorPtr& op, std::set<OperatorID>& done, std::set<OperatorID>& active,
                      std::vector<OperatorPtr>& order) {
        if(done.count(op->id()))
            return;
        if(active.count(op->id()))
            throw PlanTranslationError("cycle detected at operator " + op->name() + " (" + std::to_string(op->id()) + ")", op->id());

        active.insert(op->id());
        for(size_t i = 0; i < op->parents().size(); ++i) {
            const auto& parent = op->parents()[i];
            if(!parent)
                throw PlanTranslationError("input " + std::to_string(i) + " of operator " + op->name() +
                                           " (" + std::to_string(op->id()) + ") is dangling", op->id());
            visit(parent, done, active, order);
        }
        active.erase(op->id());
        done.insert(op->id());
        order.push_back(op);
    }

    std::vector<OperatorPtr> PhysicalPlan::operators() const {
        if(!_root)
            throw PlanTranslationError("plan has no root operator");
        std::set<OperatorID> done;
        std::set<OperatorID> active;
        std::vector<OperatorPtr> order;
        visit(_root, done, active, order);
        return order;
    }

    void PhysicalPlan::foreachOperator(const std::function<void(const PhysicalOperator &)> &f) const {
        for(const auto& op : operators())
            f(*op);
    }

    std::map<OperatorID, size_t> PhysicalPlan::consumerCounts() const {
        std::map<OperatorID, size_t> counts;
        for(const auto& op : operators()) {
            counts[op->id()];
            for(const auto& p : op->parents())
                counts[p->id()]++;
        }
        return counts;
    }

    nlohmann::json PhysicalPlan::getJSON() const {
        nlohmann::json json;
        std::vector<nlohmann::json> ops;
        for(const auto& op : operators()) {
            nlohmann::json o;
            o["id"] = op->id();
            o["type"] = operatorTypeToString(op->type());
            o["name"] = op->name();
            std::vector<OperatorID> inputs;
            for(const auto& p : op->parents())
                inputs.push_back(p->id());
            o["inputs"] = inputs;
            o["columns"] = op->columns();
            o["numPartitions"] = op->numPartitions();
            o["resources"] = op->resources().toString();
            o["ordered"] = op->ordered();
            ops.push_back(o);
        }
        json["operators"] = ops;
        json["root"] = _root->id();
        return json;
    }
}
