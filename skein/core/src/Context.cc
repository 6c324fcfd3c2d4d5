//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <Context.h>
#include <Signals.h>
#include <ee/cluster/ClusterBackend.h>
#include <ee/cluster/ClusterConfig.h>
#include <ee/local/LocalBackend.h>
#include <physical/PlanTranslator.h>

namespace skein {

    Context::Context(const ContextOptions &options) : _options(options), _uuid(getUniqueID()) {
        _name = "context-" + uuid().substr(0, 8);

        // start backend depending on options
        switch(options.BACKEND()) {
            case Backend::LOCAL: {
                _ee = std::make_shared<LocalBackend>(options);
                break;
            }
            case Backend::CLUSTER: {
                auto path = options.CLUSTER_CONFIG_FILE();
                ClusterConfig config;
                if(path.empty()) {
                    logger().warn("no cluster description given, emulating a single node cluster");
                    config = ClusterConfig::singleNode(ResourceSummary(options.EXECUTOR_COUNT(),
                                                                       options.LOCAL_NUM_GPUS(),
                                                                       options.LOCAL_MEMORY()));
                } else {
                    config = ClusterConfig::fromYAML(path);
                }
                _cluster = std::make_shared<EmulatedCluster>(config);
                _ee = std::make_shared<ClusterBackend>(options, _cluster);
                break;
            }
            default:
                throw SkeinException("unknown backend");
        }

        if(options.HANDLE_SIGNALS() && !install_signal_handlers())
            logger().warn("could not install signal handlers, interrupts will not cancel executions");

        logger().info("created " + _name + " with " + _ee->name() + " backend");
    }

    Context::Context(const ContextOptions &options, const std::shared_ptr<IBackend> &backend) : _options(options),
    _ee(backend), _uuid(getUniqueID()) {
        if(!_ee)
            throw SkeinException("context requires a backend");
        _name = "context-" + uuid().substr(0, 8);
        if(options.HANDLE_SIGNALS() && !install_signal_handlers())
            logger().warn("could not install signal handlers, interrupts will not cancel executions");
    }

    Context::~Context() {
        // backend before the cluster it talks to
        _ee.reset();
        _cluster.reset();
    }

    std::shared_ptr<const StageGraph> Context::translate(const PhysicalPlan &plan) const {
        PlanTranslator translator(_options);
        return translator.translate(plan);
    }

    std::unique_ptr<ResultStream> Context::execute(const PhysicalPlan &plan) {
        return execute(translate(plan));
    }

    std::unique_ptr<ResultStream> Context::execute(const std::shared_ptr<const StageGraph> &graph) {
        if(!graph)
            throw SkeinException("nothing to execute");
        std::unique_ptr<Scheduler> scheduler(new Scheduler(_options, _ee, graph));
        return std::unique_ptr<ResultStream>(new ResultStream(std::move(scheduler)));
    }
}
