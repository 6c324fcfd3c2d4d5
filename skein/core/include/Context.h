//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_CONTEXT_H
#define SKEIN_CONTEXT_H

#include <memory>
#include <string>
#include <ContextOptions.h>
#include <ResultStream.h>
#include <ee/IBackend.h>
#include <ee/cluster/EmulatedCluster.h>
#include <physical/StageGraph.h>
#include <plan/PhysicalPlan.h>

namespace skein {

    /*!
     * execution context holding the backend and all tunables. Plans executed via a context share its backend.
     */
    class Context {
    private:
        ContextOptions _options; //! config for a context object
        std::shared_ptr<IBackend> _ee; //! execution backend of this context
        std::shared_ptr<EmulatedCluster> _cluster; //! in-process cluster, if the cluster backend runs on one

        uniqueid_t _uuid;
        std::string _name;

        MessageHandler& logger() const { return Logger::instance().logger("core"); }
    public:
        /*!
         * creates the backend chosen by skein.backend
         */
        explicit Context(const ContextOptions& options=ContextOptions::load());

        /*!
         * uses an existing backend
         */
        Context(const ContextOptions& options, const std::shared_ptr<IBackend>& backend);

        ~Context();

        Context(const Context& other) = delete;
        Context& operator = (const Context& other) = delete;

        /*!
         * translates a plan into its stage graph, throws PlanTranslationError for malformed plans
         */
        std::shared_ptr<const StageGraph> translate(const PhysicalPlan& plan) const;

        /*!
         * translates and executes a plan
         * @return stream of the root partitions, execution progresses while pulling from it
         */
        std::unique_ptr<ResultStream> execute(const PhysicalPlan& plan);

        /*!
         * executes an already translated graph, e.g. once more after a cancelled execution
         */
        std::unique_ptr<ResultStream> execute(const std::shared_ptr<const StageGraph>& graph);

        const ContextOptions& getOptions() const { return _options; }
        std::shared_ptr<IBackend> backend() const { return _ee; }

        /*!
         * the emulated cluster behind the cluster backend, nullptr for other backends
         */
        std::shared_ptr<EmulatedCluster> cluster() const { return _cluster; }

        std::string name() const { return _name; }
        std::string uuid() const { return uuidToString(_uuid); }
    };
}

#endif //SKEIN_CONTEXT_H
