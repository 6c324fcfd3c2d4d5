//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_RESULTSTREAM_H
#define SKEIN_RESULTSTREAM_H

#include <memory>
#include <vector>
#include <scheduler/Scheduler.h>

namespace skein {

    /*!
     * lazy, forward-only sequence of the root partitions of one execution. Pulling drives the scheduler on the
     * calling thread. Not restartable, execute the plan again to get a fresh stream.
     */
    class ResultStream {
    private:
        std::unique_ptr<Scheduler> _scheduler;
        PartitionPtr _next;
        bool _exhausted;
        size_t _numDelivered;
    public:
        explicit ResultStream(std::unique_ptr<Scheduler> scheduler);
        ~ResultStream() = default;

        // Non copyable
        ResultStream(const ResultStream&) = delete;
        ResultStream& operator = (const ResultStream&) = delete;

        /*!
         * check whether the stream holds one more partition. Blocks until it is known, throws the error of a
         * failed or cancelled execution (once).
         */
        bool hasNext();

        /*!
         * get next partition, throws std::out_of_range if the stream is exhausted
         */
        PartitionPtr next();

        /*!
         * pulls all remaining partitions
         */
        std::vector<PartitionPtr> collect();

        /*!
         * cancels the execution, pulling afterwards raises CancellationError
         */
        void cancel();

        /*!
         * thread-safe cancellation request
         */
        void requestCancel() { _scheduler->requestCancel(); }

        ExecutionStatus status() const { return _scheduler->status(); }
        const ExecutionMetrics& metrics() const { return _scheduler->metrics(); }
        size_t numDelivered() const { return _numDelivered; }

        Scheduler& scheduler() { return *_scheduler; }
        const Scheduler& scheduler() const { return *_scheduler; }
    };
}

#endif //SKEIN_RESULTSTREAM_H
