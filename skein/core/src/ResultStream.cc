//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ResultStream.h>

namespace skein {

    ResultStream::ResultStream(std::unique_ptr<Scheduler> scheduler) : _scheduler(std::move(scheduler)),
    _exhausted(false), _numDelivered(0) {
        if(!_scheduler)
            throw SkeinException("result stream without scheduler");
    }

    bool ResultStream::hasNext() {
        if(_next)
            return true;
        if(_exhausted)
            return false;

        // a failure is thrown once, afterwards the scheduler reports the end of the stream
        _next = _scheduler->nextOutput();
        if(!_next)
            _exhausted = true;
        return _next != nullptr;
    }

    PartitionPtr ResultStream::next() {
        if(!hasNext())
            throw std::out_of_range("result stream is exhausted");
        auto p = _next;
        _next.reset();
        _numDelivered++;
        return p;
    }

    std::vector<PartitionPtr> ResultStream::collect() {
        std::vector<PartitionPtr> partitions;
        while(hasNext())
            partitions.push_back(next());
        return partitions;
    }

    void ResultStream::cancel() {
        _next.reset();
        _scheduler->cancel();
        // the cancellation is surfaced by the next pull
        _exhausted = false;
    }
}
