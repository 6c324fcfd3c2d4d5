//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <scheduler/RetryPolicy.h>
#include <algorithm>
#include <cmath>

namespace skein {

    RetryPolicy::RetryPolicy(const ContextOptions &options) : _maxRetries(options.MAX_TASK_RETRIES()),
    _baseDelay(options.RETRY_BASE_DELAY()), _maxDelay(options.RETRY_MAX_DELAY()) {}

    double RetryPolicy::backoff(size_t retry) const {
        if(0 == retry)
            return 0.0;
        // 2^63 overflows, the cap is reached long before
        auto exponent = std::min(retry - 1, (size_t)62);
        double delay = _baseDelay * std::pow(2.0, static_cast<double>(exponent));
        return std::max(0.0, std::min(delay, _maxDelay));
    }
}
