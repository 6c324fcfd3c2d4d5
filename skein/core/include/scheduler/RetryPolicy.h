//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_RETRYPOLICY_H
#define SKEIN_RETRYPOLICY_H

#include <cstddef>
#include <ContextOptions.h>

namespace skein {

    /*!
     * bounded retries of transient failures with exponential backoff
     */
    class RetryPolicy {
    private:
        size_t _maxRetries;
        double _baseDelay;
        double _maxDelay;
    public:
        explicit RetryPolicy(const ContextOptions& options);
        RetryPolicy(size_t maxRetries, double baseDelay, double maxDelay) : _maxRetries(maxRetries),
        _baseDelay(baseDelay), _maxDelay(maxDelay) {}

        size_t maxRetries() const { return _maxRetries; }

        /*!
         * whether another retry is allowed after retries have been used
         */
        bool canRetry(size_t retries) const { return retries < _maxRetries; }

        /*!
         * delay before a retry
         * @param retry 1 for the first retry
         * @return delay in s, base * 2^(retry - 1) capped at the max delay
         */
        double backoff(size_t retry) const;
    };
}

#endif //SKEIN_RETRYPOLICY_H
