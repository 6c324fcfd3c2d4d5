//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_TIMER_H
#define SKEIN_TIMER_H

#include <chrono>
#include <cstdint>

namespace skein {
    class Timer {
    private:
        std::chrono::high_resolution_clock::time_point _start;
    public:

        Timer() {
            reset();
        }

        // nanoseconds since 1970
        static int64_t currentTimestamp();

        /*!
         * returns time since start of the timer in seconds
         * @return time in seconds
         */
        double time() const {
            auto stop = std::chrono::high_resolution_clock::now();

            double duration = std::chrono::duration_cast<std::chrono::nanoseconds>(stop - _start).count() / 1000000000.0;
            return duration;
        }

        void reset() {
            _start = std::chrono::high_resolution_clock::now();
        }

    };
}
#endif //SKEIN_TIMER_H
