//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_SIGNALS_H
#define SKEIN_SIGNALS_H

#include <cerrno>
#include <csignal>

namespace skein {

    /*!
     * install custom SIGINT handler, an interrupt is then observed by running executions
     * @return true if install succeeded
     */
    extern bool install_signal_handlers();

    /*!
     * returns true if SIGINT was received, can be used to leave control flow early.
     * @return true if SIGINT was received
     */
    extern bool check_interrupted();

    /*!
     * reset signal indicators
     */
    extern void reset_signals();
}

#endif //SKEIN_SIGNALS_H
