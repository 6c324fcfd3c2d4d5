//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <Signals.h>
#include <atomic>
#include <cstring>
#include <unistd.h>
#include <Logger.h>

namespace skein {

    volatile sig_atomic_t do_shutdown = 0;
    std::atomic<bool> shutdown_requested(false);
    std::atomic_int sig_received(-1);

    void skein_signal_handler(int signum) {
        do_shutdown = 1;
        sig_received = signum;
        shutdown_requested = true;
#ifndef NDEBUG
        const char str[] = "\n => received signal SIGINT in skein_signal_handler, cancelling.\n";
        auto rc = write(STDERR_FILENO, str, sizeof(str) - 1); // write is signal safe, the others not.
        (void)rc;
#endif
    }

    bool install_signal_handlers() {

        // reset vars
        do_shutdown = 0;
        shutdown_requested = false;

        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = skein_signal_handler;
        sigemptyset(&action.sa_mask);

        if(0 == sigaction(SIGINT, &action, NULL))
            return true;
        else {
            // errno has description
            Logger::instance().defaultLogger().error("Failed to install custom signal handlers, details: " +
            std::string(strerror(errno)));
            return false;
        }
    }

    bool check_interrupted() {
        return do_shutdown && shutdown_requested.load();
    }

    void reset_signals() {
        do_shutdown = 0;
        shutdown_requested = false;
    }
}
