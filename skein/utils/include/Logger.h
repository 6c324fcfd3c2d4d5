//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_LOGGER_H
#define SKEIN_LOGGER_H

#include <map>
#include <mutex>
#include <vector>
#include <MessageHandler.h>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

class Logger;
class MessageHandler;

/*!
 * singleton class that handles logging for the whole process. Per default logs are printed to console
 * (and in debug builds additionally stored in log.txt). Each component asks for a named handler, e.g.
 * Logger::instance().logger("scheduler").
 */
class Logger {
    friend class MessageHandler;
private:
    Logger();

    std::mutex _mutex;
    std::vector<spdlog::sink_ptr> _sinks;
    std::map<std::string, MessageHandler> _handlers;
    std::shared_ptr<MessageHandler> _default_handler;

    void warn(const std::string& name, const std::string& message);
    void error(const std::string& name, const std::string& message);
    void info(const std::string& name, const std::string& message);
    void debug(const std::string& name, const std::string& message);

    // to avoid deadlocks with spdlog, use lazy initialization
    bool _initialized;

    void initDefault();
public:

    static Logger& instance() {
        static Logger theoneandonly;
        return theoneandonly;
    }

    MessageHandler& logger(const std::string& name);

    MessageHandler& defaultLogger() { return logger("global"); }

    /*!
     * flushes all loggers.
     */
    void flushAll();

    /*!
     * replaces the sinks of all loggers, e.g. tests redirect output to a stream
     * @param sinks spdlog sinks to use from now on
     */
    static void init(const std::vector<spdlog::sink_ptr >& sinks={std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>()});

    /*!
     * reset all internal + spdlog structures, i.e. init can be called afterwards.
     */
    void reset() {
        std::unique_lock<std::mutex> lock(_mutex);

        // remove all sinks
        spdlog::drop_all();

        _handlers.clear();
        _sinks.clear();
        _initialized = false;
    }
};

#endif //SKEIN_LOGGER_H
