//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <memory>
#include <Logger.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <sstream>

Logger::Logger() : _initialized(false), _default_handler(nullptr) {
}

void Logger::initDefault() {
    if(!_initialized) {
        try {
            _sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
#ifndef NDEBUG
            // disable slow log in release mode
            _sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>("log.txt"));
#endif
            _initialized = true;
        } catch(const spdlog::spdlog_ex& ex) {
            std::cout<<"[FATAL] Initialization of logging system failed: "<<ex.what()<<std::endl;
            exit(1);
        }
    }

    if(!_default_handler)
        _default_handler = std::make_shared<MessageHandler>();
}

void Logger::init(const std::vector<spdlog::sink_ptr> &sinks) {
    Logger& log = Logger::instance();

    if(sinks.empty()) {
        std::cerr<<"[FATAL] Initialization of logging system failed: no sinks given"<<std::endl;
        exit(1);
    }

    log.reset();
    std::unique_lock<std::mutex> lock(log._mutex);
    log._sinks = sinks;
    log._initialized = true;
    log.initDefault();
}

MessageHandler& Logger::logger(const std::string &name) {

    try {
        std::unique_lock<std::mutex> lock(_mutex);
        // setup sinks if required
        initDefault();

        // empty name maps to the global handler
        auto key = name.empty() ? std::string("global") : name;

        // check if a message handler under this name is already registered
        // if not create, else return reference
        auto it = _handlers.find(key);
        if(it != _handlers.end())
            return it->second;
        else {
            _handlers[key] = MessageHandler().setName(key);

            // create the logger and register it
            auto spdlogger = std::make_shared<spdlog::logger>(key, _sinks.begin(), _sinks.end());
#ifndef NDEBUG
            spdlogger->set_level(spdlog::level::debug);
#endif
            spdlog::register_logger(spdlogger);

            return _handlers[key];
        }
    } catch(const spdlog::spdlog_ex& ex) {
        std::stringstream ss;
        ss<<"exception while attempting to retrieve logger '"<<name<<"': "<<ex.what();

        if(_default_handler) {
            ss<<", returning default handler instead";
            _default_handler->error(ss.str());
            return *_default_handler;
        } else {
            ss<<"\nNo default handler found, shutting down program with exit code 1, FATAL ERROR.";
            std::cerr<<ss.str()<<std::endl;
            std::cerr.flush();
            exit(1);
        }
    }
}

void Logger::error(const std::string &name, const std::string &message) {
    auto log = spdlog::get(name);
    if(log)
        log->error(message);
}

void Logger::debug(const std::string &name, const std::string &message) {
#ifndef NDEBUG
    auto log = spdlog::get(name);
    if(log)
        log->debug(message);
#endif
}

void Logger::warn(const std::string &name, const std::string &message) {
    auto log = spdlog::get(name);
    if(log)
       log->warn(message);
}

void Logger::info(const std::string &name, const std::string &message) {
    auto log = spdlog::get(name);
    if(log)
        log->info(message);
}

void Logger::flushAll() {
    std::unique_lock<std::mutex> lock(_mutex);
    for(const auto& it : _handlers) {
        auto log = spdlog::get(it.first);
        // log may be nullptr. Hence, only flush if valid.
        if(log)
            log->flush();
    }
}
