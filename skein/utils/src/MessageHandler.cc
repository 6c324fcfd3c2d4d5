//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <MessageHandler.h>
#include <Logger.h>
#include <StringUtils.h>

MessageHandler& MessageHandler::info(const std::string &message) {
    auto msg = message;
    skein::trim(msg);
    Logger::instance().info(_name, msg);
    return *this;
}

MessageHandler& MessageHandler::warn(const std::string &message) {
    Logger::instance().warn(_name, message);
    return *this;
}

MessageHandler& MessageHandler::error(const std::string &message) {
    Logger::instance().error(_name, message);
    return *this;
}

MessageHandler& MessageHandler::debug(const std::string &message) {
#ifndef NDEBUG
    Logger::instance().debug(_name, message);
#endif
    return *this;
}
