//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_MESSAGEHANDLER_H
#define SKEIN_MESSAGEHANDLER_H

#include <spdlog/spdlog.h>

/*!
 * helper class to handle all kind of logging messages. Can be provided optionally to most interfaces.
 */
class MessageHandler {
private:
    std::string _name;
public:
    MessageHandler() : _name("global")  {}
    MessageHandler(const std::string& name) : _name(name)   {}
    MessageHandler(const MessageHandler& other) : _name(other._name) {}

    virtual ~MessageHandler() {}

    MessageHandler& setName(const std::string& name) { _name = name; return *this; }
    std::string name() const { return _name; }

    MessageHandler& error(const std::string& message);
    MessageHandler& warn(const std::string& message);
    MessageHandler& info(const std::string& message);
    MessageHandler& debug(const std::string& message);
};

#endif //SKEIN_MESSAGEHANDLER_H
