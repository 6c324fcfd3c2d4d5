//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include "gtest/gtest.h"
#include <Logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

class LoggerTest : public ::testing::Test {
protected:
    std::ostringstream logStream;

    void SetUp() override {
        Logger::init({std::make_shared<spdlog::sinks::ostream_sink_mt>(logStream)});
    }

    void TearDown() override {
        Logger::instance().reset();
    }
};

TEST_F(LoggerTest, NamedHandlers) {
    auto& a = Logger::instance().logger("scheduler");
    auto& b = Logger::instance().logger("scheduler");
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.name(), "scheduler");

    // empty name falls back to the global handler
    EXPECT_EQ(Logger::instance().logger("").name(), "global");
    EXPECT_EQ(Logger::instance().defaultLogger().name(), "global");
}

TEST_F(LoggerTest, RedirectToStream) {
    Logger::instance().logger("scheduler").info("submitted 3 tasks");
    Logger::instance().logger("local ee").warn("executor E/1 is idle");
    Logger::instance().flushAll();

    auto log = logStream.str();
    EXPECT_NE(log.find("submitted 3 tasks"), std::string::npos);
    EXPECT_NE(log.find("[scheduler]"), std::string::npos);
    EXPECT_NE(log.find("executor E/1 is idle"), std::string::npos);
}
