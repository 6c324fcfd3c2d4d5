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
#include <StringUtils.h>
#include <Utils.h>
#include <optional.h>

TEST(StringUtils, IntegerRecognition) {
    using namespace skein;

    EXPECT_FALSE(isIntegerString("100-200"));

    EXPECT_TRUE(isIntegerString("0"));
    EXPECT_TRUE(isIntegerString("0234"));
    EXPECT_TRUE(isIntegerString("-20"));
    EXPECT_TRUE(isIntegerString(" 42 "));
    EXPECT_FALSE(isIntegerString(""));
    EXPECT_FALSE(isIntegerString("-"));
    EXPECT_FALSE(isIntegerString("10.5"));
    EXPECT_FALSE(isIntegerString("Hello world"));
    EXPECT_FALSE(isIntegerString("--10"));
}

TEST(StringUtils, FloatRecognition) {
    using namespace skein;
    EXPECT_FALSE(isFloatString("0-30"));
    EXPECT_TRUE(isFloatString("0"));
    EXPECT_TRUE(isFloatString("-20"));
    EXPECT_TRUE(isFloatString("10.5"));
    EXPECT_TRUE(isFloatString(".4"));
    EXPECT_TRUE(isFloatString(".4e-30"));
    EXPECT_FALSE(isFloatString("..4"));
    EXPECT_FALSE(isFloatString("Hello world"));
}

TEST(StringUtils, BoolStrings) {
    using namespace skein;

    EXPECT_TRUE(isBoolString("true"));
    EXPECT_TRUE(isBoolString("False"));
    EXPECT_TRUE(isBoolString(" ON "));
    EXPECT_FALSE(isBoolString("maybe"));

    EXPECT_TRUE(parseBoolString("yes"));
    EXPECT_FALSE(parseBoolString("0"));
    EXPECT_THROW(parseBoolString("2"), std::invalid_argument);

    // logs an error and falls back to false
    EXPECT_FALSE(stringToBool("whatever"));
    EXPECT_TRUE(stringToBool("TRUE"));
}

TEST(StringUtils, Pluralize) {
    using namespace skein;
    EXPECT_EQ(pluralize(0, "task"), "0 tasks");
    EXPECT_EQ(pluralize(1, "task"), "1 task");
    EXPECT_EQ(pluralize(7, "stage"), "7 stages");
}

TEST(StringUtils, TrimAndCase) {
    using namespace skein;
    EXPECT_EQ(trim("  hello world \t\n"), "hello world");
    std::string s = "\t x";
    trim(s);
    EXPECT_EQ(s, "x");
    EXPECT_EQ(toLower("Object_Store_MEMORY"), "object_store_memory");
}

TEST(StringUtils, Join) {
    using namespace skein;
    std::vector<std::string> names{"source", "map", "filter"};
    EXPECT_EQ(join(names, "->"), "source->map->filter");
    EXPECT_EQ(join(std::vector<int>{1, 2, 3}, ", "), "1, 2, 3");
    EXPECT_EQ(join(std::vector<int>{}, ", "), "");
}

TEST(Utils, MemoryStrings) {
    using namespace skein;

    EXPECT_EQ(memStringToSize("512"), 512);
    EXPECT_EQ(memStringToSize("1KB"), 1024);
    EXPECT_EQ(memStringToSize("64mb"), 64 * 1024 * 1024);
    EXPECT_EQ(memStringToSize("2g512m"), 2 * 1024ul * 1024 * 1024 + 512 * 1024ul * 1024);
    EXPECT_EQ(memStringToSize("1.5GB"), 1536ul * 1024 * 1024);

    // malformed strings are reported and yield 0
    EXPECT_EQ(memStringToSize(""), 0);
    EXPECT_EQ(memStringToSize("MB"), 0);
    EXPECT_EQ(memStringToSize("10 parsecs"), 0);

    EXPECT_EQ(sizeToMemString(1024), "1.00 KB");
    EXPECT_EQ(sizeToMemString(100), "100.00 B");
}

TEST(Utils, UniqueIDs) {
    using namespace skein;
    auto a = getUniqueID();
    auto b = getUniqueID();
    EXPECT_NE(a, b);
    EXPECT_EQ(uuidToString(a).length(), 36);
}

TEST(Utils, Option) {
    using namespace skein;

    option<size_t> none;
    EXPECT_FALSE(none.has_value());
    EXPECT_EQ(none.value_or(42), 42);
    EXPECT_THROW(none.value(), std::runtime_error);

    option<size_t> some(7);
    EXPECT_TRUE(some.has_value());
    EXPECT_EQ(some.value(), 7);
    EXPECT_TRUE(some == static_cast<size_t>(7));
    EXPECT_TRUE(none == option<size_t>::none);
    EXPECT_TRUE(some != none);
}
