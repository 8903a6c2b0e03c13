/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/protocol.hpp>

#include <gtest/gtest.h>

#include <sstream>


namespace {


    /// Answers every command with its length and stops on `stop`
    struct counter {
        std::size_t seen = 0;
        coproc::reply operator()(const std::string &command) {
            ++seen;
            if (command == "stop") return {coproc::line{}, true};
            if (command == "silent") return {};
            return {std::to_string(command.size())};
        }
    };


}


TEST(SplitVerb, VerbAndRest) {
    const auto parts = coproc::split_verb("SET name John Smith");
    EXPECT_EQ(parts.first, "SET");
    EXPECT_EQ(parts.second, "name John Smith");
}


TEST(SplitVerb, LeadingWhitespaceIsDropped) {
    const auto parts = coproc::split_verb("  \tGET \t key");
    EXPECT_EQ(parts.first, "GET");
    EXPECT_EQ(parts.second, "key");
}


TEST(SplitVerb, VerbOnly) {
    const auto parts = coproc::split_verb("LIST");
    EXPECT_EQ(parts.first, "LIST");
    EXPECT_TRUE(parts.second.empty());
    EXPECT_EQ(coproc::split_verb("STATUS \r").first, "STATUS");
    EXPECT_TRUE(coproc::split_verb("STATUS \r").second.empty());
}


TEST(SplitVerb, Blank) {
    EXPECT_TRUE(coproc::split_verb("").first.empty());
    EXPECT_TRUE(coproc::split_verb("   ").first.empty());
}


TEST(Serve, OneResponsePerCommand) {
    counter engine;
    std::istringstream in{"a\nabc\n\nsilent\nabcde\n"};
    std::ostringstream out;
    coproc::serve(engine, in, out);
    EXPECT_EQ(engine.seen, 5u);
    EXPECT_EQ(out.str(), "1\n3\n0\n5\n");
}


TEST(Serve, StopsWhenAsked) {
    counter engine;
    std::istringstream in{"one\nstop\nnever\n"};
    std::ostringstream out;
    coproc::serve(engine, in, out);
    EXPECT_EQ(engine.seen, 2u);
    EXPECT_EQ(out.str(), "3\n");
}


TEST(Serve, LastLineWithoutNewline) {
    counter engine;
    std::istringstream in{"ab\nxyz"};
    std::ostringstream out;
    coproc::serve(engine, in, out);
    EXPECT_EQ(out.str(), "2\n3\n");
}
