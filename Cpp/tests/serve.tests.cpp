/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/configuration.hpp>
#include <coproc/serve.hpp>

#include <gtest/gtest.h>

#include <sstream>


TEST(WorkerKind, Parse) {
    EXPECT_EQ(coproc::parse_worker_kind("task"), coproc::worker_kind::task);
    EXPECT_EQ(coproc::parse_worker_kind("kv"), coproc::worker_kind::kv);
    EXPECT_EQ(coproc::parse_worker_kind("lease"), coproc::worker_kind::lease);
    EXPECT_EQ(
            coproc::parse_worker_kind("processor"),
            coproc::worker_kind::processor);
    EXPECT_THROW(coproc::parse_worker_kind("Task"), std::invalid_argument);
    EXPECT_THROW(coproc::parse_worker_kind(""), std::invalid_argument);
}


TEST(Stages, Generate) {
    std::ostringstream out;
    coproc::generate(out, 3, "data", std::chrono::milliseconds{});
    EXPECT_EQ(out.str(), "data1\ndata2\ndata3\n");
}


TEST(Stages, Upper) {
    std::istringstream in{"data1\nMixed Case\n"};
    std::ostringstream out;
    coproc::upper(in, out);
    EXPECT_EQ(out.str(), "DATA1\nMIXED CASE\n");
}


TEST(Stages, Needles) {
    EXPECT_EQ(coproc::needles("3,5"), (std::vector<std::string>{"3", "5"}));
    EXPECT_EQ(coproc::needles(",a,,b,"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(coproc::needles("").empty());
}


TEST(Stages, Filter) {
    std::istringstream in{"DATA1\nDATA2\nDATA3\nDATA4\nDATA5\n"};
    std::ostringstream out;
    coproc::filter(in, out, {"3", "5"});
    EXPECT_EQ(out.str(), "DATA3\nDATA5\n");
}


TEST(Stages, FilterWithoutNeedlesPassesAll) {
    std::istringstream in{"a\nb\n"};
    std::ostringstream out;
    coproc::filter(in, out, {});
    EXPECT_EQ(out.str(), "a\nb\n");
}


TEST(Stages, Echo) {
    std::istringstream in{"test message\n"};
    std::ostringstream out;
    coproc::echo(in, out);
    EXPECT_EQ(out.str(), "PROC: test message\n");
}


TEST(Stages, Processor) {
    std::istringstream in{"test1\nerror\ntest2\nquit\ntest3\n"};
    std::ostringstream out, report;
    coproc::processor(in, out, report);
    EXPECT_EQ(out.str(), "Processed: test1\nProcessed: test2\n");
    EXPECT_EQ(report.str(), "ERROR Invalid input\n");
}


TEST(Stages, Tasks) {
    const fostlib::setting<unsigned> mean{
            __FILE__, coproc::c_sim_mean, 1u};
    const fostlib::setting<unsigned> sd{__FILE__, coproc::c_sim_sd, 1u};
    std::istringstream in{"job1\n\njob2\nquit\njob3\n"};
    std::ostringstream out, report;
    coproc::serve_tasks(in, out, report);
    EXPECT_EQ(out.str(), "job1\njob2\n");
    EXPECT_NE(report.str().find("Worker 0 processing: job1\n"), std::string::npos);
    EXPECT_NE(report.str().find("Worker 0 processing: job2\n"), std::string::npos);
    EXPECT_EQ(report.str().find("job3"), std::string::npos);
}
