/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include "support.hpp"

#include <coproc/exception.hpp>

#include <boost/asio/read.hpp>

#include <gtest/gtest.h>

#include <sstream>

#include <sys/wait.h>


using coproc::worker_state;


TEST(WorkerState, Transitions) {
    EXPECT_TRUE(coproc::can_transition(worker_state::starting, worker_state::idle));
    EXPECT_TRUE(coproc::can_transition(worker_state::idle, worker_state::busy));
    EXPECT_TRUE(coproc::can_transition(worker_state::busy, worker_state::idle));
    EXPECT_TRUE(coproc::can_transition(
            worker_state::idle, worker_state::terminating));
    EXPECT_TRUE(coproc::can_transition(
            worker_state::terminating, worker_state::terminated));
    EXPECT_TRUE(coproc::can_transition(
            worker_state::busy, worker_state::terminated));
    EXPECT_TRUE(coproc::can_transition(
            worker_state::starting, worker_state::terminated));

    EXPECT_FALSE(coproc::can_transition(worker_state::idle, worker_state::starting));
    EXPECT_FALSE(coproc::can_transition(
            worker_state::busy, worker_state::terminating));
    EXPECT_FALSE(coproc::can_transition(
            worker_state::terminating, worker_state::idle));
    EXPECT_FALSE(coproc::can_transition(
            worker_state::terminated, worker_state::idle));
    EXPECT_FALSE(coproc::can_transition(
            worker_state::terminated, worker_state::terminated));
}


TEST(WorkerState, Names) {
    std::ostringstream out;
    out << worker_state::terminating;
    EXPECT_EQ(out.str(), "terminating");
    EXPECT_STREQ(coproc::to_string(worker_state::idle), "idle");
}


class Worker : public ::testing::Test {
  protected:
    boost::asio::io_service ios;
};


TEST_F(Worker, Lifecycle) {
    coproc::worker w{1, ios, coproc::test::worker("echo")};
    EXPECT_EQ(w.state(), worker_state::starting);
    w.spawn();
    EXPECT_GT(w.pid, 0);
    EXPECT_EQ(w.state(), worker_state::idle);
    w.transition(worker_state::busy);
    EXPECT_THROW(w.transition(worker_state::terminating), std::logic_error);
    w.transition(worker_state::idle);
    w.transition(worker_state::terminating);
    w.io.close_input();
    const auto status = w.wait();
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_TRUE(w.finished());
    EXPECT_TRUE(w.has_exited());
    EXPECT_EQ(w.status(), status);
}


TEST_F(Worker, MissingProgram) {
    coproc::worker w{1, ios, {"/nonexistent/coproc-worker-program"}};
    EXPECT_THROW(w.spawn(), coproc::spawn_error);
    EXPECT_TRUE(w.finished());
}


TEST_F(Worker, SpawnErrorCarriesErrno) {
    coproc::worker w{1, ios, {"/nonexistent/coproc-worker-program"}};
    try {
        w.spawn();
        FAIL() << "The spawn should have failed";
    } catch (coproc::spawn_error &e) {
        EXPECT_EQ(e.code().value(), ENOENT);
    }
}


TEST_F(Worker, EmptyCommand) {
    EXPECT_THROW(
            coproc::worker(1, ios, coproc::command{}), std::invalid_argument);
}


TEST_F(Worker, Terminate) {
    coproc::worker w{1, ios, coproc::test::worker("kv")};
    w.spawn();
    w.terminate();
    EXPECT_TRUE(w.finished());
    EXPECT_TRUE(w.has_exited());
}


TEST_F(Worker, UnknownKindExitsWithError) {
    coproc::worker w{1, ios, coproc::test::worker("nonsense"), true};
    w.spawn();
    w.io.close_input();
    const auto status = w.wait();
    EXPECT_TRUE(WIFEXITED(status));
    EXPECT_NE(WEXITSTATUS(status), 0);
}


TEST_F(Worker, SideChannel) {
    coproc::worker w{1, ios, coproc::test::worker("processor"), true};
    w.spawn();
    w.io.write_line("error");
    w.io.write_line("quit");
    w.io.close_input();
    EXPECT_FALSE(bool(w.io.read_line()));
    w.wait();
    boost::asio::streambuf buffer;
    boost::system::error_code error;
    boost::asio::read((*w.errors).parent(ios), buffer, error);
    EXPECT_EQ(error, boost::asio::error::eof);
    std::ostringstream side;
    side << &buffer;
    EXPECT_EQ(side.str(), "ERROR Invalid input\n");
}
