/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include "support.hpp"

#include <coproc/service.lease.hpp>

#include <gtest/gtest.h>

#include <set>
#include <sstream>


class LeaseTable : public ::testing::Test {
  protected:
    coproc::lease_table table{3};

    std::string send(const std::string &command) {
        return table(command).response.value_or("<none>");
    }
};


TEST_F(LeaseTable, CapacityIsEnforced) {
    EXPECT_EQ(send("ACQUIRE"), "GRANTED res1");
    EXPECT_EQ(send("ACQUIRE"), "GRANTED res2");
    EXPECT_EQ(send("ACQUIRE"), "GRANTED res3");
    EXPECT_EQ(send("ACQUIRE"), "ERROR Resource limit reached");
    EXPECT_EQ(table.leased(), 3u);
    EXPECT_EQ(send("RELEASE res2"), "OK Released res2");
    EXPECT_EQ(send("ACQUIRE"), "GRANTED res4");
    EXPECT_EQ(table.leased(), table.capacity);
}


TEST_F(LeaseTable, ReleaseOnlyOnce) {
    EXPECT_EQ(send("ACQUIRE"), "GRANTED res1");
    EXPECT_EQ(send("RELEASE res1"), "OK Released res1");
    EXPECT_EQ(send("RELEASE res1"), "ERROR Invalid resource id");
    EXPECT_EQ(send("RELEASE res9"), "ERROR Invalid resource id");
    EXPECT_EQ(send("RELEASE"), "ERROR Invalid resource id");
}


TEST_F(LeaseTable, Status) {
    EXPECT_EQ(send("STATUS"), "INFO Active: 0, Available: 3");
    send("ACQUIRE");
    send("ACQUIRE");
    EXPECT_EQ(send("STATUS"), "INFO Active: 2, Available: 1");
}


TEST_F(LeaseTable, IdsAreNeverReused) {
    std::set<std::string> seen;
    for (std::size_t round{}; round != 10; ++round) {
        const auto granted = send("ACQUIRE");
        ASSERT_EQ(granted.substr(0, 8), "GRANTED ");
        const auto id = granted.substr(8);
        EXPECT_TRUE(seen.insert(id).second) << id;
        EXPECT_EQ(send("RELEASE " + id), "OK Released " + id);
    }
}


TEST_F(LeaseTable, UnknownAndQuit) {
    EXPECT_EQ(send("BORROW"), "ERROR Unknown command");
    const auto r = table("QUIT");
    EXPECT_FALSE(bool(r.response));
    EXPECT_TRUE(r.stop);
}


TEST_F(LeaseTable, ZeroCapacity) {
    coproc::lease_table none{0};
    EXPECT_EQ(*none("ACQUIRE").response, "ERROR Resource limit reached");
    EXPECT_EQ(*none("STATUS").response, "INFO Active: 0, Available: 0");
}


TEST_F(LeaseTable, WorkerLoop) {
    std::istringstream in{"ACQUIRE\nSTATUS\nQUIT\nACQUIRE\n"};
    std::ostringstream out;
    coproc::serve_leases(in, out, 1);
    EXPECT_EQ(out.str(), "GRANTED res1\nINFO Active: 1, Available: 0\n");
}


class LeaseClient : public ::testing::Test {
  protected:
    void SetUp() override { coproc::test::use_built_worker(); }
};


TEST_F(LeaseClient, ExhaustAndRelease) {
    coproc::lease_client manager{2};
    const auto first = manager.acquire();
    const auto second = manager.acquire();
    ASSERT_TRUE(bool(first));
    ASSERT_TRUE(bool(second));
    EXPECT_NE(*first, *second);
    EXPECT_FALSE(bool(manager.acquire()));
    EXPECT_EQ(manager.status(), "INFO Active: 2, Available: 0");
    EXPECT_TRUE(manager.release(*first));
    EXPECT_FALSE(manager.release(*first));
    const auto third = manager.acquire();
    ASSERT_TRUE(bool(third));
    EXPECT_NE(*third, *first);
    manager.quit();
    EXPECT_EQ(manager.state(), coproc::worker_state::terminated);
}


TEST_F(LeaseClient, RawRequests) {
    coproc::lease_client manager{3, std::chrono::milliseconds{5000}};
    EXPECT_EQ(manager.request("ACQUIRE"), "GRANTED res1");
    EXPECT_EQ(manager.request("ACQUIRE"), "GRANTED res2");
    EXPECT_EQ(manager.request("STATUS"), "INFO Active: 2, Available: 1");
    EXPECT_EQ(manager.request("RELEASE res1"), "OK Released res1");
    EXPECT_EQ(manager.request("HELLO"), "ERROR Unknown command");
    manager.quit();
}


TEST_F(LeaseClient, UnexpectedReleaseResponse) {
    coproc::lease_client manager{
            coproc::test::worker("echo"), std::chrono::milliseconds{5000}};
    EXPECT_THROW(
            manager.release("res1"), fostlib::exceptions::not_implemented);
    EXPECT_EQ(manager.state(), coproc::worker_state::idle);
    manager.terminate();
}
