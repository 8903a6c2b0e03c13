/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include "support.hpp"

#include <coproc/exception.hpp>
#include <coproc/service.kv.hpp>

#include <gtest/gtest.h>

#include <sstream>


class KvStore : public ::testing::Test {
  protected:
    coproc::kv_store store;

    std::string send(const std::string &command) {
        return store(command).response.value_or("<none>");
    }
};


TEST_F(KvStore, SetThenGet) {
    EXPECT_EQ(send("SET k v"), "OK");
    EXPECT_EQ(send("GET k"), "VALUE v");
    EXPECT_EQ(send("SET k w"), "OK");
    EXPECT_EQ(send("GET k"), "VALUE w");
    EXPECT_EQ(store.size(), 1u);
}


TEST_F(KvStore, GetUnsetKey) { EXPECT_EQ(send("GET nope"), "NOT_FOUND"); }


TEST_F(KvStore, ValuesKeepTheirSpaces) {
    EXPECT_EQ(send("SET greeting hello there world"), "OK");
    EXPECT_EQ(send("GET greeting"), "VALUE hello there world");
}


TEST_F(KvStore, ListIsSorted) {
    EXPECT_EQ(send("LIST"), "KEYS");
    send("SET name John");
    send("SET age 30");
    EXPECT_EQ(send("LIST"), "KEYS age name");
}


TEST_F(KvStore, ProtocolErrors) {
    EXPECT_EQ(send("SET"), "ERROR Missing argument");
    EXPECT_EQ(send("SET key"), "ERROR Missing argument");
    EXPECT_EQ(send("GET"), "ERROR Missing argument");
    EXPECT_EQ(send("DELETE key"), "ERROR Unknown command");
    EXPECT_EQ(send("set k v"), "ERROR Unknown command");
    EXPECT_EQ(send(""), "ERROR Unknown command");
    EXPECT_EQ(store.size(), 0u);
}


TEST_F(KvStore, QuitAnswersThenStops) {
    const auto r = store("QUIT");
    ASSERT_TRUE(bool(r.response));
    EXPECT_EQ(*r.response, "BYE");
    EXPECT_TRUE(r.stop);
}


TEST_F(KvStore, WorkerLoop) {
    std::istringstream in{"SET name John\nGET name\nQUIT\nGET name\n"};
    std::ostringstream out;
    coproc::serve_kv(in, out);
    EXPECT_EQ(out.str(), "OK\nVALUE John\nBYE\n");
}


class KvClient : public ::testing::Test {
  protected:
    void SetUp() override { coproc::test::use_built_worker(); }
};


TEST_F(KvClient, Conversation) {
    coproc::kv_client kv;
    EXPECT_EQ(kv.state(), coproc::worker_state::idle);
    EXPECT_EQ(kv.request("SET name John"), "OK");
    EXPECT_EQ(kv.request("GET name"), "VALUE John");
    EXPECT_EQ(kv.quit(), "BYE");
    EXPECT_EQ(kv.state(), coproc::worker_state::terminated);
}


TEST_F(KvClient, TypedCalls) {
    coproc::kv_client kv{std::chrono::milliseconds{5000}};
    EXPECT_EQ(kv.set("city", "New York"), "OK");
    EXPECT_EQ(kv.set("age", "30"), "OK");
    const auto city = kv.get("city");
    ASSERT_TRUE(bool(city));
    EXPECT_EQ(*city, "New York");
    EXPECT_FALSE(bool(kv.get("missing")));
    EXPECT_EQ(kv.list(), (std::vector<std::string>{"age", "city"}));
    EXPECT_EQ(kv.request("FLUSH"), "ERROR Unknown command");
    EXPECT_EQ(kv.quit(), "BYE");
}


TEST_F(KvClient, TerminateIsRepeatable) {
    coproc::kv_client kv;
    EXPECT_EQ(kv.set("a", "1"), "OK");
    const auto status = kv.terminate();
    EXPECT_EQ(kv.state(), coproc::worker_state::terminated);
    EXPECT_EQ(kv.terminate(), status);
}


TEST_F(KvClient, RequestAfterTerminateIsRejected) {
    coproc::kv_client kv;
    kv.terminate();
    EXPECT_THROW(kv.request("GET a"), std::logic_error);
}


TEST_F(KvClient, LateResponseIsDropped) {
    coproc::kv_client slow{
            coproc::test::worker("task", {"--sim-mean", "300", "--sim-sd", "1"}),
            std::chrono::milliseconds{50}};
    EXPECT_THROW(slow.request("first"), coproc::channel_timeout);
    EXPECT_EQ(slow.state(), coproc::worker_state::idle);
    EXPECT_EQ(slow.request("second", std::chrono::milliseconds{5000}), "second");
    EXPECT_EQ(slow.request("third", std::chrono::milliseconds{5000}), "third");
    slow.terminate();
}


TEST_F(KvClient, BadFramingLeavesClientUsable) {
    coproc::kv_client kv{std::chrono::milliseconds{5000}};
    EXPECT_EQ(kv.set("a", "1"), "OK");
    EXPECT_THROW(kv.request("SET a\nb x"), std::invalid_argument);
    EXPECT_EQ(kv.state(), coproc::worker_state::idle);
    const auto a = kv.get("a");
    ASSERT_TRUE(bool(a));
    EXPECT_EQ(*a, "1");
    EXPECT_EQ(kv.quit(), "BYE");
}


TEST_F(KvClient, KeysAreOneWord) {
    coproc::kv_client kv{std::chrono::milliseconds{5000}};
    EXPECT_THROW(kv.set("my key", "v"), std::invalid_argument);
    EXPECT_THROW(kv.set("a\nb", "x"), std::invalid_argument);
    EXPECT_THROW(kv.get(""), std::invalid_argument);
    EXPECT_EQ(kv.set("key", "value with spaces"), "OK");
    EXPECT_EQ(kv.list(), std::vector<std::string>{"key"});
    EXPECT_EQ(kv.quit(), "BYE");
}
