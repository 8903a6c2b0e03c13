/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <coproc/protocol.hpp>
#include <coproc/service.hpp>

#include <map>
#include <vector>


namespace coproc {


    /// The commands the key value store understands
    enum class kv_command { set, get, list, quit, unknown };

    /// Parse the verb of a key value command
    kv_command parse_kv_command(const std::string &verb);


    /// The key value store that runs inside the worker process
    class kv_store final {
        std::map<std::string, std::string> values;

      public:
        /// Execute one command line
        reply operator()(const std::string &);

        /// The number of keys stored
        std::size_t size() const { return values.size(); }
    };

    /// The worker loop for the key value store
    void serve_kv(std::istream &in, std::ostream &out);


    /// Talks to a key value store worker
    class kv_client final : public service {
      public:
        /// Start a worker running the key value store
        explicit kv_client(
                std::chrono::milliseconds timeout = std::chrono::milliseconds{});
        /// Use a different worker program
        kv_client(command, std::chrono::milliseconds timeout);

        /// Store the value. Returns the response, which is `OK` unless the
        /// request was malformed. Throws `std::invalid_argument` for a key
        /// that is empty or has whitespace in it
        std::string set(const std::string &key, const std::string &value);
        /// Fetch a value. Empty if the key isn't set
        line get(const std::string &key);
        /// All of the keys, in order
        std::vector<std::string> list();
        /// Tell the worker to stop and wait for it. Returns `BYE`
        std::string quit();
    };


}
