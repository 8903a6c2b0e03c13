/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <coproc/worker.hpp>

#include <chrono>


namespace coproc {


    /// The driver side of a request/response worker. One command goes out,
    /// exactly one line comes back. Only one caller may use an instance.
    class service : boost::noncopyable {
        boost::asio::io_service ios;

      protected:
        /// The worker process
        coproc::worker process;
        /// How long to wait for a response. Zero waits forever
        const std::chrono::milliseconds timeout;
        /// Responses still to come for requests that timed out
        std::size_t owed = 0;

        /// Send a final command and wait for the worker to exit. When
        /// `answered` is set the response line is read first and returned
        line stop(const std::string &command, bool answered);

      public:
        /// Spawn the worker. Throws `spawn_error` if it can't be started
        explicit service(
                command cmd,
                std::chrono::milliseconds timeout = std::chrono::milliseconds{});
        virtual ~service() = default;

        /// Send a line and return the response. A protocol error is a
        /// normal `ERROR ...` response. Throws `channel_error` if the
        /// worker has gone, and `channel_timeout` if the timeout expires.
        /// The response to a request that timed out is still owed, and is
        /// read and dropped before the next request's response.
        /// Throws `std::invalid_argument` for a line with a newline in it
        std::string request(const std::string &);
        /// As above with a different timeout for this request
        std::string request(const std::string &, std::chrono::milliseconds);

        /// Force the worker to end now
        int terminate() { return process.terminate(); }

        /// The worker's current state
        worker_state state() const { return process.state(); }
        /// The worker's process ID
        int pid() const { return process.pid; }
    };


}
