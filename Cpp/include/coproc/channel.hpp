/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#define BOOST_COROUTINES_NO_DEPRECATION_WARNING
#define BOOST_COROUTINE_NO_DEPRECATION_WARNING


#include <coproc/pipe.hpp>

#include <boost/asio/spawn.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/noncopyable.hpp>

#include <chrono>
#include <experimental/optional>
#include <string>


namespace coproc {


    /// A line is either a line of text or the end of the stream
    using line = std::experimental::optional<std::string>;


    /// The driver's side of the two pipes connecting it to a worker's
    /// stdin and stdout. Every message is one line of text.
    ///
    /// One thread (or coroutine) may write and one may read at a time.
    class channel final : boost::noncopyable {
        boost::asio::io_service &ios;
        boost::asio::streambuf buffer;

        /// Pull the next line out of the buffer
        line take_line(std::size_t bytes, boost::system::error_code error);
        /// True if the buffer already holds a complete line
        bool buffered_line() const;

      public:
        /// Create the pipes. The descriptors used for ASIO belong to `ios`
        explicit channel(boost::asio::io_service &ios);

        /// The worker's stdin
        pipe_in input;
        /// The worker's stdout
        pipe_out output;

        /// Run in the child after the fork. Connects the child ends to
        /// stdin and stdout
        void attach_child();
        /// Run in the parent after the fork. Drops the child ends so end
        /// of file works in both directions
        void detach_child();

        /// Send a line, blocking until it has been written. Throws
        /// `channel_error` if the worker's stdin is gone
        void write_line(const std::string &);
        /// Send a line from a coroutine
        void write_line(const std::string &, boost::asio::yield_context);

        /// Block until a line arrives. Empty at end of stream
        line read_line();
        /// Block until a line arrives or the timeout expires, in which
        /// case `channel_timeout` is thrown
        line read_line(std::chrono::milliseconds timeout);
        /// Wait in a coroutine for the next line
        line read_line(boost::asio::yield_context);

        /// Signal end of input to the worker
        void close_input();
        /// Close both directions
        void close();
    };


}
