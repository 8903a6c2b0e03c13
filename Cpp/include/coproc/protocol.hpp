/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <coproc/channel.hpp>

#include <iostream>
#include <string>
#include <utility>


namespace coproc {


    /// The task payload that tells a pool worker to stop
    constexpr char sentinel_task[] = "quit";


    /// Split a command line into its verb and the rest of the line. Leading
    /// whitespace is dropped from both
    std::pair<std::string, std::string> split_verb(const std::string &);


    /// What a protocol engine does with one command
    struct reply {
        /// The line to send back, if any
        line response;
        /// Set when the worker loop should end after the response
        bool stop = false;
    };


    /// Read commands from `in` and hand them to the engine one at a time.
    /// Every response is flushed before the next command is read. Ends when
    /// the engine asks to stop or the input is closed.
    template<typename Engine>
    void serve(Engine &engine, std::istream &in, std::ostream &out) {
        std::string command;
        while (std::getline(in, command)) {
            const auto r = engine(command);
            if (r.response) out << *r.response << std::endl;
            if (r.stop) break;
        }
    }


}
