/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include "support.hpp"

#include <coproc/configuration.hpp>

#include <fost/push_back>


void coproc::test::use_built_worker() {
    static const fostlib::setting<fostlib::json> exec{
            __FILE__, coproc::c_worker_exec, []() {
                fostlib::json cmd;
                fostlib::push_back(cmd, COPROC_WORKER_EXECUTABLE);
                return cmd;
            }()};
}


coproc::command coproc::test::worker(
        const std::string &kind, std::vector<std::string> switches) {
    use_built_worker();
    return worker_program(kind, std::move(switches));
}
