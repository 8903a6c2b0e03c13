/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <coproc/worker.hpp>


namespace coproc {


    namespace test {


        /// Make `worker_program` run the worker the build produced
        void use_built_worker();

        /// The command for the built worker running the given loop
        command worker(
                const std::string &kind, std::vector<std::string> switches = {});


    }


}
