/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <fost/core>

#include <string>
#include <vector>


namespace coproc {


    /// Modules describing the system
    extern const fostlib::module c_coproc;
    extern const fostlib::module c_pool;
    extern const fostlib::module c_pipeline;
    extern const fostlib::module c_service;
    extern const fostlib::module c_worker;


    /// The worker program. A JSON array holding the start of the argv
    extern const fostlib::setting<fostlib::json> c_worker_exec;
    /// The number of workers the driver puts in a pool
    extern const fostlib::setting<int64_t> c_pool_size;
    /// Milliseconds a worker gets to exit after the sentinel before it is
    /// killed
    extern const fostlib::setting<unsigned> c_shutdown_grace;
    /// Milliseconds the demo driver waits for a response. Zero waits forever
    extern const fostlib::setting<unsigned> c_read_timeout;
    /// Which scenario the demo driver runs
    extern const fostlib::setting<fostlib::string> c_demo;

    /// The worker loop a worker program runs
    extern const fostlib::setting<fostlib::string> c_worker_kind;
    /// The worker number given by the pool. Zero outside of a pool
    extern const fostlib::setting<int64_t> c_child;
    /// Capacity of the lease manager
    extern const fostlib::setting<int64_t> c_max_leases;
    /// Generator stage settings
    extern const fostlib::setting<int64_t> c_generate_count;
    extern const fostlib::setting<fostlib::string> c_generate_prefix;
    extern const fostlib::setting<unsigned> c_generate_interval;
    /// Comma separated substrings the filter stage lets through
    extern const fostlib::setting<fostlib::string> c_filter_match;

    /// Mean time for simulated jobs
    extern const fostlib::setting<unsigned> c_sim_mean;
    /// Standard deviation for simulated jobs
    extern const fostlib::setting<unsigned> c_sim_sd;
    /// A task payload that makes the simulated worker crash. Empty never
    /// crashes
    extern const fostlib::setting<fostlib::string> c_crash_on;


    /// Turn a fost string into a standard one
    std::string narrow(fostlib::string);

    /// The argv prefix for the worker program from `c_worker_exec`
    std::vector<std::string> worker_exec();


}
