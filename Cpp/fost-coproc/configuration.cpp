/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/configuration.hpp>

#include <fost/push_back>


const fostlib::module coproc::c_coproc("coproc");
const fostlib::module coproc::c_pool(c_coproc, "pool");
const fostlib::module coproc::c_pipeline(c_coproc, "pipeline");
const fostlib::module coproc::c_service(c_coproc, "service");
const fostlib::module coproc::c_worker(c_coproc, "worker");


const fostlib::setting<fostlib::json> coproc::c_worker_exec(
        __FILE__,
        "coproc",
        "Worker program",
        []() {
            fostlib::json cmd;
            fostlib::push_back(cmd, "coproc-worker");
            return cmd;
        }(),
        true);

const fostlib::setting<int64_t>
        coproc::c_pool_size(__FILE__, "coproc", "Pool size", 3, true);

const fostlib::setting<unsigned> coproc::c_shutdown_grace(
        __FILE__, "coproc", "Shutdown grace period", 2000, true);

const fostlib::setting<unsigned>
        coproc::c_read_timeout(__FILE__, "coproc", "Read timeout", 0, true);

const fostlib::setting<fostlib::string>
        coproc::c_demo(__FILE__, "coproc-driver", "Demo", "all", true);


const fostlib::setting<fostlib::string> coproc::c_worker_kind(
        __FILE__, "coproc-worker", "Kind", "task", true);

const fostlib::setting<int64_t>
        coproc::c_child(__FILE__, "coproc-worker", "Child", 0, true);

const fostlib::setting<int64_t> coproc::c_max_leases(
        __FILE__, "coproc-worker", "Maximum leases", 3, true);

const fostlib::setting<int64_t> coproc::c_generate_count(
        __FILE__, "coproc-worker", "Generate count", 5, true);
const fostlib::setting<fostlib::string> coproc::c_generate_prefix(
        __FILE__, "coproc-worker", "Generate prefix", "data", true);
const fostlib::setting<unsigned> coproc::c_generate_interval(
        __FILE__, "coproc-worker", "Generate interval", 0, true);

const fostlib::setting<fostlib::string> coproc::c_filter_match(
        __FILE__, "coproc-worker", "Filter match", "", true);

const fostlib::setting<unsigned> coproc::c_sim_mean(
        __FILE__, "coproc-worker", "Simulated job mean", 500, true);
const fostlib::setting<unsigned> coproc::c_sim_sd(
        __FILE__,
        "coproc-worker",
        "Simulated job standard deviation",
        100,
        true);
const fostlib::setting<fostlib::string>
        coproc::c_crash_on(__FILE__, "coproc-worker", "Crash on", "", true);


std::string coproc::narrow(fostlib::string s) { return s.shrink_to_fit(); }


std::vector<std::string> coproc::worker_exec() {
    std::vector<std::string> argv;
    argv.reserve(c_worker_exec.value().size());
    for (const auto &item : c_worker_exec.value()) {
        argv.push_back(narrow(fostlib::coerce<fostlib::string>(item)));
    }
    return argv;
}
