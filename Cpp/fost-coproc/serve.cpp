/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/configuration.hpp>
#include <coproc/serve.hpp>
#include <coproc/service.kv.hpp>
#include <coproc/service.lease.hpp>

#include <fost/log>

#include <stdexcept>


coproc::worker_kind coproc::parse_worker_kind(const std::string &name) {
    if (name == "task") return worker_kind::task;
    if (name == "kv") return worker_kind::kv;
    if (name == "lease") return worker_kind::lease;
    if (name == "generate") return worker_kind::generate;
    if (name == "upper") return worker_kind::upper;
    if (name == "filter") return worker_kind::filter;
    if (name == "echo") return worker_kind::echo;
    if (name == "processor") return worker_kind::processor;
    throw std::invalid_argument("Unknown worker kind: " + name);
}


void coproc::run_worker(
        worker_kind kind,
        std::istream &in,
        std::ostream &out,
        std::ostream &report) {
    switch (kind) {
    case worker_kind::task: serve_tasks(in, out, report); break;
    case worker_kind::kv: serve_kv(in, out); break;
    case worker_kind::lease: {
        const auto capacity = c_max_leases.value();
        if (capacity < 0) {
            throw std::invalid_argument("The lease capacity can't be negative");
        }
        serve_leases(in, out, capacity);
        break;
    }
    case worker_kind::generate: {
        const auto count = c_generate_count.value();
        generate(
                out, count < 0 ? 0u : count, narrow(c_generate_prefix.value()),
                std::chrono::milliseconds{c_generate_interval.value()});
        break;
    }
    case worker_kind::upper: upper(in, out); break;
    case worker_kind::filter:
        filter(in, out, needles(narrow(c_filter_match.value())));
        break;
    case worker_kind::echo: echo(in, out); break;
    case worker_kind::processor: processor(in, out, report); break;
    }
    fostlib::log::debug(c_worker)("", "Worker loop finished")(
            "child", c_child.value());
}
