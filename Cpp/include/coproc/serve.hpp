/**
    Copyright 2016-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <chrono>
#include <iostream>
#include <string>
#include <vector>


namespace coproc {


    /// The loops the worker program can run
    enum class worker_kind {
        task,
        kv,
        lease,
        generate,
        upper,
        filter,
        echo,
        processor
    };

    /// Parse the `-k` switch of the worker program. Throws
    /// `std::invalid_argument` for an unknown kind
    worker_kind parse_worker_kind(const std::string &);

    /// Run the loop for the kind using the configured settings
    void run_worker(
            worker_kind, std::istream &in, std::ostream &out, std::ostream &report);


    /// Simulate the work being executed. Progress goes to `report` and each
    /// task is echoed on `out` when done
    void serve_tasks(std::istream &in, std::ostream &out, std::ostream &report);

    /// Write `<prefix>1` to `<prefix><count>`
    void generate(
            std::ostream &out,
            std::size_t count,
            const std::string &prefix,
            std::chrono::milliseconds interval);
    /// Upper case every line
    void upper(std::istream &in, std::ostream &out);
    /// Only lines containing one of the needles get through. All lines do
    /// when there are no needles
    void filter(
            std::istream &in,
            std::ostream &out,
            const std::vector<std::string> &needles);
    /// Split a comma separated list of needles
    std::vector<std::string> needles(const std::string &);

    /// Answer each line with `PROC: <line>`
    void echo(std::istream &in, std::ostream &out);
    /// Answer each line with `Processed: <line>`. The line `error` is
    /// reported on `report` and gets no answer
    void processor(std::istream &in, std::ostream &out, std::ostream &report);


}
