/**
    Copyright 2016-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/configuration.hpp>
#include <coproc/protocol.hpp>
#include <coproc/serve.hpp>

#include <fost/timer>

#include <algorithm>
#include <random>
#include <thread>

#include <unistd.h>


using namespace std::chrono_literals;


void coproc::serve_tasks(
        std::istream &in, std::ostream &out, std::ostream &report) {
    const auto id = c_child.value();
    const auto crash_on = narrow(c_crash_on.value());
    bool first = true;
    fostlib::timer time;
    fostlib::time_profile<std::chrono::microseconds> times(5us, 1.2, 5);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::normal_distribution<float> rand(
            c_sim_mean.value(), std::max(1u, c_sim_sd.value()));

    std::string command;
    while (std::getline(in, command)) {
        if (command == sentinel_task) break;
        if (command.empty()) continue;
        if (not first) times.record(time);
        first = false;
        report << "Worker " << id << " processing: " << command << std::endl;
        if (not crash_on.empty() && command == crash_on) {
            report << "Crash during work... " << ::getpid() << std::endl;
            std::exit(3);
        }
        std::this_thread::sleep_for(std::max(0.0f, rand(gen)) * 1ms);
        time.reset();
        out << command << std::endl;
    }
    report << "Worker " << id << " done" << std::endl;
    report << fostlib::json::unparse(
            fostlib::coerce<fostlib::json>(times), false)
           << std::endl;
}
