/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/configuration.hpp>
#include <coproc/exception.hpp>
#include <coproc/service.hpp>

#include <fost/counter>
#include <fost/log>

#include <signal.h>
#include <sys/wait.h>


namespace {


    fostlib::performance
            p_requests(coproc::c_service, "requests", "sent");
    fostlib::performance
            p_timeouts(coproc::c_service, "requests", "timed-out");


}


coproc::service::service(command cmd, std::chrono::milliseconds t)
: process(0, ios, std::move(cmd)), timeout(t) {
    process.spawn();
}


std::string coproc::service::request(const std::string &command) {
    return request(command, timeout);
}


std::string coproc::service::request(
        const std::string &command, std::chrono::milliseconds limit) {
    process.transition(worker_state::busy);
    ++p_requests;
    try {
        process.io.write_line(command);
        ++owed;
        auto read = [&]() {
            auto response = limit.count() ? process.io.read_line(limit)
                                          : process.io.read_line();
            if (not response) {
                throw channel_error(
                        boost::asio::error::eof, "Worker closed its channel");
            }
            --owed;
            return *response;
        };
        /// Responses to requests that timed out come first
        while (owed > 1) {
            const auto late = read();
            fostlib::log::warning(c_service)("", "Late response dropped")(
                    "pid", process.pid)("response", late.c_str());
        }
        auto response = read();
        fostlib::log::debug(c_service)("", "Request answered")(
                "pid", process.pid)("request", command.c_str())(
                "response", response.c_str());
        process.transition(worker_state::idle);
        return response;
    } catch (std::invalid_argument &) {
        /// Nothing was sent
        process.transition(worker_state::idle);
        throw;
    } catch (channel_timeout &) {
        ++p_timeouts;
        fostlib::log::warning(c_service)("", "Request timed out")(
                "pid", process.pid)("request", command.c_str())(
                "timeout", limit.count())("owed", owed);
        process.transition(worker_state::idle);
        throw;
    } catch (channel_error &e) {
        fostlib::log::error(c_service)("", "Worker channel failed")(
                "pid", process.pid)("request", command.c_str())(
                "error", e.what());
        process.terminate();
        throw;
    }
}


coproc::line
        coproc::service::stop(const std::string &command, bool answered) {
    if (process.finished()) return {};
    line response;
    if (answered) {
        response = request(command);
    } else {
        try {
            process.io.write_line(command);
        } catch (channel_error &e) {
            fostlib::log::error(c_service)("", "Worker channel failed")(
                    "pid", process.pid)("command", command.c_str())(
                    "error", e.what());
            process.terminate();
            throw;
        }
    }
    process.transition(worker_state::terminating);
    process.io.close_input();
    /// Nothing else should arrive. Wait for end of file, but not forever
    const std::chrono::milliseconds grace{c_shutdown_grace.value()};
    try {
        while (auto extra = process.io.read_line(grace)) {
            fostlib::log::warning(c_service)("", "Ignored line from worker")(
                    "pid", process.pid)("line", (*extra).c_str());
        }
    } catch (channel_timeout &) {
        fostlib::log::warning(c_service)(
                "", "Worker did not exit after its final command -- killing")(
                "pid", process.pid)("command", command.c_str());
        process.signal(SIGKILL);
    }
    const auto status = process.wait();
    process.io.close();
    if (not WIFEXITED(status) || WEXITSTATUS(status)) {
        throw process_error(
                process.pid, status, "Worker did not exit cleanly");
    }
    return response;
}
