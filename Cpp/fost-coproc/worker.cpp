/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/configuration.hpp>
#include <coproc/exception.hpp>
#include <coproc/worker.hpp>

#include <fost/counter>
#include <fost/log>

#include <boost/asio/read.hpp>

#include <ostream>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>


namespace {


    fostlib::performance p_spawned(coproc::c_worker, "process", "spawned");
    fostlib::performance p_reaped(coproc::c_worker, "process", "reaped");
    fostlib::performance p_failed(coproc::c_worker, "process", "failed");


    /// A dead worker has to show up as a channel error, not kill us
    void ignore_sigpipe() {
        static const bool ignored = []() {
            struct sigaction sa;
            sigemptyset(&sa.sa_mask);
            sa.sa_flags = 0;
            sa.sa_handler = SIG_IGN;
            if (::sigaction(SIGPIPE, &sa, nullptr) < 0) {
                throw std::system_error(errno, std::system_category());
            }
            return true;
        }();
        static_cast<void>(ignored);
    }


}


const char *coproc::to_string(worker_state s) {
    switch (s) {
    case worker_state::starting: return "starting";
    case worker_state::idle: return "idle";
    case worker_state::busy: return "busy";
    case worker_state::terminating: return "terminating";
    case worker_state::terminated: return "terminated";
    }
    return "unknown";
}


std::ostream &coproc::operator<<(std::ostream &o, worker_state s) {
    return o << to_string(s);
}


bool coproc::can_transition(worker_state from, worker_state to) {
    switch (from) {
    case worker_state::starting:
        return to == worker_state::idle || to == worker_state::terminated;
    case worker_state::idle:
        return to == worker_state::busy || to == worker_state::terminating
                || to == worker_state::terminated;
    case worker_state::busy:
        return to == worker_state::idle || to == worker_state::terminated;
    case worker_state::terminating:
        return to == worker_state::terminated;
    case worker_state::terminated: return false;
    }
    return false;
}


coproc::command coproc::worker_program(
        const std::string &kind, std::vector<std::string> switches) {
    auto cmd = worker_exec();
    cmd.push_back("-k");
    cmd.push_back(kind);
    for (auto &s : switches) cmd.push_back(std::move(s));
    return cmd;
}


/*
 * coproc::worker
 */


coproc::worker::worker(
        std::size_t n,
        boost::asio::io_service &i,
        command cmd,
        bool capture_stderr)
: ios(i),
  argx(std::move(cmd)),
  id(n),
  reference(c_worker, std::to_string(n)),
  io(i) {
    if (argx.empty()) {
        throw std::invalid_argument("A worker needs a program to run");
    }
    argv.reserve(argx.size() + 1);
    for (const auto &arg : argx) argv.push_back(arg.c_str());
    argv.push_back(nullptr);
    if (capture_stderr) errors.emplace();
}


coproc::worker::~worker() {
    io.close();
    if (errors) (*errors).close();
    if (pid > 0 && not reaped) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &exit_status, 0);
    }
}


void coproc::worker::spawn() {
    ignore_sigpipe();
    /// The child writes its errno here if the exec fails. On success
    /// close on exec shuts it and we see end of file
    pipe_out report;
    pid = ::fork();
    if (pid < 0) {
        const auto error = errno;
        pid = 0;
        ++p_failed;
        transition(worker_state::terminated);
        throw spawn_error(error, "Fork failed for worker " + argx.front());
    } else if (pid == 0) {
        ::signal(SIGPIPE, SIG_DFL);
        io.attach_child();
        if (errors) ::dup2((*errors).child(), STDERR_FILENO);
        ::execvp(argv.front(), const_cast<char *const *>(argv.data()));
        const int error = errno;
        if (::write(report.child(), &error, sizeof(error)) < 0) ::_exit(126);
        ::_exit(127);
    }
    io.detach_child();
    if (errors) (*errors).close_child();
    report.close_child();

    int error{};
    boost::system::error_code read_error;
    const auto bytes = boost::asio::read(
            report.parent(ios), boost::asio::buffer(&error, sizeof(error)),
            read_error);
    if (bytes == sizeof(error)) {
        ++p_failed;
        wait();
        fostlib::log::error(reference)("", "Worker program failed to start")(
                "program", argx.front().c_str())("errno", error);
        throw spawn_error(error, "Could not execute " + argx.front());
    }
    ++p_spawned;
    transition(worker_state::idle);
    fostlib::log::info(reference)("", "Started worker process")("pid", pid)(
            "program", argx.front().c_str());
}


void coproc::worker::transition(worker_state next) {
    if (not can_transition(current, next)) {
        throw std::logic_error(
                std::string{"Worker cannot move from "} + to_string(current)
                + " to " + to_string(next));
    }
    fostlib::log::debug(reference)("", "Worker state change")(
            "from", to_string(current))("to", to_string(next));
    current = next;
}


void coproc::worker::signal(int sig) {
    if (pid <= 0 || reaped) return;
    if (::kill(pid, sig) < 0 && errno != ESRCH) {
        throw process_error(pid, 0, "Could not signal the worker process");
    }
}


int coproc::worker::terminate() {
    if (reaped) return exit_status;
    io.close_input();
    signal(SIGTERM);
    return wait();
}


int coproc::worker::wait() {
    if (reaped || pid <= 0) return exit_status;
    int status{};
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw process_error(pid, 0, "Error waiting for the worker process");
        }
    }
    reaped = true;
    exit_status = status;
    ++p_reaped;
    if (current != worker_state::terminated) {
        transition(worker_state::terminated);
    }
    if (WIFEXITED(status)) {
        fostlib::log::info(reference)("", "Worker process reaped")("pid", pid)(
                "status", "WEXITSTATUS", WEXITSTATUS(status));
    } else {
        fostlib::log::warning(reference)("", "Worker process reaped")(
                "pid", pid)("status", "WIFSIGNALED", WIFSIGNALED(status))(
                "status", "WTERMSIG",
                WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return status;
}
