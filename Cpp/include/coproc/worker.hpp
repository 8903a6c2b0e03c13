/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <coproc/channel.hpp>

#include <fost/core>

#include <iosfwd>
#include <string>
#include <vector>


namespace coproc {


    /// Where a worker is in its life
    enum class worker_state { starting, idle, busy, terminating, terminated };

    /// The name used for the state in logs
    const char *to_string(worker_state);
    std::ostream &operator<<(std::ostream &, worker_state);

    /// Workers only move forward through their states. Any live state
    /// may drop straight to terminated when the process dies
    bool can_transition(worker_state from, worker_state to);


    /// The argv for a worker process
    using command = std::vector<std::string>;

    /// The command that runs the worker program (`c_worker_exec`) with the
    /// requested worker kind and any extra switches
    command worker_program(
            const std::string &kind, std::vector<std::string> switches = {});


    /// A long lived child process connected to the driver through a
    /// channel on its stdin and stdout
    class worker final : boost::noncopyable {
        boost::asio::io_service &ios;
        worker_state current = worker_state::starting;
        const command argx;
        std::vector<char const *> argv;
        bool reaped = false;
        int exit_status = 0;

      public:
        /// Set up the pipes for the worker. Nothing runs until `spawn`.
        /// When `capture_stderr` is false the child shares our stderr
        worker(std::size_t id,
               boost::asio::io_service &ios,
               command cmd,
               bool capture_stderr = false);
        /// Kill and reap the process if it is still around
        ~worker();

        /// The worker number
        const std::size_t id;
        /// The module used for logging about this worker
        const fostlib::module reference;
        /// The stdin/stdout line protocol
        channel io;
        /// The child's stderr, if captured
        std::experimental::optional<pipe_out> errors;
        /// The PID that the child gets
        int pid = 0;

        /// Fork and exec the process. Throws `spawn_error` if either fails,
        /// in which case the worker is terminated
        void spawn();

        /// The current state
        worker_state state() const { return current; }
        /// Move to the next state. Throws `std::logic_error` if the move
        /// isn't allowed
        void transition(worker_state);
        /// True once the worker has reached terminated
        bool finished() const { return current == worker_state::terminated; }

        /// Send a signal to the process
        void signal(int);
        /// Forcibly end the process and reap it. Returns the wait status
        int terminate();
        /// Block until the process exits and return its wait status
        int wait();
        /// True once `wait` has collected the exit status
        bool has_exited() const { return reaped; }
        /// The wait status once the process has been reaped
        int status() const { return exit_status; }
    };


}
