/**
    Copyright 2017-2019, Felspar Co Ltd. <http://support.felspar.com/>

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
*/


#pragma once


#include <coproc/configuration.hpp>
#include <coproc/worker.hpp>

#include <f5/threading/reactor.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>


namespace coproc {


    /// A unit of work for the pool
    struct task {
        task(std::string p);

        /// The task that tells a worker to stop
        static task sentinel();

        std::string payload;
        bool is_sentinel;
    };


    /// A task a worker has finished
    struct completion {
        std::size_t worker;
        std::string task;
        std::string response;
    };


    /// A fixed set of workers sharing out tasks
    class dispatcher final : boost::noncopyable {
        mutable std::mutex mutex;
        std::condition_variable signal;
        /// The task each worker is doing right now
        std::vector<std::experimental::optional<std::string>> in_flight;
        /// How many tasks each worker has been given
        std::vector<std::size_t> counts;
        /// The index of the worker given the last task
        std::size_t cursor;
        std::vector<completion> done;
        std::vector<std::string> lost_tasks;
        /// Coroutines still reading from a worker
        std::size_t readers = 0;
        bool stopped = false;
        const std::chrono::milliseconds grace;

        /// Reads the workers' stdout. One thread so the completions for a
        /// worker are handled in order
        f5::boost_asio::reactor_pool control;
        /// Drains the workers' stderr. Carries on after an exception
        f5::boost_asio::reactor_pool auxilliary;

        std::vector<std::unique_ptr<worker>> workers;

        dispatcher(
                std::size_t n,
                const command &cmd,
                std::chrono::milliseconds grace);

        void handle_stdout(worker &, boost::asio::yield_context);
        void drain_stderr(worker &, boost::asio::yield_context);
        void reader_finished();

        worker *next_idle(bool lowest);
        std::size_t count(worker_state) const;
        std::size_t live() const;

      public:
        /// Start `n` workers running `cmd`, each one with `--child <id>`
        /// added to its command line. Throws `spawn_error` if any of them
        /// can't be started, in which case those already running are
        /// killed.
        static std::unique_ptr<dispatcher> start(
                std::size_t n,
                const command &cmd,
                std::chrono::milliseconds grace = std::chrono::milliseconds{
                        c_shutdown_grace.value()});
        /// Kills any workers that are still running
        ~dispatcher();

        /// Give the task to the next idle worker, waiting for one if they
        /// are all busy. Throws `process_error` after shutdown or once
        /// there are no live workers
        void submit(const task &);

        /// Let the in-flight work finish then stop every worker. A worker
        /// still busy after the grace period is killed and its task lost.
        /// Workers that don't exit in a further grace period are killed
        void shutdown();

        /// Block until no worker is busy
        void wait_idle();

        /// The tasks finished so far in the order they finished
        std::vector<completion> completions() const;
        /// Tasks whose worker died while doing them. They are never re-sent
        std::vector<std::string> lost() const;
        /// The number of tasks worker `id` has been given
        std::size_t assigned(std::size_t id) const;
        /// The state of worker `id`
        worker_state state(std::size_t id) const;
        /// The number of workers in the pool
        std::size_t size() const { return workers.size(); }
    };


}
