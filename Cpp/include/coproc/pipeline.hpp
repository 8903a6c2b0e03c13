/**
    Copyright 2017-2019, Felspar Co Ltd. <http://support.felspar.com/>

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
*/


#pragma once


#include <coproc/worker.hpp>

#include <f5/threading/reactor.hpp>

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>


namespace coproc {


    /// One process in a pipeline
    struct stage {
        std::string name;
        command cmd;
    };


    /// Decides whether a line read from stage `from` is passed on to the
    /// next stage. Lines for which it returns false are dropped
    using relay_filter =
            std::function<bool(std::size_t from, const std::string &line)>;


    /// A chain of workers where each stage's stdout feeds the next stage's
    /// stdin. The driver relays the lines so it can see them as they pass
    class pipeline final : boost::noncopyable {
        mutable std::mutex mutex;
        std::condition_variable signal;
        std::size_t relays = 0;
        std::exception_ptr failure;
        bool started = false, finished = false;
        const relay_filter inspect;

        f5::boost_asio::reactor_pool control;
        std::vector<std::unique_ptr<worker>> stages;
        std::vector<std::string> names;

        pipeline(std::vector<stage>, relay_filter);

        void relay(std::size_t from, boost::asio::yield_context);
        void relay_finished();
        line next_line();
        void finish();

      public:
        /// Spawn a worker for each stage. Throws `spawn_error` if one
        /// can't be started, killing those that were
        static std::unique_ptr<pipeline>
                build(std::vector<stage>, relay_filter inspect = {});
        /// Kills the stages if the output wasn't read to the end
        ~pipeline();

        /// The output of the last stage
        class sequence {
            friend class pipeline;
            pipeline *owner;
            explicit sequence(pipeline *p) : owner(p) {}

          public:
            /// Block for the next line from the last stage. Empty at the
            /// end, by which time every stage has been reaped. A relay
            /// failure is thrown here once the stream has ended
            line next() { return owner->next_line(); }
        };

        /// Start the relays. Can only be done once
        sequence run();

        /// The number of stages
        std::size_t size() const { return stages.size(); }
        /// The state of stage `index`, counting from zero
        worker_state state(std::size_t index) const;
        /// The name given to stage `index`
        const std::string &name(std::size_t index) const {
            return names.at(index);
        }
    };


}
