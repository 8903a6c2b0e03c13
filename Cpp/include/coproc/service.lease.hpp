/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <coproc/protocol.hpp>
#include <coproc/service.hpp>

#include <set>


namespace coproc {


    /// The commands the lease manager understands
    enum class lease_command { acquire, release, status, quit, unknown };

    /// Parse the verb of a lease command
    lease_command parse_lease_command(const std::string &verb);


    /// The lease accounting that runs inside the resource manager worker.
    /// The number of active leases never goes above the capacity.
    class lease_table final {
        std::set<std::string> active;
        std::size_t issued = 0;

      public:
        explicit lease_table(std::size_t capacity);

        /// The most leases that may be active at once
        const std::size_t capacity;

        /// Execute one command line
        reply operator()(const std::string &);

        /// Lease book keeping
        std::size_t leased() const { return active.size(); }
        std::size_t available() const { return capacity - active.size(); }
    };

    /// The worker loop for the resource manager
    void serve_leases(std::istream &in, std::ostream &out, std::size_t capacity);


    /// Talks to a resource manager worker
    class lease_client final : public service {
      public:
        /// Start a resource manager worker with the given capacity
        explicit lease_client(
                std::size_t capacity,
                std::chrono::milliseconds timeout = std::chrono::milliseconds{});
        /// Use a different worker program
        lease_client(command, std::chrono::milliseconds timeout);

        /// Ask for a lease. Empty if the capacity has been reached
        line acquire();
        /// Give a lease back. False if the ID isn't an active lease. Any
        /// other response throws `fostlib::exceptions::not_implemented`
        bool release(const std::string &id);
        /// The `INFO ...` status line
        std::string status();
        /// Tell the worker to stop and wait for it
        void quit();
    };


}
