/**
    Copyright 2016-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <cstddef>
#include <experimental/optional>
#include <tuple>
#include <utility>

#include <boost/asio/io_service.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>


namespace coproc {


    namespace detail {


        /// Return two pipe file descriptors. Both are close on exec
        std::pair<int, int> pipe_fds(std::size_t, std::size_t);
        /// Duplicate a file descriptor. The copy is close on exec
        int dup(int);
        /// Close the file descriptor and set to -1
        int close(int &fd);

        /// A pipe for use between a parent process and its child. The
        /// direction of the pipe is controlled by the template parameters.
        /// Applications should use the pipe_in or pipe_out classes instead.
        template<std::size_t PFD, std::size_t CFD>
        class pipe final {
            int parent_fd = -1;
            std::experimental::optional<boost::asio::posix::stream_descriptor>
                    parent_sd;
            int child_fd = -1;

          public:
            /// Create a new pipe
            pipe() { std::tie(parent_fd, child_fd) = detail::pipe_fds(PFD, CFD); }
            /// Make movable
            pipe(pipe &&p)
            : parent_fd(p.parent_fd),
              parent_sd(std::move(p.parent_sd)),
              child_fd(p.child_fd) {
                p.parent_fd = -1;
                p.parent_sd = std::experimental::nullopt;
                p.child_fd = -1;
            }
            pipe(const pipe &) = delete;
            pipe &operator=(const pipe &) = delete;
            /// Close the file handles
            ~pipe() { close(); }

            /// Close the file handles
            void close() {
                close_parent();
                close_child();
            }
            /// Close the parent end. For `pipe_in` this is how the child
            /// sees end of file
            void close_parent() {
                if (parent_sd) {
                    boost::system::error_code ignored;
                    (*parent_sd).close(ignored);
                    parent_sd = std::experimental::nullopt;
                }
                detail::close(parent_fd);
            }
            /// The parent must drop its copy of the child end once the
            /// child has been forked
            void close_child() { detail::close(child_fd); }

            /// True until the parent end is closed
            bool is_open() const { return parent_fd >= 0; }

            /// Return a copy of the descriptor for the child end. Should be
            /// passed dup2 to set up child end of pipe.
            int child() const { return child_fd; }
            /// Return the parent in a form usable for ASIO
            boost::asio::posix::stream_descriptor &
                    parent(boost::asio::io_service &ios) {
                if (not parent_sd) {
                    parent_sd = boost::asio::posix::stream_descriptor(
                            ios, detail::dup(parent_fd));
                }
                return parent_sd.value();
            }
        };


    }


    /// Represents a pipe used to connect to STDIN on a child process
    using pipe_in = detail::pipe<1u, 0u>;


    /// Represents a pipe used to connect to STDOUT (or STDERR) on a child
    /// process
    using pipe_out = detail::pipe<0u, 1u>;


}
