/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#pragma once


#include <coproc/configuration.hpp>

#include <fost/log>

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <boost/coroutine/exceptions.hpp>
#include <boost/system/system_error.hpp>

#include <cxxabi.h>


namespace coproc {


    /// A worker process could not be created
    class spawn_error : public std::system_error {
      public:
        spawn_error(int error, const std::string &what)
        : system_error(error, std::system_category(), what) {}
    };


    /// A read or write on a channel failed, or the peer closed it
    class channel_error : public boost::system::system_error {
      public:
        channel_error(boost::system::error_code error, const std::string &what)
        : system_error(error, what) {}
    };


    /// No line arrived before the caller's deadline. The worker's state
    /// is unknown.
    class channel_timeout : public channel_error {
      public:
        explicit channel_timeout(const std::string &what)
        : channel_error(
                boost::system::errc::make_error_code(
                        boost::system::errc::timed_out),
                what) {}
    };


    /// A worker process went away when it wasn't supposed to, or no
    /// worker is left to do the work
    class process_error : public std::runtime_error {
      public:
        process_error(int p, int s, const std::string &what)
        : runtime_error(what), pid(p), status(s) {}

        /// The process the error is about. Zero if it's not about one
        const int pid;
        /// The raw status from `waitpid`. Zero if not known
        const int status;
    };


    /// Exception recovery function that re-throws the exception.
    const auto rethrow = []() { throw; };

    /// An exception recovery handler we can use here
    const auto exit_on_error = []() {
        fostlib::log::flush();
        std::exit(9);
    };


    /// Wrap a function to display exceptions
    const auto exception_decorator = [](auto fn,
                                        std::function<void(void)> recov =
                                                rethrow) {
        return [=](auto &&... a) {
            try {
                return fn(a...);
            } catch (boost::coroutines::detail::forced_unwind &) {
                throw;
            } catch (fostlib::exceptions::exception &e) {
                fostlib::log::flush();
                std::cerr << e << std::endl;
                return recov();
            } catch (std::exception &e) {
                fostlib::log::flush();
                std::cerr << e.what() << ": " << coproc::c_child.value()
                          << std::endl;
                return recov();
            } catch (...) {
                fostlib::log::flush();
                std::cerr << "Unkown exception: " << coproc::c_child.value()
                          << " - "
                          << __cxxabiv1::__cxa_current_exception_type()->name()
                          << std::endl;
                return recov();
            }
        };
    };


}
