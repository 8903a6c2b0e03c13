/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/channel.hpp>
#include <coproc/exception.hpp>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>

#include <poll.h>
#include <unistd.h>


namespace {


    void check_framing(const std::string &line) {
        if (line.find('\n') != std::string::npos) {
            throw std::invalid_argument(
                    "A channel line cannot contain a newline");
        }
    }


    template<typename P>
    P &checked(P &pipe, const char *what) {
        if (not pipe.is_open()) {
            throw coproc::channel_error(
                    boost::asio::error::bad_descriptor, what);
        }
        return pipe;
    }


    auto line_buffers(const std::string &line) {
        return std::array<boost::asio::const_buffer, 2>{
                {boost::asio::buffer(line.data(), line.size()),
                 boost::asio::buffer("\n", 1u)}};
    }


}


coproc::channel::channel(boost::asio::io_service &i) : ios(i) {}


void coproc::channel::attach_child() {
    ::dup2(input.child(), STDIN_FILENO);
    ::dup2(output.child(), STDOUT_FILENO);
}


void coproc::channel::detach_child() {
    input.close_child();
    output.close_child();
}


void coproc::channel::write_line(const std::string &line) {
    check_framing(line);
    boost::system::error_code error;
    boost::asio::write(
            checked(input, "Worker stdin is closed").parent(ios),
            line_buffers(line), error);
    if (error) throw channel_error(error, "Error writing to worker stdin");
}


void coproc::channel::write_line(
        const std::string &line, boost::asio::yield_context yield) {
    check_framing(line);
    boost::system::error_code error;
    boost::asio::async_write(
            checked(input, "Worker stdin is closed").parent(ios),
            line_buffers(line), yield[error]);
    if (error) throw channel_error(error, "Error writing to worker stdin");
}


coproc::line coproc::channel::read_line() {
    boost::system::error_code error;
    auto bytes = boost::asio::read_until(
            checked(output, "Worker stdout is closed").parent(ios), buffer,
            '\n', error);
    return take_line(bytes, error);
}


coproc::line coproc::channel::read_line(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto &sd = checked(output, "Worker stdout is closed").parent(ios);
    while (not buffered_line()) {
        const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw channel_timeout("Timed out waiting for worker stdout");
        }
        pollfd ready{sd.native_handle(), POLLIN, 0};
        const auto polled = ::poll(&ready, 1, remaining.count());
        if (polled < 0 && errno == EINTR) {
            continue;
        } else if (polled < 0) {
            throw channel_error(
                    boost::system::error_code(
                            errno, boost::system::system_category()),
                    "Error waiting on worker stdout");
        } else if (polled == 0) {
            throw channel_timeout("Timed out waiting for worker stdout");
        }
        boost::system::error_code error;
        const auto bytes = sd.read_some(buffer.prepare(512u), error);
        buffer.commit(bytes);
        if (error == boost::asio::error::eof) {
            break;
        } else if (error) {
            throw channel_error(error, "Error reading worker stdout");
        }
    }
    return read_line();
}


coproc::line coproc::channel::read_line(boost::asio::yield_context yield) {
    boost::system::error_code error;
    auto bytes = boost::asio::async_read_until(
            checked(output, "Worker stdout is closed").parent(ios), buffer,
            '\n', yield[error]);
    return take_line(bytes, error);
}


coproc::line coproc::channel::take_line(
        std::size_t bytes, boost::system::error_code error) {
    if (error == boost::asio::error::eof) {
        /// A last line without a newline still counts
        bytes = buffer.size();
        if (not bytes) return {};
    } else if (error) {
        throw channel_error(error, "Error reading worker stdout");
    }
    /// Zero bytes can turn up at the start of a line. They are
    /// dropped along with the newline
    std::string text;
    text.reserve(bytes);
    for (; bytes; --bytes) {
        char next = buffer.sbumpc();
        if (next != 0 && next != '\n') text += next;
    }
    return text;
}


bool coproc::channel::buffered_line() const {
    const auto data = buffer.data();
    return std::find(
                   boost::asio::buffers_begin(data),
                   boost::asio::buffers_end(data), '\n')
            != boost::asio::buffers_end(data);
}


void coproc::channel::close_input() { input.close_parent(); }


void coproc::channel::close() {
    input.close();
    output.close();
}
