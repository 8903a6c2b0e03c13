/**
    Copyright 2016-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/pipe.hpp>

#include <array>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>


std::pair<int, int>
        coproc::detail::pipe_fds(std::size_t parent, std::size_t child) {
    std::array<int, 2> p{{-1, -1}};
    if (::pipe2(p.data(), O_CLOEXEC) < 0)
        throw std::system_error(errno, std::system_category());
    return std::make_pair(p[parent], p[child]);
}


int coproc::detail::close(int &fd) {
    if (fd >= 0) ::close(fd);
    return fd = -1;
}


int coproc::detail::dup(int fd) {
    auto nfd = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (nfd < 0) throw std::system_error(errno, std::system_category());
    return nfd;
}
