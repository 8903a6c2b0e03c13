/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/protocol.hpp>


namespace {
    const char whitespace[] = " \t\r";
}


std::pair<std::string, std::string>
        coproc::split_verb(const std::string &line) {
    const auto start = line.find_first_not_of(whitespace);
    if (start == std::string::npos) return {};
    const auto end = line.find_first_of(whitespace, start);
    if (end == std::string::npos) return {line.substr(start), std::string{}};
    const auto rest = line.find_first_not_of(whitespace, end);
    if (rest == std::string::npos) {
        return {line.substr(start, end - start), std::string{}};
    }
    return {line.substr(start, end - start), line.substr(rest)};
}
