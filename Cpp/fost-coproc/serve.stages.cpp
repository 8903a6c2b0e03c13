/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/serve.hpp>

#include <algorithm>
#include <cctype>
#include <thread>


void coproc::generate(
        std::ostream &out,
        std::size_t count,
        const std::string &prefix,
        std::chrono::milliseconds interval) {
    for (std::size_t n{1}; n <= count && out; ++n) {
        out << prefix << n << std::endl;
        if (interval.count() && n != count) std::this_thread::sleep_for(interval);
    }
}


void coproc::upper(std::istream &in, std::ostream &out) {
    std::string line;
    while (std::getline(in, line)) {
        std::transform(line.begin(), line.end(), line.begin(), [](char c) {
            return std::toupper(static_cast<unsigned char>(c));
        });
        out << line << std::endl;
    }
}


std::vector<std::string> coproc::needles(const std::string &list) {
    std::vector<std::string> found;
    std::string::size_type start{};
    while (start <= list.size()) {
        const auto comma = std::min(list.find(',', start), list.size());
        if (comma > start) found.push_back(list.substr(start, comma - start));
        start = comma + 1;
    }
    return found;
}


void coproc::filter(
        std::istream &in,
        std::ostream &out,
        const std::vector<std::string> &needles) {
    std::string line;
    while (std::getline(in, line)) {
        const bool wanted = needles.empty()
                || std::any_of(needles.begin(), needles.end(),
                               [&](const auto &needle) {
                                   return line.find(needle)
                                           != std::string::npos;
                               });
        if (wanted) out << line << std::endl;
    }
}


void coproc::echo(std::istream &in, std::ostream &out) {
    std::string line;
    while (std::getline(in, line)) out << "PROC: " << line << std::endl;
}


void coproc::processor(
        std::istream &in, std::ostream &out, std::ostream &report) {
    std::string line;
    while (std::getline(in, line)) {
        if (line == "error") {
            report << "ERROR Invalid input" << std::endl;
            continue;
        } else if (line == "quit") {
            break;
        }
        out << "Processed: " << line << std::endl;
    }
}
