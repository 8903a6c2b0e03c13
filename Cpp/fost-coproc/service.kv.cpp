/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/exception.hpp>
#include <coproc/service.kv.hpp>

#include <fost/log>

#include <algorithm>
#include <cctype>
#include <sstream>


namespace {


    const std::string ok{"OK"}, not_found{"NOT_FOUND"}, bye{"BYE"},
            value_prefix{"VALUE "}, keys{"KEYS"};
    const std::string unknown_command{"ERROR Unknown command"},
            missing_argument{"ERROR Missing argument"};


    /// Keys are a single word on the wire
    const std::string &checked_key(const std::string &key) {
        if (key.empty()
            || std::any_of(key.begin(), key.end(), [](unsigned char c) {
                   return std::isspace(c);
               })) {
            throw std::invalid_argument(
                    "A key must be a single word: '" + key + "'");
        }
        return key;
    }


    [[noreturn]] void unexpected(const std::string &response) {
        fostlib::log::error(coproc::c_service)(
                "", "Unexpected response from key value store")(
                "response", response.c_str());
        throw fostlib::exceptions::not_implemented(
                __func__, "Unexpected response from key value store");
    }


}


coproc::kv_command coproc::parse_kv_command(const std::string &verb) {
    if (verb == "SET") return kv_command::set;
    if (verb == "GET") return kv_command::get;
    if (verb == "LIST") return kv_command::list;
    if (verb == "QUIT") return kv_command::quit;
    return kv_command::unknown;
}


/*
 * coproc::kv_store
 */


coproc::reply coproc::kv_store::operator()(const std::string &command) {
    const auto parts = split_verb(command);
    switch (parse_kv_command(parts.first)) {
    case kv_command::set: {
        const auto kv = split_verb(parts.second);
        if (kv.first.empty() || kv.second.empty()) {
            return {missing_argument};
        }
        values[kv.first] = kv.second;
        return {ok};
    }
    case kv_command::get: {
        const auto key = split_verb(parts.second).first;
        if (key.empty()) return {missing_argument};
        const auto found = values.find(key);
        if (found == values.end()) return {not_found};
        return {value_prefix + found->second};
    }
    case kv_command::list: {
        std::string listing{keys};
        for (const auto &v : values) listing += " " + v.first;
        return {listing};
    }
    case kv_command::quit: return {bye, true};
    case kv_command::unknown: return {unknown_command};
    }
    return {unknown_command};
}


void coproc::serve_kv(std::istream &in, std::ostream &out) {
    kv_store store;
    serve(store, in, out);
}


/*
 * coproc::kv_client
 */


coproc::kv_client::kv_client(std::chrono::milliseconds timeout)
: kv_client(worker_program("kv"), timeout) {}


coproc::kv_client::kv_client(command cmd, std::chrono::milliseconds timeout)
: service(std::move(cmd), timeout) {}


std::string
        coproc::kv_client::set(const std::string &key, const std::string &value) {
    return request("SET " + checked_key(key) + " " + value);
}


coproc::line coproc::kv_client::get(const std::string &key) {
    const auto response = request("GET " + checked_key(key));
    if (response.compare(0, value_prefix.size(), value_prefix) == 0) {
        return response.substr(value_prefix.size());
    } else if (response == not_found) {
        return {};
    }
    unexpected(response);
}


std::vector<std::string> coproc::kv_client::list() {
    const auto response = request("LIST");
    const auto parts = split_verb(response);
    if (parts.first != keys) {
        unexpected(response);
    }
    std::vector<std::string> names;
    std::istringstream words{parts.second};
    for (std::string name; words >> name;) names.push_back(name);
    return names;
}


std::string coproc::kv_client::quit() { return stop("QUIT", true).value(); }
