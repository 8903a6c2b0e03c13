/**
    Copyright 2017-2019 Red Anchor Trading Co. Ltd.

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
 */


#include <coproc/configuration.hpp>
#include <coproc/exception.hpp>
#include <coproc/service.lease.hpp>

#include <fost/log>


namespace {


    const std::string granted{"GRANTED"}, released{"OK Released "},
            lease_prefix{"res"};
    const std::string limit_reached{"ERROR Resource limit reached"},
            invalid_id{"ERROR Invalid resource id"},
            unknown_command{"ERROR Unknown command"};


    [[noreturn]] void unexpected(const std::string &response) {
        fostlib::log::error(coproc::c_service)(
                "", "Unexpected response from resource manager")(
                "response", response.c_str());
        throw fostlib::exceptions::not_implemented(
                __func__, "Unexpected response from resource manager");
    }


}


coproc::lease_command coproc::parse_lease_command(const std::string &verb) {
    if (verb == "ACQUIRE") return lease_command::acquire;
    if (verb == "RELEASE") return lease_command::release;
    if (verb == "STATUS") return lease_command::status;
    if (verb == "QUIT") return lease_command::quit;
    return lease_command::unknown;
}


/*
 * coproc::lease_table
 */


coproc::lease_table::lease_table(std::size_t c) : capacity(c) {}


coproc::reply coproc::lease_table::operator()(const std::string &command) {
    const auto parts = split_verb(command);
    switch (parse_lease_command(parts.first)) {
    case lease_command::acquire: {
        if (active.size() >= capacity) return {limit_reached};
        /// The counter only goes up so an ID is never handed out twice
        auto id = lease_prefix + std::to_string(++issued);
        active.insert(id);
        return {granted + " " + id};
    }
    case lease_command::release: {
        const auto id = split_verb(parts.second).first;
        const auto found = active.find(id);
        if (found == active.end()) return {invalid_id};
        active.erase(found);
        return {released + id};
    }
    case lease_command::status:
        return {"INFO Active: " + std::to_string(active.size())
                + ", Available: " + std::to_string(available())};
    case lease_command::quit: return {line{}, true};
    case lease_command::unknown: return {unknown_command};
    }
    return {unknown_command};
}


void coproc::serve_leases(
        std::istream &in, std::ostream &out, std::size_t capacity) {
    lease_table table{capacity};
    serve(table, in, out);
}


/*
 * coproc::lease_client
 */


coproc::lease_client::lease_client(
        std::size_t capacity, std::chrono::milliseconds timeout)
: lease_client(
        worker_program("lease", {"-max", std::to_string(capacity)}),
        timeout) {}


coproc::lease_client::lease_client(
        command cmd, std::chrono::milliseconds timeout)
: service(std::move(cmd), timeout) {}


coproc::line coproc::lease_client::acquire() {
    const auto response = request("ACQUIRE");
    const auto parts = split_verb(response);
    if (parts.first == granted && not parts.second.empty()) {
        return parts.second;
    } else if (response == limit_reached) {
        return {};
    }
    unexpected(response);
}


bool coproc::lease_client::release(const std::string &id) {
    const auto response = request("RELEASE " + id);
    if (response == released + id) {
        return true;
    } else if (response == invalid_id) {
        return false;
    }
    unexpected(response);
}


std::string coproc::lease_client::status() { return request("STATUS"); }


void coproc::lease_client::quit() { stop("QUIT", false); }
