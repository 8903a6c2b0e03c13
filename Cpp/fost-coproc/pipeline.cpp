/**
    Copyright 2017-2019, Felspar Co Ltd. <http://support.felspar.com/>

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
*/


#include <coproc/configuration.hpp>
#include <coproc/exception.hpp>
#include <coproc/pipeline.hpp>

#include <fost/counter>
#include <fost/log>

#include <signal.h>
#include <sys/wait.h>


namespace {


    fostlib::performance p_relayed(coproc::c_pipeline, "lines", "relayed");
    fostlib::performance p_dropped(coproc::c_pipeline, "lines", "dropped");


}


coproc::pipeline::pipeline(std::vector<stage> chain, relay_filter f)
: inspect(std::move(f)), control([]() { return false; }, 1u) {
    if (chain.empty()) {
        throw std::invalid_argument("A pipeline needs at least one stage");
    }
    auto &ctrlios = control.get_io_service();
    stages.reserve(chain.size());
    names.reserve(chain.size());
    for (auto &s : chain) {
        names.push_back(s.name);
        stages.push_back(std::make_unique<worker>(
                stages.size(), ctrlios, std::move(s.cmd)));
        try {
            stages.back()->spawn();
        } catch (spawn_error &e) {
            fostlib::log::error(c_pipeline)("", "Stage failed to start")(
                    "stage", s.name.c_str())("error", e.what());
            throw;
        }
    }
    fostlib::log::info(c_pipeline)("", "Pipeline built")(
            "stages", stages.size());
}


std::unique_ptr<coproc::pipeline>
        coproc::pipeline::build(std::vector<stage> chain, relay_filter f) {
    return std::unique_ptr<pipeline>(
            new pipeline(std::move(chain), std::move(f)));
}


coproc::pipeline::~pipeline() {
    std::unique_lock<std::mutex> lock{mutex};
    if (started && not finished) {
        for (auto &s : stages) {
            if (s->pid > 0 && not s->has_exited()) ::kill(s->pid, SIGKILL);
        }
    }
    signal.wait(lock, [this]() { return relays == 0; });
}


coproc::pipeline::sequence coproc::pipeline::run() {
    std::unique_lock<std::mutex> lock{mutex};
    if (started) {
        throw std::logic_error("A pipeline can only be run once");
    }
    started = true;
    /// The first stage makes its own input
    stages.front()->io.close_input();
    stages.front()->transition(worker_state::terminating);
    relays = stages.size() - 1;
    for (std::size_t from{}; from + 1 < stages.size(); ++from) {
        boost::asio::spawn(
                control.get_io_service(),
                exception_decorator([this, from](auto yield) {
                    try {
                        relay(from, yield);
                    } catch (...) {
                        relay_finished();
                        throw;
                    }
                    relay_finished();
                }));
    }
    return sequence{this};
}


void coproc::pipeline::relay(
        std::size_t from, boost::asio::yield_context yield) {
    auto &upstream = *stages[from];
    auto &downstream = *stages[from + 1];
    try {
        while (auto text = upstream.io.read_line(yield)) {
            if (inspect && not inspect(from, *text)) {
                ++p_dropped;
                fostlib::log::debug(c_pipeline)("", "Line dropped")(
                        "stage", names[from].c_str())("line", (*text).c_str());
                continue;
            }
            /// Wait for the write before reading more so a slow stage
            /// holds up the ones before it
            downstream.io.write_line(*text, yield);
            ++p_relayed;
        }
        fostlib::log::debug(c_pipeline)("", "Stage output ended")(
                "stage", names[from].c_str());
    } catch (channel_error &e) {
        fostlib::log::error(c_pipeline)("", "Relay failed")(
                "from", names[from].c_str())("to", names[from + 1].c_str())(
                "error", e.what());
        std::unique_lock<std::mutex> lock{mutex};
        if (not failure) failure = std::current_exception();
        /// Nothing more will be read so the upstream stage has to go too
        upstream.io.output.close_parent();
    }
    std::unique_lock<std::mutex> lock{mutex};
    downstream.io.close_input();
    if (downstream.state() == worker_state::idle) {
        downstream.transition(worker_state::terminating);
    }
}


void coproc::pipeline::relay_finished() {
    std::unique_lock<std::mutex> lock{mutex};
    --relays;
    signal.notify_all();
}


coproc::line coproc::pipeline::next_line() {
    {
        std::unique_lock<std::mutex> lock{mutex};
        if (finished) return {};
    }
    auto text = stages.back()->io.read_line();
    if (text) return text;
    finish();
    return {};
}


void coproc::pipeline::finish() {
    std::unique_lock<std::mutex> lock{mutex};
    signal.wait(lock, [this]() { return relays == 0; });
    finished = true;
    for (auto &s : stages) {
        const auto status = s->wait();
        s->io.close();
        if (not WIFEXITED(status) || WEXITSTATUS(status)) {
            fostlib::log::warning(c_pipeline)("", "Stage exited abnormally")(
                    "stage", names[s->id].c_str())("status", status);
        }
    }
    fostlib::log::info(c_pipeline)("", "Pipeline finished")(
            "stages", stages.size());
    if (failure) std::rethrow_exception(failure);
}


coproc::worker_state coproc::pipeline::state(std::size_t index) const {
    std::unique_lock<std::mutex> lock{mutex};
    return stages.at(index)->state();
}
