/**
    Copyright 2017-2019, Felspar Co Ltd. <http://support.felspar.com/>

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
*/


#include <coproc/exception.hpp>
#include <coproc/pool.dispatcher.hpp>
#include <coproc/protocol.hpp>

#include <fost/counter>
#include <fost/log>

#include <boost/asio/read_until.hpp>

#include <algorithm>

#include <signal.h>


namespace {


    fostlib::performance p_submitted(coproc::c_pool, "tasks", "submitted");
    fostlib::performance p_completed(coproc::c_pool, "tasks", "completed");
    fostlib::performance p_lost(coproc::c_pool, "tasks", "lost");


}


/*
 * coproc::task
 */


coproc::task::task(std::string p)
: payload(std::move(p)), is_sentinel(payload == sentinel_task) {}


coproc::task coproc::task::sentinel() { return task{sentinel_task}; }


/*
 * coproc::dispatcher
 */


coproc::dispatcher::dispatcher(
        std::size_t n, const command &cmd, std::chrono::milliseconds g)
: in_flight(n),
  counts(n),
  cursor(n - 1),
  grace(g),
  control([]() { return false; }, 1u),
  auxilliary([]() { return true; }, 2u) {
    if (not n) {
        throw std::invalid_argument("A pool needs at least one worker");
    }
    auto &ctrlios = control.get_io_service();
    auto &auxios = auxilliary.get_io_service();
    workers.reserve(n);
    for (std::size_t child{1}; child <= n; ++child) {
        auto argv = cmd;
        argv.push_back("--child");
        argv.push_back(std::to_string(child));
        workers.push_back(std::make_unique<worker>(
                child, ctrlios, std::move(argv), true));
        try {
            workers.back()->spawn();
        } catch (spawn_error &e) {
            fostlib::log::error(c_pool)(
                    "", "Worker failed to start -- tearing down the pool")(
                    "worker", child)("started", child - 1)(
                    "error", e.what());
            throw;
        }
    }
    /// Only once every worker is up do they get a presence in the
    /// reactor pools
    readers = 2 * n;
    for (auto &w : workers) {
        auto *wp = w.get();
        boost::asio::spawn(ctrlios, exception_decorator([this, wp](auto yield) {
                               try {
                                   handle_stdout(*wp, yield);
                               } catch (...) {
                                   reader_finished();
                                   throw;
                               }
                               reader_finished();
                           }));
        boost::asio::spawn(auxios, exception_decorator([this, wp](auto yield) {
                               try {
                                   drain_stderr(*wp, yield);
                               } catch (...) {
                                   reader_finished();
                                   throw;
                               }
                               reader_finished();
                           }));
    }
    fostlib::log::info(c_pool)("", "Pool started")("workers", n)(
            "program", cmd.front().c_str());
}


std::unique_ptr<coproc::dispatcher> coproc::dispatcher::start(
        std::size_t n, const command &cmd, std::chrono::milliseconds grace) {
    return std::unique_ptr<dispatcher>(new dispatcher(n, cmd, grace));
}


coproc::dispatcher::~dispatcher() {
    std::unique_lock<std::mutex> lock{mutex};
    stopped = true;
    signal.notify_all();
    for (auto &w : workers) {
        w->io.close_input();
        if (w->pid > 0 && not w->has_exited()) ::kill(w->pid, SIGKILL);
    }
    signal.wait(lock, [this]() { return readers == 0; });
}


void coproc::dispatcher::handle_stdout(
        worker &w, boost::asio::yield_context yield) {
    while (true) {
        line response;
        try {
            response = w.io.read_line(yield);
        } catch (channel_error &e) {
            fostlib::log::warning(w.reference)(
                    "", "Read error from worker stdout")("pid", w.pid)(
                    "error", e.what());
        }
        std::unique_lock<std::mutex> lock{mutex};
        auto &current = in_flight[w.id - 1];
        if (response) {
            if (w.state() == worker_state::busy && current
                && *response == *current) {
                fostlib::log::debug(w.reference)("", "Got result from worker")(
                        "pid", w.pid)("result", (*response).c_str());
                done.push_back(completion{w.id, *current, *response});
                current = std::experimental::nullopt;
                ++p_completed;
                w.transition(worker_state::idle);
                signal.notify_all();
            } else {
                fostlib::log::warning(w.reference)(
                        "", "Ignored line from worker")("pid", w.pid)(
                        "input", "string", (*response).c_str())(
                        "expected", "string",
                        current ? (*current).c_str() : "")(
                        "state", to_string(w.state()));
            }
            continue;
        }
        if (w.state() == worker_state::terminating) {
            fostlib::log::info(w.reference)(
                    "", "Worker done because its stdout closed")(
                    "pid", w.pid);
        } else {
            auto logger = fostlib::log::warning(w.reference);
            logger("", "Worker exited unexpectedly")("pid", w.pid)(
                    "state", to_string(w.state()));
            if (current) {
                ++p_lost;
                logger("lost", (*current).c_str());
                lost_tasks.push_back(*current);
                current = std::experimental::nullopt;
            }
            w.transition(worker_state::terminated);
            signal.notify_all();
        }
        return;
    }
}


void coproc::dispatcher::drain_stderr(
        worker &w, boost::asio::yield_context yield) {
    auto &auxios = auxilliary.get_io_service();
    auto &sd = (*w.errors).parent(auxios);
    boost::asio::streambuf buffer;
    while (true) {
        boost::system::error_code error;
        auto bytes = boost::asio::async_read_until(
                sd, buffer, '\n', yield[error]);
        if (error == boost::asio::error::eof) {
            return;
        } else if (error) {
            fostlib::log::error(w.reference)(
                    "", "Error reading worker stderr")("error", error)(
                    "bytes", bytes);
            return;
        }
        fostlib::string text;
        while (bytes--) {
            char next = buffer.sbumpc();
            if (next != 0 && next != '\n') text += next;
        }
        /// Worker log messages arrive as JSON, progress lines as text
        auto parsed = fostlib::json::parse(text, fostlib::json(text));
        fostlib::log::info(w.reference)("", "Worker stderr")("pid", w.pid)(
                "stderr", parsed);
    }
}


void coproc::dispatcher::reader_finished() {
    std::unique_lock<std::mutex> lock{mutex};
    --readers;
    signal.notify_all();
}


coproc::worker *coproc::dispatcher::next_idle(bool lowest) {
    /// Start after the worker that got the last task so they all take
    /// turns, or from the first worker when several became idle together
    const std::size_t from = lowest ? workers.size() - 1 : cursor;
    for (std::size_t step{1}; step <= workers.size(); ++step) {
        auto &w = workers[(from + step) % workers.size()];
        if (w->state() == worker_state::idle) return w.get();
    }
    return nullptr;
}


std::size_t coproc::dispatcher::count(worker_state s) const {
    return std::count_if(workers.begin(), workers.end(), [s](const auto &w) {
        return w->state() == s;
    });
}


std::size_t coproc::dispatcher::live() const {
    return workers.size() - count(worker_state::terminated);
}


void coproc::dispatcher::submit(const task &t) {
    if (t.is_sentinel) {
        throw std::invalid_argument(
                "The sentinel task is only sent when the pool shuts down");
    } else if (t.payload.empty()) {
        throw std::invalid_argument("A task cannot be empty");
    } else if (t.payload.find('\n') != std::string::npos) {
        throw std::invalid_argument("A task cannot contain a newline");
    }
    std::unique_lock<std::mutex> lock{mutex};
    worker *chosen = nullptr;
    bool waited = false;
    signal.wait(lock, [&]() {
        if (stopped || not live()) return true;
        chosen = next_idle(waited);
        waited = true;
        return chosen != nullptr;
    });
    if (stopped) {
        throw process_error(0, 0, "The pool has been shut down");
    } else if (not chosen) {
        throw process_error(0, 0, "There are no workers left in the pool");
    }
    chosen->transition(worker_state::busy);
    in_flight[chosen->id - 1] = t.payload;
    ++counts[chosen->id - 1];
    cursor = chosen->id - 1;
    ++p_submitted;
    fostlib::log::debug(chosen->reference)("", "Task assigned")(
            "pid", chosen->pid)("task", t.payload.c_str());
    lock.unlock();
    try {
        chosen->io.write_line(t.payload);
    } catch (channel_error &e) {
        fostlib::log::error(chosen->reference)(
                "", "Error writing task to worker")("pid", chosen->pid)(
                "task", t.payload.c_str())("error", e.what());
        throw;
    }
}


void coproc::dispatcher::shutdown() {
    std::unique_lock<std::mutex> lock{mutex};
    if (stopped) return;
    /// In-flight tasks get the grace period to finish
    const auto idle = [this]() { return not count(worker_state::busy); };
    if (not signal.wait_for(lock, grace, idle)) {
        for (auto &w : workers) {
            if (w->state() != worker_state::busy) continue;
            fostlib::log::warning(w->reference)(
                    "", "Worker still busy at shutdown -- killing")(
                    "pid", w->pid)("grace", grace.count());
            w->signal(SIGKILL);
        }
        /// The stdout reader sees the end of file and records the lost task
        signal.wait(lock, idle);
    }
    stopped = true;
    signal.notify_all();
    for (auto &w : workers) {
        if (w->state() != worker_state::idle) continue;
        w->transition(worker_state::terminating);
        try {
            w->io.write_line(sentinel_task);
        } catch (channel_error &e) {
            fostlib::log::warning(w->reference)(
                    "", "Could not send the sentinel")("pid", w->pid)(
                    "error", e.what());
        }
        w->io.close_input();
    }
    if (not signal.wait_for(lock, grace, [this]() { return readers == 0; })) {
        for (auto &w : workers) {
            if (w->has_exited()) continue;
            fostlib::log::warning(w->reference)(
                    "", "Worker did not exit in time -- killing")(
                    "pid", w->pid)("grace", grace.count());
            w->signal(SIGKILL);
        }
        signal.wait(lock, [this]() { return readers == 0; });
    }
    for (auto &w : workers) {
        w->wait();
        w->io.close();
        (*w->errors).close();
    }
    fostlib::log::info(c_pool)("", "Pool shut down")(
            "completed", done.size())("lost", lost_tasks.size());
}


void coproc::dispatcher::wait_idle() {
    std::unique_lock<std::mutex> lock{mutex};
    signal.wait(lock, [this]() { return not count(worker_state::busy); });
}


std::vector<coproc::completion> coproc::dispatcher::completions() const {
    std::unique_lock<std::mutex> lock{mutex};
    return done;
}


std::vector<std::string> coproc::dispatcher::lost() const {
    std::unique_lock<std::mutex> lock{mutex};
    return lost_tasks;
}


std::size_t coproc::dispatcher::assigned(std::size_t id) const {
    std::unique_lock<std::mutex> lock{mutex};
    return counts.at(id - 1);
}


coproc::worker_state coproc::dispatcher::state(std::size_t id) const {
    std::unique_lock<std::mutex> lock{mutex};
    return workers.at(id - 1)->state();
}
