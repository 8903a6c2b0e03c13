/**
    Copyright 2017-2019, Felspar Co Ltd. <http://support.felspar.com/>

    Distributed under the Boost Software License, Version 1.0.
    See <http://www.boost.org/LICENSE_1_0.txt>
*/


#include <coproc/logging.hpp>

#include <fost/insert>
#include <fost/log>
#include <fost/push_back>

#include <unistd.h>


fostlib::json coproc::parent_logging() {
    fostlib::json ret, sink;
    fostlib::insert(sink, "name", "stdout");
    fostlib::insert(sink, "configuration", "channel", "stderr");
    fostlib::insert(
            sink, "configuration", "log-level",
            fostlib::log::warning_level_tag::level());
    fostlib::insert(sink, "configuration", "color", true);
    fostlib::push_back(ret, "sinks", sink);
    return ret;
}


namespace {

    struct stderr_lines {
        const std::size_t level;

        stderr_lines(const fostlib::json &conf)
        : level{not conf.isobject()
                        ? fostlib::log::warning_level_tag::level()
                        : fostlib::coerce<fostlib::nullable<std::size_t>>(
                                  conf["log-level"])
                                  .value_or(fostlib::log::warning_level_tag::
                                                    level())} {}

        bool operator()(const fostlib::log::message &m) {
            if (m.level() < level) return true;
            auto msg = fostlib::json::unparse(
                    fostlib::coerce<fostlib::json>(m), false);
            msg += '\n';
            const auto &bytes = msg.memory();
            std::size_t written{};
            while (written < bytes.size()) {
                const auto w = ::write(
                        STDERR_FILENO, bytes.data() + written,
                        bytes.size() - written);
                if (w <= 0) return false;
                written += w;
            }
            return true;
        }
    };

    const fostlib::log::global_sink<stderr_lines>
            stderr_logger("coproc.stderr");

}

fostlib::json coproc::child_logging() {
    fostlib::json ret, sink;
    fostlib::insert(sink, "name", "coproc.stderr");
    fostlib::insert(
            sink, "configuration", "log-level",
            fostlib::log::warning_level_tag::level());
    fostlib::push_back(ret, "sinks", sink);
    return ret;
}
