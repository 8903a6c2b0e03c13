/*
    Copyright 2016-2019, Felspar Co Ltd. http://support.felspar.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <coproc/configuration.hpp>
#include <coproc/exception.hpp>
#include <coproc/logging.hpp>
#include <coproc/serve.hpp>


#include <fost/main>


int main(int argc, char *argv[]) {
    fostlib::loaded_settings settings{"coproc-worker",
        "Coprocess worker\nCopyright (c) 2016-2019, Felspar Co. Ltd."};
    fostlib::arguments args(argc, argv);

    /// Process the command switches that choose the loop
    args.commandSwitch("k", coproc::c_worker_kind);
    args.commandSwitch("-child", coproc::c_child);
    args.commandSwitch("max", coproc::c_max_leases);
    args.commandSwitch("count", coproc::c_generate_count);
    args.commandSwitch("prefix", coproc::c_generate_prefix);
    args.commandSwitch("interval", coproc::c_generate_interval);
    args.commandSwitch("match", coproc::c_filter_match);
    /// These switches are used by the simulated pool worker
    args.commandSwitch("-sim-mean", coproc::c_sim_mean);
    args.commandSwitch("-sim-sd", coproc::c_sim_sd);
    args.commandSwitch("-crash-on", coproc::c_crash_on);

    /// Log to stderr. The worker's stdout is the channel
    const fostlib::setting<fostlib::json> log_setting{
        __FILE__, settings.c_logging, coproc::child_logging()};

    coproc::exception_decorator([&]() {
        /// Load any provided settings files
        std::vector<fostlib::settings> configuration;
        configuration.reserve(args.size());
        for ( std::size_t arg{1}; arg != args.size(); ++arg ) {
            auto filename = fostlib::coerce<boost::filesystem::path>(args[arg].value());
            configuration.emplace_back(std::move(filename));
        }
        /// Start the logging
        fostlib::log::global_sink_configuration log_sinks(settings.c_logging.value());
        const auto kind = coproc::parse_worker_kind(
            coproc::narrow(coproc::c_worker_kind.value()));
        coproc::run_worker(kind, std::cin, std::cout, std::cerr);
        fostlib::log::flush();
    }, coproc::exit_on_error)();

    return 0;
}
