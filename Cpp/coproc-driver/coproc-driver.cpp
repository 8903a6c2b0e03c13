/*
    Copyright 2016-2019, Felspar Co Ltd. http://support.felspar.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <coproc/configuration.hpp>
#include <coproc/exception.hpp>
#include <coproc/logging.hpp>
#include <coproc/pipeline.hpp>
#include <coproc/pool.dispatcher.hpp>
#include <coproc/service.kv.hpp>
#include <coproc/service.lease.hpp>

#include <fost/main>

#include <boost/asio/read.hpp>


using namespace std::literals::chrono_literals;


namespace {


    void heading(std::ostream &out, const std::string &title) {
        out << title << ":\n"
            << std::string(title.size() + 1, '-') << std::endl;
    }


    std::chrono::milliseconds read_timeout() {
        return std::chrono::milliseconds{coproc::c_read_timeout.value()};
    }


    void basic_coprocess(std::ostream &out) {
        heading(out, "Basic Coprocess");
        out << "1. Simple echo coprocess:" << std::endl;
        boost::asio::io_service ios;
        coproc::worker echo{0, ios, coproc::worker_program("echo")};
        echo.spawn();
        echo.io.write_line("test message");
        const auto response = echo.io.read_line();
        out << "Response: " << response.value_or("") << std::endl;
        echo.io.close_input();
        echo.wait();
    }


    void worker_pool(std::ostream &out) {
        heading(out, "Worker Pool");
        const auto size = coproc::c_pool_size.value();
        if (size < 1) {
            throw std::invalid_argument("The pool size must be at least one");
        }
        auto pool = coproc::dispatcher::start(
                size, coproc::worker_program("task"));
        out << "1. Distributing tasks:" << std::endl;
        for (std::size_t n{1}; n <= 6; ++n) {
            pool->submit(coproc::task{"task" + std::to_string(n)});
        }
        pool->wait_idle();
        for (const auto &done : pool->completions()) {
            out << "Worker " << done.worker << " completed: " << done.task
                << std::endl;
        }
        out << "\n2. Shutting down workers:" << std::endl;
        pool->shutdown();
        for (std::size_t id{1}; id <= pool->size(); ++id) {
            out << "Worker " << id << ": " << pool->state(id) << " after "
                << pool->assigned(id) << " tasks" << std::endl;
        }
    }


    void data_pipeline(std::ostream &out) {
        heading(out, "Data Pipeline");
        auto chain = coproc::pipeline::build(
                {{"generator",
                  coproc::worker_program(
                          "generate",
                          {"-count", "5", "-prefix", "data", "-interval",
                           "200"})},
                 {"transformer", coproc::worker_program("upper")},
                 {"filter", coproc::worker_program("filter", {"-match", "3,5"})}});
        out << "1. Processing pipeline:" << std::endl;
        auto results = chain->run();
        while (auto result = results.next()) {
            out << "Result: " << *result << std::endl;
        }
    }


    void bidirectional_comm(std::ostream &out) {
        heading(out, "Bidirectional Communication");
        coproc::kv_client server{read_timeout()};
        out << "1. Setting values:" << std::endl;
        out << server.request("SET name John") << std::endl;
        out << server.request("SET age 30") << std::endl;
        out << "\n2. Getting values:" << std::endl;
        out << server.request("GET name") << std::endl;
        out << server.request("GET age") << std::endl;
        out << server.request("GET nonexistent") << std::endl;
        out << "\n3. Listing keys:" << std::endl;
        out << server.request("LIST") << std::endl;
        out << "\n4. Shutting down:" << std::endl;
        out << server.quit() << std::endl;
    }


    void error_handling(std::ostream &out) {
        heading(out, "Error Handling");
        boost::asio::io_service ios;
        coproc::worker processor{
                0, ios, coproc::worker_program("processor"), true};
        processor.spawn();
        out << "1. Normal processing:" << std::endl;
        processor.io.write_line("test1");
        out << processor.io.read_line().value_or("") << std::endl;

        out << "\n2. Error case:" << std::endl;
        processor.io.write_line("error");
        try {
            processor.io.read_line(200ms);
        } catch (coproc::channel_timeout &) {
            out << "No response" << std::endl;
        }

        out << "\n3. Another normal case:" << std::endl;
        processor.io.write_line("test2");
        out << processor.io.read_line().value_or("") << std::endl;

        processor.io.write_line("quit");
        processor.io.close_input();
        processor.wait();

        out << "\n4. Error log contents:" << std::endl;
        boost::asio::streambuf log;
        boost::system::error_code error;
        boost::asio::read((*processor.errors).parent(ios), log, error);
        if (error && error != boost::asio::error::eof) {
            throw coproc::channel_error(error, "Error reading processor stderr");
        }
        out << &log << std::flush;
        processor.io.close();
    }


    void resource_manager(std::ostream &out) {
        heading(out, "Resource Management");
        const auto capacity = coproc::c_max_leases.value();
        if (capacity < 0) {
            throw std::invalid_argument("The lease capacity can't be negative");
        }
        coproc::lease_client manager{std::size_t(capacity), read_timeout()};
        out << "1. Resource acquisition:" << std::endl;
        out << manager.request("ACQUIRE") << std::endl;
        out << manager.request("ACQUIRE") << std::endl;
        out << "\n2. Status check:" << std::endl;
        out << manager.request("STATUS") << std::endl;
        out << "\n3. Resource exhaustion:" << std::endl;
        out << manager.request("ACQUIRE") << std::endl;
        out << manager.request("ACQUIRE") << std::endl;
        out << "\n4. Resource release:" << std::endl;
        out << manager.request("RELEASE res1") << std::endl;
        out << manager.request("STATUS") << std::endl;
        manager.quit();
    }


    const std::vector<std::pair<std::string, void (*)(std::ostream &)>> demos{
            {"echo", basic_coprocess},     {"pool", worker_pool},
            {"pipeline", data_pipeline},   {"kv", bidirectional_comm},
            {"processor", error_handling}, {"lease", resource_manager}};


    void run_demos(std::ostream &out) {
        const auto selected = coproc::narrow(coproc::c_demo.value());
        bool first = true, found = false;
        for (const auto &demo : demos) {
            if (selected != "all" && selected != demo.first) continue;
            if (not first) out << "\n\n";
            first = false;
            found = true;
            demo.second(out);
        }
        if (not found) {
            throw std::invalid_argument("Unknown demo: " + selected);
        }
    }


}


int main(int argc, char *argv[]) {
    fostlib::loaded_settings settings{"coproc-driver",
        "Coprocess driver\nCopyright (c) 2016-2019, Felspar Co. Ltd."};
    fostlib::arguments args(argc, argv);
    /// Run the worker program that sits beside the driver
    const fostlib::setting<fostlib::json> exec{
        __FILE__, coproc::c_worker_exec, [&]() {
            auto exec = coproc::c_worker_exec.value();
            const boost::filesystem::path self{argv[0]};
            if ( self.has_parent_path() ) {
                fostlib::jcursor(0).set(exec, fostlib::json(
                    fostlib::coerce<fostlib::string>(
                        self.parent_path() / "coproc-worker")));
            }
            return exec;
        }()};

    /// Build a suitable default loging configuration
    const fostlib::setting<fostlib::json> log_setting{
        __FILE__, settings.c_logging, coproc::parent_logging()};

    coproc::exception_decorator([&]() {
        /// Load any provided settings files
        std::vector<fostlib::settings> configuration;
        configuration.reserve(args.size());
        for ( std::size_t arg{1}; arg != args.size(); ++arg ) {
            std::cerr << "Loading config " << fostlib::json(args[arg].value()) << std::endl;
            auto filename = fostlib::coerce<boost::filesystem::path>(args[arg].value());
            configuration.emplace_back(std::move(filename));
        }
        /// Process the command switches that alter behaviour
        args.commandSwitch("d", coproc::c_demo);
        args.commandSwitch("w", coproc::c_pool_size);
        args.commandSwitch("x", coproc::c_worker_exec);
        args.commandSwitch("g", coproc::c_shutdown_grace);
        args.commandSwitch("t", coproc::c_read_timeout);
        args.commandSwitch("max", coproc::c_max_leases);
        /// Load the standard settings
        fostlib::standard_arguments(settings, std::cerr, args);
        /// Start the logging
        fostlib::log::global_sink_configuration log_sinks(settings.c_logging.value());
        /// Run the scenarios
        run_demos(std::cout);
        fostlib::log::info(coproc::c_coproc, "Everything done. Terminating normally");
        fostlib::log::flush();
    }, [](){})();

    return 0;
}
