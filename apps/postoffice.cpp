#include <desim/core/clock.hpp>
#include <desim/core/log.hpp>
#include <desim/core/process.hpp>
#include <desim/core/resource.hpp>
#include <desim/io/io.hpp>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace fs = std::filesystem;
using namespace desim;

struct AppConfig {
    std::optional<fs::path> config_file;
    std::optional<fs::path> trace_file;
    std::optional<std::string> log_level;
    double duration{480.0};
    double arrival_rate{0.9};
    double service_rate{1.0};
    std::size_t capacity{core::UNLIMITED_CAPACITY};
    bool text_trace{false};
    bool snapshot{false};
};

auto parse_args(int argc, char** argv) -> AppConfig
{
    AppConfig config;

    // clang-format off
    cxxopts::Options options("desim_postoffice", "M/M/1 post office queue simulated on a desim clock");
    options.add_options()
        ("h,help", "Show this help message.")
        ("c,config", "Clock configuration file (JSON).", cxxopts::value<std::string>())
        ("d,duration", "Simulated opening time, in clock time units.", cxxopts::value<double>()->default_value("480"))
        ("a,arrival-rate", "Mean customer arrivals per time unit.", cxxopts::value<double>()->default_value("0.9"))
        ("s,service-rate", "Mean customers served per time unit.", cxxopts::value<double>()->default_value("1.0"))
        ("capacity", "Waiting room size; customers arriving to a full room leave.", cxxopts::value<std::size_t>())
        ("o,trace", "Write a JSON trace of the clock to this file.", cxxopts::value<std::string>())
        ("text-trace", "Print a textual trace of the clock on stdout.")
        ("snapshot", "Print the final clock snapshot as JSON.")
        ("log-level", "Override the log level (error, warn, info, debug, trace, off).", cxxopts::value<std::string>());
    // clang-format on
    const auto cli = options.parse(argc, argv);

    if (cli.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(EXIT_SUCCESS);
    }

    if (cli.count("config")) { config.config_file = cli["config"].as<std::string>(); }
    if (cli.count("trace")) { config.trace_file = cli["trace"].as<std::string>(); }
    if (cli.count("log-level")) { config.log_level = cli["log-level"].as<std::string>(); }
    if (cli.count("capacity")) { config.capacity = cli["capacity"].as<std::size_t>(); }
    config.duration = cli["duration"].as<double>();
    config.arrival_rate = cli["arrival-rate"].as<double>();
    config.service_rate = cli["service-rate"].as<double>();
    config.text_trace = cli.count("text-trace") > 0;
    config.snapshot = cli.count("snapshot") > 0;

    if (config.arrival_rate <= 0.0 || config.service_rate <= 0.0) {
        throw std::invalid_argument("arrival and service rates must be positive");
    }
    return config;
}

struct Customer {
    uint64_t number{0};
    double arrival{0.0};
};

struct Statistics {
    uint64_t arrived{0};
    uint64_t served{0};
    uint64_t turned_away{0};
    double total_wait{0.0};
    double total_queue_time{0.0};
    double last_change{0.0};
    std::size_t queue_length{0};

    // Time-weighted queue length bookkeeping.
    void queue_changed(double now, std::size_t length) {
        total_queue_time += static_cast<double>(queue_length) * (now - last_change);
        last_change = now;
        queue_length = length;
    }
};

auto arrivals(core::Clock& clock, core::Process& /*self*/, core::Resource<Customer>& room,
              Statistics& stats, std::mt19937& rng, double rate) -> core::Routine
{
    std::exponential_distribution<double> gap(rate);
    co_await core::delay(clock, gap(rng));

    ++stats.arrived;
    if (room.full()) {
        ++stats.turned_away;
        co_return;
    }
    room.push(Customer{stats.arrived, clock.time()});
    stats.queue_changed(clock.time(), room.size());
}

auto clerk(core::Clock& clock, core::Process& /*self*/, core::Resource<Customer>& room,
           Statistics& stats, std::mt19937& rng, double rate) -> core::Routine
{
    std::exponential_distribution<double> service(rate);
    co_await core::wait_until(clock, [&room] { return room.ready(); });

    const Customer customer = room.pop_front();
    stats.queue_changed(clock.time(), room.size());
    stats.total_wait += clock.time() - customer.arrival;

    co_await core::delay(clock, service(rng));
    ++stats.served;
}

auto main(int argc, char** argv) -> int
{
    try {
        const AppConfig app = parse_args(argc, argv);

        core::ClockConfig clock_config;
        if (app.config_file) {
            clock_config = io::load_clock_config(*app.config_file);
        }
        if (app.log_level) {
            const auto level = core::parse_log_level(*app.log_level);
            if (!level) {
                throw std::invalid_argument("unknown log level '" + *app.log_level + "'");
            }
            clock_config.log_level = *level;
        }
        core::Logger::instance().set_level(clock_config.log_level);

        core::Clock clock(clock_config);

        std::unique_ptr<std::ofstream> trace_stream;
        std::unique_ptr<core::TraceWriter> writer;
        if (app.trace_file) {
            trace_stream = std::make_unique<std::ofstream>(*app.trace_file);
            if (!*trace_stream) {
                throw std::runtime_error("cannot open trace file " + app.trace_file->string());
            }
            writer = std::make_unique<io::JsonTraceWriter>(*trace_stream);
        } else if (app.text_trace) {
            writer = std::make_unique<io::TextualTraceWriter>(std::cout);
        }
        clock.set_trace_writer(writer.get());

        core::Resource<Customer> room(app.capacity);
        Statistics stats;
        std::mt19937 rng(static_cast<std::mt19937::result_type>(clock_config.seed));

        clock.process(std::string("arrivals"), arrivals, std::ref(room), std::ref(stats),
                      std::ref(rng), app.arrival_rate);
        clock.process(std::string("clerk"), clerk, std::ref(room), std::ref(stats),
                      std::ref(rng), app.service_rate);

        {
#ifdef TRACY_ENABLE
            ZoneScopedN("postoffice run");
#endif
            const auto summary = clock.run(app.duration);
            stats.queue_changed(clock.time(), room.size());
            core::Logger::instance().log(core::LogLevel::Info, "simulation ended in state {}",
                                         core::to_string(summary.state));
        }
        clock.set_trace_writer(nullptr);

        const double elapsed = clock.time() - clock_config.t0;
        fmt::print("customers arrived:   {}\n", stats.arrived);
        fmt::print("customers served:    {}\n", stats.served);
        fmt::print("customers turned away: {}\n", stats.turned_away);
        fmt::print("still waiting:       {}\n", room.size());
        const uint64_t started = stats.arrived - stats.turned_away - room.size();
        fmt::print("mean wait:           {:.4f}\n",
                   started > 0 ? stats.total_wait / static_cast<double>(started) : 0.0);
        fmt::print("mean queue length:   {:.4f}\n",
                   elapsed > 0.0 ? stats.total_queue_time / elapsed : 0.0);
        const double rho = app.arrival_rate / app.service_rate;
        if (rho < 1.0 && app.capacity == core::UNLIMITED_CAPACITY) {
            fmt::print("M/M/1 mean wait:     {:.4f}\n", rho / (app.service_rate - app.arrival_rate));
        }

        if (app.snapshot) {
            io::write_snapshot(clock.snapshot(), std::cout);
            std::cout << std::endl;
        }
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const io::LoaderError& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
