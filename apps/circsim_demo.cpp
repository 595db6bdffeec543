#include <circsim/blocks/blocks.hpp>
#include <circsim/core/core.hpp>
#include <circsim/io/io.hpp>

#include <cxxopts.hpp>

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string>

using namespace circsim;

namespace {

struct Config {
    std::string config_file;
    double duration{10.0};
    double interval{1.0};
    unsigned seed{0};
    std::string output_file{"-"};
    std::optional<io::TraceFormat> format;
    std::optional<std::string> persistent_file;
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("circsim-demo", "Thermostat and turnstile demo circuit");

    options.add_options()
        ("c,config", "Circuit configuration (JSON)", cxxopts::value<std::string>())
        ("d,duration", "Simulation duration in seconds (default: 10)", cxxopts::value<double>()->default_value("10"))
        ("interval", "Thermometer polling interval in seconds (default: 1)", cxxopts::value<double>()->default_value("1"))
        ("seed", "Random seed of the fake thermometer (default: 0)", cxxopts::value<unsigned>()->default_value("0"))
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Trace format: none|json|text", cxxopts::value<std::string>())
        ("p,persistent", "Persistent state file (JSON)", cxxopts::value<std::string>())
        ("v,verbose", "Debug output of all blocks")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    config.duration = result["duration"].as<double>();
    config.interval = result["interval"].as<double>();
    config.seed = result["seed"].as<unsigned>();
    config.output_file = result["output"].as<std::string>();
    if (result.count("format") != 0U) {
        config.format = io::parse_trace_format(result["format"].as<std::string>());
    }
    if (result.count("persistent") != 0U) {
        config.persistent_file = result["persistent"].as<std::string>();
    }
    config.verbose = result.count("verbose") != 0U;

    if (config.duration <= 0.0 || config.interval <= 0.0) {
        std::cerr << "Error: --duration and --interval must be positive" << std::endl;
        std::exit(64);
    }
    return config;
}

class Turnstile : public core::Fsm {
public:
    Turnstile(core::Circuit& circuit, core::BlockOptions options)
        : Fsm(circuit, control_table(), std::move(options),
              core::FsmOptions{.persistence = {.persistent = true}}) {}

    static const core::FsmTable& control_table() {
        static const core::FsmTable fsm_table = core::FsmBuilder("Turnstile")
            .states({"locked", "unlocked"})
            .transition("coin", "locked", "unlocked")
            .transition("push", "unlocked", "locked")
            .build();
        return fsm_table;
    }
};

void build_circuit(core::Circuit& circuit, const Config& config) {
    auto rng = std::make_shared<std::mt19937>(config.seed);
    circuit.add<blocks::ValuePoll>(
        core::BlockOptions{.name = "thermometer", .comment = "fake room thermometer"},
        blocks::ValuePoll::Config{
            .func = [rng] {
                std::uniform_real_distribution<double> dist(20.0, 28.0);
                return core::Value(std::round(dist(*rng) * 10.0) / 10.0);
            },
            .interval = core::duration_from_seconds(config.interval),
            .initdef = 22.0,
        });

    circuit.add<blocks::Compare>(
        core::BlockOptions{.name = "thermostat", .on_output = {core::Event("heater")}},
        blocks::Compare::Config{.low = 22.0, .high = 24.0})
        .connect({"thermometer"});

    circuit.add<blocks::OutputFunc>(
        core::BlockOptions{.name = "heater"},
        blocks::OutputFunc::Config{
            .func = [](const core::EventData& data) {
                bool hot = core::get_or(data, "value").truthy();
                core::logger()->info("Heater {}", hot ? "off" : "on");
                return core::Value(!hot);
            },
            .on_success = {core::Event("switch_count", "inc")},
        });

    circuit.add<blocks::Counter>(
        core::BlockOptions{.name = "switch_count"},
        blocks::Counter::Config{.persistence = {.persistent = true}});

    circuit.add<Turnstile>(core::BlockOptions{.name = "turnstile", .comment = "example turnstile"});

    // a visitor arrives every 3 s and pushes through 1 s later
    circuit.add<blocks::Timer>(
        core::BlockOptions{
            .name = "visitor",
            .on_output = {core::Event("turnstile", core::cond("coin", "push"))},
        },
        blocks::Timer::Config{
            .t_on = core::duration_from_seconds(1.0),
            .t_off = core::duration_from_seconds(2.0),
        });
}

std::unique_ptr<core::TraceWriter> make_writer(io::TraceFormat format, std::ostream& out) {
    switch (format) {
        case io::TraceFormat::Json:
            return std::make_unique<io::JsonTraceWriter>(out);
        case io::TraceFormat::Text:
            return std::make_unique<io::TextualTraceWriter>(out, &out == &std::cout);
        case io::TraceFormat::None:
            break;
    }
    return std::make_unique<io::NullTraceWriter>();
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        io::CircuitConfig circuit_config;
        if (!config.config_file.empty()) {
            circuit_config = io::load_circuit_config(config.config_file);
        }
        if (config.format) {
            circuit_config.trace_format = *config.format;
        }
        if (config.output_file != "-") {
            circuit_config.trace_output = config.output_file;
        }
        if (config.persistent_file) {
            circuit_config.persistent_file = *config.persistent_file;
        }

        core::Circuit circuit(circuit_config.options);
        build_circuit(circuit, config);
        io::apply_debug_settings(circuit, circuit_config);
        if (config.verbose) {
            circuit.set_debug(true, "*");
            circuit.set_circuit_debug(true);
        }

        std::unique_ptr<io::JsonFileStore> store;
        if (circuit_config.persistent_file) {
            store = std::make_unique<io::JsonFileStore>(*circuit_config.persistent_file);
            circuit.set_persistent_store(store.get());
        }

        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (circuit_config.trace_output != "-") {
            outfile.open(circuit_config.trace_output);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << circuit_config.trace_output << std::endl;
                return 1;
            }
            out = &outfile;
        }
        auto writer = make_writer(circuit_config.trace_format, *out);
        circuit.set_trace_writer(writer.get());

        const core::Duration duration = core::duration_from_seconds(config.duration);
        if (circuit.virtual_time()) {
            if (circuit.initialize()) {
                circuit.advance(duration);
                circuit.shutdown();
            }
        } else {
            core::run(circuit, {[duration](std::stop_token token) {
                std::mutex mutex;
                std::condition_variable_any cond;
                std::unique_lock lock(mutex);
                cond.wait_for(lock, token, std::chrono::nanoseconds(core::duration_to_nanoseconds(duration)), [] { return false; });
            }});
        }

        auto* counter = dynamic_cast<blocks::Counter*>(&circuit.block("switch_count"));
        std::cerr << "Heater switched " << counter->output().to_string() << " times" << std::endl;
        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::ConfigurationError& e) {
        std::cerr << "Circuit error: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
