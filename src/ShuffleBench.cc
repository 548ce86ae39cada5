#include "main/Config.hh"
#include "main/ShuffleBenchMain.hh"
#include "messaging/JsonSerializer.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace Shuffling;
using Main::ShuffleBenchMain;

template<typename T>
T parseArgument(const char* arg)
{
    return Messaging::JsonSerializer::deserialize<T>(arg);
}

std::unique_ptr<RandomSource> createRandomSource(
    const std::optional<Rng::result_type>& seed)
{
    if (seed) {
        log(LogLevel::INFO, "Using seed %d", *seed);
        return std::make_unique<RngRandomSource>(*seed);
    }
    return std::make_unique<RngRandomSource>();
}

}

int shuffle_bench_main(int argc, char* argv[])
{
    auto config_path = std::string {};
    auto algorithms = std::vector<std::string> {};
    auto rounds = std::optional<int> {};
    auto seed = std::optional<Rng::result_type> {};
    auto steps = false;
    auto verbosity = 0;

    const auto short_opt = "vf:a:r:s:t";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { "algorithm", required_argument, 0, 'a' },
        option { "rounds", required_argument, 0, 'r' },
        option { "seed", required_argument, 0, 's' },
        option { "steps", no_argument, 0, 't' },
        option { nullptr, 0, 0, 0 },
    };
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            config_path = optarg;
        } else if (c == 'a') {
            algorithms.emplace_back(optarg);
        } else if (c == 'r') {
            rounds = parseArgument<int>(optarg);
        } else if (c == 's') {
            seed = parseArgument<Rng::result_type>(optarg);
        } else if (c == 't') {
            steps = true;
        } else {
            return EXIT_FAILURE;
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);

    const auto config = Main::configFromPath(config_path);
    if (const auto level = config.getLogLevel(); level && verbosity == 0) {
        setupLogging(*level, std::cerr);
    }

    auto options = Main::optionsFromConfig(config);
    if (!algorithms.empty()) {
        options.algorithms = std::move(algorithms);
    }
    if (rounds) {
        options.rounds = *rounds;
    }
    if (seed) {
        options.seed = seed;
    }

    const auto random = createRandomSource(options.seed);
    auto app = ShuffleBenchMain {options, *random};
    log(LogLevel::INFO, "Startup completed");
    if (steps) {
        std::cout << app.getStepsReport().dump(2) << std::endl;
    } else {
        app.run();
        std::cout << app.getReport().dump(2) << std::endl;
    }
    return EXIT_SUCCESS;
}
