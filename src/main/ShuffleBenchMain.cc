#include "main/ShuffleBenchMain.hh"

#include "engine/ShuffleAlgorithm.hh"
#include "engine/ShuffleEngine.hh"
#include "engine/StepApplicator.hh"
#include "main/Config.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/StatisticsJsonSerializer.hh"
#include "messaging/TransformationRecordJsonSerializer.hh"
#include "shuffling/InvalidInputException.hh"
#include "shuffling/InvariantViolationException.hh"
#include "Logging.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <chrono>
#include <utility>

namespace Shuffling {
namespace Main {

using nlohmann::json;

namespace {

const std::string DECK_SIZE_KEY {"deckSize"};
const std::string ROUNDS_KEY {"rounds"};
const std::string STATISTICS_KEY {"statistics"};
const std::string AVERAGE_EXECUTION_TIME_KEY {"averageExecutionTime"};
const std::string COMPARISONS_KEY {"comparisons"};
const std::string ALGORITHM_KEY {"algorithm"};
const std::string DECK_KEY {"deck"};
const std::string STEPS_KEY {"steps"};
const std::string RESULT_KEY {"result"};

Engine::AlgorithmDescriptorVector resolveAlgorithms(
    const std::vector<std::string>& names)
{
    if (names.empty()) {
        return Engine::listAlgorithms();
    }
    auto ret = Engine::AlgorithmDescriptorVector {};
    for (const auto& name : names) {
        const auto& descriptor = Engine::getAlgorithm(name).getDescriptor();
        if (std::find(ret.begin(), ret.end(), descriptor) != ret.end()) {
            log(LogLevel::WARNING, "Algorithm listed twice: %s", name);
        } else {
            ret.emplace_back(descriptor);
        }
    }
    return ret;
}

int checkRounds(const int rounds)
{
    if (rounds < 1) {
        throw InvalidInputException {
            boost::str(boost::format("Invalid number of rounds: %1%") % rounds)};
    }
    return rounds;
}

}

BenchOptions optionsFromConfig(const Config& config)
{
    return BenchOptions {
        config.getAlgorithms(),
        config.getRounds(),
        config.getSeed(),
        config.getDeckSize(),
        config.getVerifyReplay(),
    };
}

ShuffleBenchMain::ShuffleBenchMain(
    const BenchOptions& options, RandomSource& random) :
    algorithms {resolveAlgorithms(options.algorithms)},
    rounds {checkRounds(options.rounds)},
    verifyReplay {options.verifyReplay},
    deck {createOrderedDeck(options.deckSize)},
    random {random},
    statistics {Scoring::initAllStats(algorithms)}
{
}

void ShuffleBenchMain::run()
{
    for (auto round = 1; round <= rounds; ++round) {
        log(LogLevel::INFO, "Round %d of %d", round, rounds);
        for (const auto& descriptor : algorithms) {
            runShuffle(descriptor.name);
        }
    }
}

Deck ShuffleBenchMain::runShuffle(const std::string_view name)
{
    const auto stats_iter = statistics.find(name);
    if (stats_iter == statistics.end()) {
        throw InvalidInputException {
            boost::str(boost::format("Not benchmarked: %1%") % name)};
    }
    const auto& algorithm = Engine::getAlgorithm(name);

    auto recorder = RecordingRandomSource {random};
    const auto start = std::chrono::steady_clock::now();
    auto shuffled = algorithm.shuffle(deck, recorder);
    const auto elapsed = std::chrono::duration<double, std::milli> {
        std::chrono::steady_clock::now() - start};

    auto replay = ReplayRandomSource {recorder.getTrace()};
    const auto records = algorithm.recordSteps(deck, replay);
    if (verifyReplay) {
        const auto replayed = clearHighlights(
            Engine::replaySteps(deck, records, records.size()));
        if (!replay.isExhausted() || replayed != shuffled) {
            throw InvariantViolationException {
                boost::str(
                    boost::format("Steps of %1% do not reproduce the shuffle")
                    % name)};
        }
    }

    const auto step_count = static_cast<int>(records.size());
    log(LogLevel::DEBUG, "%s: %d steps in %s ms", name, step_count,
        elapsed.count());
    stats_iter->second = Scoring::updateStats(
        stats_iter->second, deck, shuffled, elapsed.count(), step_count);
    return shuffled;
}

const Engine::AlgorithmDescriptorVector& ShuffleBenchMain::getAlgorithms() const
{
    return algorithms;
}

const Deck& ShuffleBenchMain::getDeck() const
{
    return deck;
}

const Scoring::AlgorithmStatisticsMap& ShuffleBenchMain::getStatistics() const
{
    return statistics;
}

std::vector<Scoring::StatisticsComparison>
ShuffleBenchMain::getComparisons() const
{
    auto ret = std::vector<Scoring::StatisticsComparison> {};
    for (auto first = algorithms.begin(); first != algorithms.end(); ++first) {
        for (auto second = std::next(first); second != algorithms.end();
             ++second) {
            ret.emplace_back(
                Scoring::compareStats(
                    statistics.at(first->name), statistics.at(second->name)));
        }
    }
    return ret;
}

json ShuffleBenchMain::getReport() const
{
    auto stats_json = json::array();
    for (const auto& descriptor : algorithms) {
        const auto& stats = statistics.at(descriptor.name);
        auto entry = json(stats);
        entry.emplace(
            AVERAGE_EXECUTION_TIME_KEY, Scoring::averageExecutionTime(stats));
        stats_json.push_back(std::move(entry));
    }
    auto ret = json::object();
    ret.emplace(DECK_SIZE_KEY, deck.size());
    ret.emplace(ROUNDS_KEY, rounds);
    ret.emplace(STATISTICS_KEY, std::move(stats_json));
    ret.emplace(COMPARISONS_KEY, getComparisons());
    return ret;
}

json ShuffleBenchMain::getStepsReport()
{
    auto ret = json::array();
    for (const auto& descriptor : algorithms) {
        const auto records = Engine::recordSteps(descriptor.name, deck, random);
        auto entry = json::object();
        entry.emplace(ALGORITHM_KEY, descriptor);
        entry.emplace(DECK_KEY, deck);
        entry.emplace(STEPS_KEY, records);
        entry.emplace(
            RESULT_KEY, Engine::replaySteps(deck, records, records.size()));
        ret.push_back(std::move(entry));
    }
    return ret;
}

}
}
