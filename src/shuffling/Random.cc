#include "shuffling/Random.hh"

#include "shuffling/InvalidInputException.hh"

#include <boost/format.hpp>

#include <stdexcept>
#include <utility>

namespace Shuffling {

RandomSource::~RandomSource() = default;

int RandomSource::drawInteger(const int low, const int high)
{
    if (low > high) {
        throw std::invalid_argument {"Invalid range for random draw"};
    }
    return handleDrawInteger(low, high);
}

bool RandomSource::drawBoolean()
{
    return drawInteger(0, 1) == 1;
}

RngRandomSource::RngRandomSource() :
    // Initialize with seed from OS random number source
    rng {std::random_device()()}
{
}

RngRandomSource::RngRandomSource(const Rng::result_type seed) :
    rng {seed}
{
}

int RngRandomSource::handleDrawInteger(const int low, const int high)
{
    return std::uniform_int_distribution<int> {low, high}(rng);
}

RecordingRandomSource::RecordingRandomSource(RandomSource& source) :
    source {source},
    trace {}
{
}

const std::vector<int>& RecordingRandomSource::getTrace() const
{
    return trace;
}

int RecordingRandomSource::handleDrawInteger(const int low, const int high)
{
    const auto n = source.drawInteger(low, high);
    trace.push_back(n);
    return n;
}

ReplayRandomSource::ReplayRandomSource(std::vector<int> trace) :
    trace(std::move(trace)),
    next {}
{
}

bool ReplayRandomSource::isExhausted() const
{
    return next >= trace.size();
}

int ReplayRandomSource::handleDrawInteger(const int low, const int high)
{
    if (isExhausted()) {
        throw InvalidInputException {"Random draw trace exhausted"};
    }
    const auto n = trace[next];
    if (n < low || n > high) {
        throw InvalidInputException {
            boost::str(
                boost::format("Scripted draw %1% at %2% outside [%3%, %4%]") %
                n % next % low % high)};
    }
    ++next;
    return n;
}

}
