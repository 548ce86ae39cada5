#include "main/Config.hh"

#include "shuffling/ShufflingConstants.hh"
#include "IoUtility.hh"

#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <limits>
#include <new>
#include <stdexcept>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Shuffling {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto ALGORITHMS = "algorithms"sv;
constexpr auto ROUNDS = "rounds"sv;
constexpr auto SEED = "seed"sv;
constexpr auto DECK_SIZE = "deck_size"sv;
constexpr auto VERIFY_REPLAY = "verify_replay"sv;
constexpr auto LOG_LEVEL = "log_level"sv;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(
    lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Exceptions must not cross the C boundary
            log(LogLevel::WARNING, "Failed to read config: %s", strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (s) {
        const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
        auto error = lua_load(
            lua, config_lua_reader, reader_args.get(), "config", nullptr);
        if (!error) {
            const auto out_of_memory_handler =
                std::set_new_handler(std::terminate);
            error = lua_pcall(lua, 0, 0, 0);
            std::set_new_handler(out_of_memory_handler);
        }
        if (error) {
            log(LogLevel::ERROR, "Error while running config script: %s",
                lua_tostring(lua, -1));
            throw std::runtime_error {"Could not process config"};
        }
    } else {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
}

std::optional<std::string> getString(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected string: %s", key);
    }
    return std::nullopt;
}

std::optional<lua_Integer> getInt(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success) {
        return ret;
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

std::optional<bool> getBool(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    if (lua_isboolean(lua, -1)) {
        return lua_toboolean(lua, -1) != 0;
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected boolean: %s", key);
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> getIntInRange(
    lua_State* lua, std::string_view key, const T min, const T max)
{
    if (const auto value = getInt(lua, key)) {
        if (*value >= static_cast<lua_Integer>(min) &&
            *value <= static_cast<lua_Integer>(max)) {
            return static_cast<T>(*value);
        }
        log(LogLevel::WARNING, "%s out of range: %d", key, *value);
    }
    return std::nullopt;
}

}

class Config::Impl {
public:

    Impl();
    Impl(std::istream& in);

    const AlgorithmNameVector& getAlgorithms() const;
    int getRounds() const;
    std::optional<Rng::result_type> getSeed() const;
    int getDeckSize() const;
    bool getVerifyReplay() const;
    std::optional<LogLevel> getLogLevel() const;

private:

    void createAlgorithmsConfig(lua_State* lua);
    void createLogLevelConfig(lua_State* lua);

    AlgorithmNameVector algorithms {};
    int rounds {DEFAULT_ROUNDS};
    std::optional<Rng::result_type> seed {};
    int deckSize {N_CARDS};
    bool verifyReplay {true};
    std::optional<LogLevel> logLevel {};
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    createAlgorithmsConfig(lua.get());
    rounds = getIntInRange(
        lua.get(), ROUNDS, 1, std::numeric_limits<int>::max())
        .value_or(DEFAULT_ROUNDS);
    seed = getIntInRange(
        lua.get(), SEED, Rng::result_type {},
        std::numeric_limits<Rng::result_type>::max());
    deckSize = getIntInRange(lua.get(), DECK_SIZE, 1, N_CARDS)
        .value_or(N_CARDS);
    verifyReplay = getBool(lua.get(), VERIFY_REPLAY).value_or(true);
    createLogLevelConfig(lua.get());

    log(LogLevel::INFO, "Reading configs completed");
}

void Config::Impl::createAlgorithmsConfig(lua_State* lua)
{
    lua_getglobal(lua, ALGORITHMS.data());
    LuaPopGuard guard {lua};
    if (lua_istable(lua, -1)) {
        for (auto i = 1;; ++i) {
            LuaPopGuard guard2 {lua};
            lua_rawgeti(lua, -1, i);
            if (lua_isnil(lua, -1)) {
                break;
            }
            if (lua_type(lua, -1) == LUA_TSTRING) {
                algorithms.emplace_back(lua_tostring(lua, -1));
            } else {
                log(LogLevel::WARNING,
                    "algorithms: expected algorithm name at index %d", i);
            }
        }
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected table: %s", ALGORITHMS);
    }
}

void Config::Impl::createLogLevelConfig(lua_State* lua)
{
    if (const auto name = getString(lua, LOG_LEVEL)) {
        logLevel = parseLogLevel(*name);
        if (!logLevel) {
            log(LogLevel::WARNING, "Unknown log level: %s", *name);
        }
    }
}

const Config::AlgorithmNameVector& Config::Impl::getAlgorithms() const
{
    return algorithms;
}

int Config::Impl::getRounds() const
{
    return rounds;
}

std::optional<Rng::result_type> Config::Impl::getSeed() const
{
    return seed;
}

int Config::Impl::getDeckSize() const
{
    return deckSize;
}

bool Config::Impl::getVerifyReplay() const
{
    return verifyReplay;
}

std::optional<LogLevel> Config::Impl::getLogLevel() const
{
    return logLevel;
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

const Config::AlgorithmNameVector& Config::getAlgorithms() const
{
    assert(impl);
    return impl->getAlgorithms();
}

int Config::getRounds() const
{
    assert(impl);
    return impl->getRounds();
}

std::optional<Rng::result_type> Config::getSeed() const
{
    assert(impl);
    return impl->getSeed();
}

int Config::getDeckSize() const
{
    assert(impl);
    return impl->getDeckSize();
}

bool Config::getVerifyReplay() const
{
    assert(impl);
    return impl->getVerifyReplay();
}

std::optional<LogLevel> Config::getLogLevel() const
{
    assert(impl);
    return impl->getLogLevel();
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else {
        errno = 0;
        return processStreamFromPath(
            path, [](auto& in) { return Config {in}; });
    }
}

}
}
