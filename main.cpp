// Health check
#include "health/HealthCheckService.hpp"
#include "health/errors.hpp"
#include "types/HealthCheckResult.hpp"
#include "types/NZBCandidate.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "concurrency/Context.hpp"
#include "log/Registry.hpp"

// Libraries
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

using namespace np::config;
using namespace np::health;
using namespace np::log;
using np::concurrency::Context;
using np::types::NZBCandidate;

namespace {

enum ExitCode : int {
    EXIT_HEALTHY = 0,
    EXIT_MISSING = 1,
    EXIT_USAGE = 2,
    EXIT_CONFIG = 3,
    EXIT_FETCH = 4,
    EXIT_PARSE = 5,
    EXIT_OTHER = 6
};

const Context rootContext;

void signalHandler(int) {
    rootContext.cancel();
}

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CliArgs {
    std::filesystem::path config_path;
    std::string title;
    std::string url;
    std::filesystem::path file;
    std::optional<unsigned int> budget;
    bool use_pool = false;
};

void printUsage(std::ostream& os) {
    os << "usage: newsprobe [--config PATH] [--title TITLE] [--budget N] [--pool] (URL | --file PATH)\n";
}

CliArgs parseArgs(const int argc, char** argv) {
    CliArgs args;
    if (const char* env = std::getenv("NEWSPROBE_CONFIG"); env && *env) args.config_path = env;
    else args.config_path = DEFAULT_CONFIG_PATH;

    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw UsageError(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") args.config_path = value(i, arg);
        else if (arg == "--title") args.title = value(i, arg);
        else if (arg == "--file") args.file = value(i, arg);
        else if (arg == "--pool") args.use_pool = true;
        else if (arg == "--budget") {
            const auto raw = value(i, arg);
            try {
                size_t pos = 0;
                const auto n = std::stoul(raw, &pos);
                if (pos != raw.size() || raw.front() == '-') throw std::invalid_argument(raw);
                args.budget = static_cast<unsigned int>(n);
            } catch (const std::logic_error&) {
                throw UsageError("--budget expects a non-negative integer, got '" + raw + "'");
            }
        } else if (arg == "-h" || arg == "--help") {
            printUsage(std::cout);
            std::exit(EXIT_HEALTHY);
        } else if (!arg.empty() && arg.front() == '-') {
            throw UsageError("unknown option " + arg);
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            throw UsageError("unexpected argument " + arg);
        }
    }

    if (args.url.empty() == args.file.empty()) throw UsageError("exactly one of URL or --file is required");
    return args;
}

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ParseError("cannot open " + path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

int run(const CliArgs& args) {
    auto cfg = loadConfig(args.config_path);
    if (args.budget) cfg.health_check.sample_budget = *args.budget;
    if (args.use_pool) cfg.health_check.use_pool = true;

    ConfigRegistry::init(cfg);
    Registry::init(ConfigRegistry::get().logging);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const HealthCheckService service;

    NZBCandidate candidate;
    candidate.title = args.title;
    candidate.download_url = args.url;

    const auto result = args.file.empty()
        ? service.checkHealth(rootContext, candidate)
        : service.checkHealthWithNZB(rootContext, candidate, slurp(args.file), args.file.filename().string());

    std::cout << nlohmann::json(result).dump(2) << std::endl;
    return result.healthy ? EXIT_HEALTHY : EXIT_MISSING;
}

int fail(const int code, const std::string& what) {
    if (Registry::isInitialized()) Registry::newsprobe()->error("[-] {}", what);
    std::cerr << "newsprobe: " << what << std::endl;
    return code;
}

}

int main(const int argc, char** argv) {
    CliArgs args;
    try {
        args = parseArgs(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "newsprobe: " << e.what() << "\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    try {
        return run(args);
    } catch (const ConfigError& e) {
        return fail(EXIT_CONFIG, e.what());
    } catch (const FetchError& e) {
        return fail(EXIT_FETCH, e.what());
    } catch (const ParseError& e) {
        return fail(EXIT_PARSE, e.what());
    } catch (const CancellationError& e) {
        return fail(EXIT_OTHER, e.what());
    } catch (const std::exception& e) {
        // loadConfig and Registry::init report with plain runtime_error
        if (!ConfigRegistry::isInitialized()) return fail(EXIT_CONFIG, e.what());
        return fail(EXIT_OTHER, e.what());
    }
}
