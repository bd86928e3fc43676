// =============================================================================
// idforge - Identifier generator and validator
// =============================================================================
// Version: 1.0.0
// Description: Command-line front end of the idforge core library.
//              Records and results are printed as JSON lines on stdout;
//              logs go to stderr.
// =============================================================================

#include <spdlog/spdlog.h>
#include <json/json.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "idforge/core/engine.h"
#include "config/config_manager.h"
#include "exception/exceptions.h"
#include "logging/logger.h"

using namespace idforge::core;

namespace {

constexpr int kDefaultBatchLimit = 10000;

void printUsage(std::ostream& out) {
    out << "Usage:\n"
           "  idforge generate <category> <code|*> [--count N] [--seed S]\n"
           "                   [--gender m|f] [--year-from Y] [--year-to Y] [--threads N]\n"
           "                   [--holder individual|company|any]\n"
           "  idforge validate <input> [--category C] [--country X]\n"
           "  idforge list <category>\n"
           "  idforge --help\n"
           "\n"
           "Categories:";
    for (Category c : kAllCategories) {
        out << " " << categoryToString(c);
    }
    out << "\n\n"
           "Environment: LOG_LEVEL, LOG_FILE, IDFORGE_MAX_ATTEMPTS, IDFORGE_MIN_BIRTH_YEAR,\n"
           "             IDFORGE_MAX_BIRTH_YEAR, IDFORGE_BATCH_LIMIT, IDFORGE_THREADS\n";
}

/// Positional arguments plus "--name value" options
struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

Arguments parseArguments(int argc, char* argv[], int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            args.options["help"] = "";
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("option " + arg + " needs a value");
            }
            args.options[arg.substr(2)] = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

long long parseNumber(const std::string& name, const std::string& value) {
    size_t used = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::invalid_argument("--" + name + " expects a number, got '" + value + "'");
    }
    return n;
}

Category parseCategory(const std::string& value) {
    auto category = categoryFromString(value);
    if (!category) {
        throw std::invalid_argument("unknown category '" + value + "'");
    }
    return *category;
}

std::string toLine(const Json::Value& json) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, json);
}

// =============================================================================
// Commands
// =============================================================================

int runGenerate(const Engine& engine, const Arguments& args) {
    if (args.positional.size() != 2) {
        throw std::invalid_argument("generate expects <category> <code|*>");
    }
    const Category category = parseCategory(args.positional[0]);
    const std::string& code = args.positional[1];

    Constraints constraints;
    long long count = 1;
    unsigned threads = 1;
    for (const auto& [name, value] : args.options) {
        if (name == "count") {
            count = parseNumber(name, value);
        } else if (name == "seed") {
            constraints.seed = static_cast<uint64_t>(parseNumber(name, value));
        } else if (name == "gender") {
            if (value == "m" || value == "male") constraints.sex = Sex::MALE;
            else if (value == "f" || value == "female") constraints.sex = Sex::FEMALE;
            else throw std::invalid_argument("--gender expects m or f");
        } else if (name == "year-from") {
            constraints.yearFrom = static_cast<int>(parseNumber(name, value));
        } else if (name == "year-to") {
            constraints.yearTo = static_cast<int>(parseNumber(name, value));
        } else if (name == "holder") {
            if (value == "individual") constraints.holder = HolderType::INDIVIDUAL;
            else if (value == "company") constraints.holder = HolderType::COMPANY;
            else if (value == "any") constraints.holder = HolderType::ANY;
            else throw std::invalid_argument("--holder expects individual, company or any");
        } else if (name == "threads") {
            threads = static_cast<unsigned>(std::max(0LL, parseNumber(name, value)));
        } else {
            throw std::invalid_argument("unknown option --" + name);
        }
    }

    const int limit = common::ConfigManager::getInstance().getInt(
        common::ConfigManager::BATCH_LIMIT, kDefaultBatchLimit);
    if (limit < 1) {
        throw common::ConfigException(std::string(common::ConfigManager::BATCH_LIMIT) +
                                      " must be positive, got " + std::to_string(limit));
    }
    if (count < 1) {
        throw std::invalid_argument("--count must be at least 1");
    }
    if (count > limit) {
        spdlog::warn("Requested {} records, capped at {} ({})", count, limit,
                     common::ConfigManager::BATCH_LIMIT);
        count = limit;
    }

    int failures = 0;
    auto emit = [&failures](const GenerateResult& result) {
        if (result.success) {
            std::cout << toLine(result.record.toJson()) << "\n";
        } else {
            ++failures;
            spdlog::error("Generation failed ({}): {}", errorKindToString(result.error),
                          result.message);
        }
    };

    if (threads == 1) {
        for (const auto& result : engine.generateBatch(category, code, static_cast<size_t>(count),
                                                       constraints)) {
            emit(result);
        }
    } else {
        for (const auto& result : engine.generateBatchParallel(
                 category, code, static_cast<size_t>(count), constraints, threads)) {
            emit(result);
        }
    }
    std::cout.flush();
    return failures == 0 ? 0 : 1;
}

int runValidate(const Engine& engine, const Arguments& args) {
    if (args.positional.size() != 1) {
        throw std::invalid_argument("validate expects exactly one <input>");
    }
    std::optional<Category> category;
    std::optional<std::string> country;
    for (const auto& [name, value] : args.options) {
        if (name == "category") {
            category = parseCategory(value);
        } else if (name == "country") {
            country = value;
        } else {
            throw std::invalid_argument("unknown option --" + name);
        }
    }

    ValidationResult result = engine.validate(args.positional[0], category, country);
    std::cout << toLine(result.toJson()) << std::endl;
    return result.valid ? 0 : 1;
}

int runList(const Engine& engine, const Arguments& args) {
    if (args.positional.size() != 1 || !args.options.empty()) {
        throw std::invalid_argument("list expects exactly one <category>");
    }
    const Category category = parseCategory(args.positional[0]);
    for (const auto& code : engine.listSupported(category)) {
        const FormatSpec& spec = engine.registry().lookup(category, code);
        Json::Value json;
        json["code"] = code;
        json["name"] = spec.name;
        if (auto country = engine.countryName(code)) {
            json["country"] = *country;
        }
        std::cout << toLine(json) << "\n";
    }
    std::cout.flush();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto& config = common::ConfigManager::getInstance();
    common::Logger::initialize("idforge",
                               config.getString(common::ConfigManager::LOG_LEVEL, "warn"),
                               config.has(common::ConfigManager::LOG_FILE),
                               config.getString(common::ConfigManager::LOG_FILE));

    if (argc < 2) {
        printUsage(std::cerr);
        return 2;
    }
    const std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        printUsage(std::cout);
        return 0;
    }

    try {
        Arguments args = parseArguments(argc, argv, 2);
        if (args.options.count("help")) {
            printUsage(std::cout);
            return 0;
        }

        Engine engine;
        if (command == "generate") return runGenerate(engine, args);
        if (command == "validate") return runValidate(engine, args);
        if (command == "list") return runList(engine, args);

        std::cerr << "Unknown command: " << command << "\n\n";
        printUsage(std::cerr);
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return 2;
    } catch (const common::IdforgeException& e) {
        spdlog::critical("{}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
        return 3;
    }
}
