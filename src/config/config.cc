#include "config.hpp"

#include <config_parser/config_parser_utils.hpp>

#include <fmt/format.h>

#include <string>
#include <tuple>
#include <vector>

using namespace effdiff;

namespace {

enum class ConfigVariableType {
    Bool,
    Int,
    Algorithm,
};

// Config path, storage type, destination and the smallest accepted value
// for integers.
using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*, int64_t>>;

OptionVector
engine_option_vector(EngineOptions& options) {
    // clang-format off
    return {
        {"engine.min_block_size",         ConfigVariableType::Int,       &options.min_block_size,         1},
        {"engine.min_significant_lines",  ConfigVariableType::Int,       &options.min_significant_lines,  0},
        {"engine.min_significant_length", ConfigVariableType::Int,       &options.min_significant_length, 0},
        {"engine.context_window",         ConfigVariableType::Int,       &options.context_window,         0},
        {"engine.max_parallelism",        ConfigVariableType::Int,       &options.max_parallelism,        0},
        {"engine.debug",                  ConfigVariableType::Bool,      &options.debug,                  0},
        {"rediff.algorithm",              ConfigVariableType::Algorithm, &options.algorithm,              0},
        {"rediff.context_lines",          ConfigVariableType::Int,       &options.context_lines,          0},
    };
    // clang-format on
}

}  // namespace

std::vector<std::string>
effdiff::config_apply_engine_options(diffy::Value& config, EngineOptions& options) {
    std::vector<std::string> warnings;

    for (const auto& [path, type, ptr, minimum] : engine_option_vector(options)) {
        // Absent keys keep the value already in the struct.
        auto stored_value = config.lookup_value_by_path(path);
        if (!stored_value) {
            continue;
        }

        diffy::Value& value = stored_value->get();
        switch (type) {
            case ConfigVariableType::Bool: {
                if (!value.is_bool()) {
                    warnings.push_back(fmt::format("{}: expected a boolean", path));
                    break;
                }
                *((bool*) ptr) = value.as_bool();
            } break;
            case ConfigVariableType::Int: {
                if (!value.is_int()) {
                    warnings.push_back(fmt::format("{}: expected an integer", path));
                    break;
                }
                const int64_t number = value.as_int();
                if (number < minimum) {
                    warnings.push_back(fmt::format("{}: {} is less than {}", path, number, minimum));
                    break;
                }
                *((int64_t*) ptr) = number;
            } break;
            case ConfigVariableType::Algorithm: {
                if (!value.is_string()) {
                    warnings.push_back(fmt::format("{}: expected a string", path));
                    break;
                }
                auto algo = algo_from_string(value.as_string());
                if (algo == Algo::kInvalid) {
                    warnings.push_back(fmt::format("{}: unknown algorithm '{}'", path, value.as_string()));
                    break;
                }
                *((Algo*) ptr) = algo;
            } break;
        }
    }

    return warnings;
}

bool
effdiff::config_load_engine_options(const std::string& config_path,
                                    EngineOptions& options,
                                    ConfigLoadResult& result) {
    result = ConfigLoadResult{};

    diffy::Value config_table;
    diffy::ParseResult load_result;
    if (!diffy::cfg_load_file(config_path, load_result, config_table)) {
        result.status = load_result.kind == diffy::ParseErrorKind::File ? ConfigLoadStatus::DoesNotExist
                                                                        : ConfigLoadStatus::Invalid;
        result.error = load_result.error;
        return false;
    }

    if (!config_table.is_table()) {
        result.status = ConfigLoadStatus::Invalid;
        result.error = fmt::format("'{}' does not hold a table", config_path);
        return false;
    }

    result.warnings = config_apply_engine_options(config_table, options);
    return true;
}

effdiff::Algo
effdiff::algo_from_string(std::string s) {
    if (s == "p" || s == "patience" || s == "default")
        return Algo::kPatience;
    else if (s == "mg" || s == "myers-greedy")
        return Algo::kMyersGreedy;
    return Algo::kInvalid;
}

std::string
effdiff::to_string(Algo algo) {
    switch (algo) {
        case Algo::kPatience:
            return "patience";
        case Algo::kMyersGreedy:
            return "myers-greedy";
        case Algo::kInvalid:
            break;
    }
    return "invalid";
}
