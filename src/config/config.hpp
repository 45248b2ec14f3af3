#pragma once

#include <config_parser/config_parser.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace effdiff {

enum class Algo { kInvalid, kMyersGreedy, kPatience };

Algo
algo_from_string(std::string s);

std::string
to_string(Algo algo);

struct EngineOptions {
    // Move detection
    int64_t min_block_size = 3;
    int64_t min_significant_lines = 2;
    int64_t min_significant_length = 2;

    // Padding around hunks when building residual regions, and the window
    // used to attribute effective changes to a move.
    int64_t context_window = 3;

    // Concurrent file pair tasks; 0 picks the hardware concurrency.
    int64_t max_parallelism = 0;

    bool debug = false;

    Algo algorithm = Algo::kPatience;
    int64_t context_lines = 3;
};

enum class ConfigLoadStatus {
    Ok,
    Invalid,
    DoesNotExist,
};

struct ConfigLoadResult {
    ConfigLoadStatus status = ConfigLoadStatus::Ok;
    std::string error;

    // Keys that were present but rejected; their defaults were kept.
    std::vector<std::string> warnings;

    bool
    is_ok() const {
        return status == ConfigLoadStatus::Ok;
    }
};

// Apply the keys present in a parsed config table over `options`. Returns a
// message for each rejected value.
std::vector<std::string>
config_apply_engine_options(diffy::Value& config, EngineOptions& options);

bool
config_load_engine_options(const std::string& config_path, EngineOptions& options, ConfigLoadResult& result);

}  // namespace effdiff
