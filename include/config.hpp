#pragma once
#include <cstdint>
#include <optional>

// Runtime knobs shared by the CLI, the project file and the evaluator.
// Probabilities are not configurable.
struct RuntimeOptions {
    std::optional<uint64_t> seed;  // absent: seeded from std::random_device
    uint64_t tick_ms = 10;
    uint64_t default_timeout_ms = 1000;
    bool mischief = false;
    bool trace = false;
};
