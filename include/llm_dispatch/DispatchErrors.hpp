#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace llm_dispatch {

// Raised before any worker is scheduled when a batch is larger than MAX_BATCH_SIZE.
struct BatchValidationError : public std::runtime_error {
    size_t submitted_;
    size_t limit_;
    BatchValidationError(size_t submitted, size_t limit)
        : std::runtime_error("batch of " + std::to_string(submitted) +
                             " requests exceeds MAX_BATCH_SIZE=" + std::to_string(limit)),
          submitted_(submitted), limit_(limit) {}
};

struct ConfigError : public std::runtime_error {
    std::string option_;
    ConfigError(std::string option, const std::string& msg)
        : std::runtime_error(option + ": " + msg), option_(std::move(option)) {}
};

}
