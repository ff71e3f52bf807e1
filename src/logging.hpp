#pragma once

#include "config.hpp"
#include "utils.hpp"

// Route spdlog to stderr, or to the configured log file. Standard output
// is reserved for the result the host reads.
E<void> setupLogging(const Configuration& config, bool verbose);
