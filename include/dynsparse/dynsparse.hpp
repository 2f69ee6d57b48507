#pragma once

/// @file dynsparse.hpp
/// @brief Main include file for the dynsparse library

// Core types
#include "dynsparse/types.hpp"
#include "dynsparse/errors.hpp"
#include "dynsparse/tensor.hpp"
#include "dynsparse/options.hpp"

// Mask-update engine
#include "dynsparse/pruning/schedule.hpp"
#include "dynsparse/pruning/slot_store.hpp"
#include "dynsparse/pruning/rigl_pruner.hpp"
#include "dynsparse/pruning/pruning_config.hpp"

// Host side
#include "dynsparse/training/pruning_optimizer.hpp"
#include "dynsparse/report.hpp"

namespace dynsparse {

/// Library version
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace dynsparse
