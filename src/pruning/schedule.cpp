#include "dynsparse/pruning/schedule.hpp"
#include "dynsparse/errors.hpp"
#include <cmath>
#include <algorithm>

namespace dynsparse {
namespace pruning {

namespace {

constexpr double kPi = 3.14159265358979323846;

void validate_window(int64_t begin_step, int64_t end_step, int64_t frequency,
                     double drop_fraction, std::vector<std::string>& errors) {
    if (begin_step < 0) {
        errors.push_back("begin_step must be >= 0 (got " +
                         std::to_string(begin_step) + ")");
    }
    if (end_step < begin_step) {
        errors.push_back("end_step must be >= begin_step (got " +
                         std::to_string(end_step) + " < " +
                         std::to_string(begin_step) + ")");
    }
    if (frequency < 1) {
        errors.push_back("frequency must be >= 1 (got " +
                         std::to_string(frequency) + ")");
    }
    if (!(drop_fraction >= 0.0 && drop_fraction <= 1.0)) {
        errors.push_back("drop_fraction must be in [0, 1] (got " +
                         std::to_string(drop_fraction) + ")");
    }
}

} // anonymous namespace

ScheduleKind schedule_kind_from_name(const std::string& name) {
    if (name == "constant") return ScheduleKind::Constant;
    if (name == "cosine") return ScheduleKind::Cosine;
    throw ConfigurationError("Unknown update schedule: '" + name +
                             "'. Supported: constant, cosine");
}

std::string schedule_kind_name(ScheduleKind kind) {
    switch (kind) {
        case ScheduleKind::Constant: return "constant";
        case ScheduleKind::Cosine: return "cosine";
    }
    return "unknown";
}

// ============================================================================
// UpdateSchedule
// ============================================================================

UpdateSchedule::UpdateSchedule(int64_t begin_step, int64_t end_step, int64_t frequency)
    : begin_step_(begin_step)
    , end_step_(end_step)
    , frequency_(frequency)
{
}

bool UpdateSchedule::should_update(int64_t step) const {
    if (step < begin_step_ || step > end_step_) {
        return false;
    }
    return (step - begin_step_) % frequency_ == 0;
}

std::vector<int64_t> UpdateSchedule::update_steps(int64_t first, int64_t last) const {
    std::vector<int64_t> steps;
    int64_t lo = std::max(first, begin_step_);
    int64_t hi = std::min(last, end_step_ + 1);
    if (lo >= hi) {
        return steps;
    }

    // First multiple of frequency at or after lo
    int64_t offset = (lo - begin_step_) % frequency_;
    int64_t step = offset == 0 ? lo : lo + (frequency_ - offset);
    for (; step < hi; step += frequency_) {
        steps.push_back(step);
    }
    return steps;
}

// ============================================================================
// ConstantSchedule
// ============================================================================

ConstantSchedule::ConstantSchedule(double drop_fraction, int64_t begin_step,
                                   int64_t end_step, int64_t frequency)
    : UpdateSchedule(begin_step, end_step, frequency)
    , drop_fraction_(drop_fraction)
{
    std::vector<std::string> errors;
    validate_window(begin_step, end_step, frequency, drop_fraction, errors);
    if (!errors.empty()) {
        throw ConfigurationError(errors);
    }
}

double ConstantSchedule::drop_fraction(int64_t step) const {
    if (step >= end_step_) {
        return 0.0;
    }
    return drop_fraction_;
}

// ============================================================================
// CosineSchedule
// ============================================================================

CosineSchedule::CosineSchedule(double initial_drop_fraction, int64_t begin_step,
                               int64_t end_step, int64_t frequency)
    : UpdateSchedule(begin_step, end_step, frequency)
    , initial_drop_fraction_(initial_drop_fraction)
{
    std::vector<std::string> errors;
    validate_window(begin_step, end_step, frequency, initial_drop_fraction, errors);
    if (!errors.empty()) {
        throw ConfigurationError(errors);
    }
}

double CosineSchedule::drop_fraction(int64_t step) const {
    if (step >= end_step_) {
        return 0.0;
    }
    if (step <= begin_step_) {
        return initial_drop_fraction_;
    }
    double t = static_cast<double>(step - begin_step_) /
               static_cast<double>(end_step_ - begin_step_);
    return initial_drop_fraction_ * 0.5 * (1.0 + std::cos(kPi * t));
}

std::shared_ptr<UpdateSchedule> make_schedule(
    ScheduleKind kind,
    double drop_fraction,
    int64_t begin_step,
    int64_t end_step,
    int64_t frequency)
{
    switch (kind) {
        case ScheduleKind::Constant:
            return std::make_shared<ConstantSchedule>(
                drop_fraction, begin_step, end_step, frequency);
        case ScheduleKind::Cosine:
            return std::make_shared<CosineSchedule>(
                drop_fraction, begin_step, end_step, frequency);
    }
    throw ConfigurationError("Unknown update schedule kind");
}

} // namespace pruning
} // namespace dynsparse
