#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dynsparse {
namespace pruning {

/// Drop-fraction curve variants
enum class ScheduleKind {
    Constant,   // Same drop fraction for every update step
    Cosine      // Cosine-annealed from the initial fraction down to zero
};

/// Parse a schedule kind ("constant", "cosine")
ScheduleKind schedule_kind_from_name(const std::string& name);
std::string schedule_kind_name(ScheduleKind kind);

/// Decides on which optimizer steps the mask is reconsidered and how
/// large a fraction of the active connections is dropped.
///
/// Both queries are pure functions of the step, so any two callers fed
/// the same steps make identical decisions.
class UpdateSchedule {
public:
    virtual ~UpdateSchedule() = default;

    /// True for begin_step <= step <= end_step with
    /// (step - begin_step) % frequency == 0
    bool should_update(int64_t step) const;

    /// Fraction of active connections to drop at `step`, in [0, 1].
    /// Returns 0 at or after end_step.
    virtual double drop_fraction(int64_t step) const = 0;

    /// Update steps in [first, last), in ascending order
    std::vector<int64_t> update_steps(int64_t first, int64_t last) const;

    virtual ScheduleKind kind() const = 0;
    std::string name() const { return schedule_kind_name(kind()); }

    int64_t begin_step() const { return begin_step_; }
    int64_t end_step() const { return end_step_; }
    int64_t frequency() const { return frequency_; }

protected:
    UpdateSchedule(int64_t begin_step, int64_t end_step, int64_t frequency);

    int64_t begin_step_;
    int64_t end_step_;
    int64_t frequency_;
};

/// Constant drop fraction inside [begin_step, end_step)
class ConstantSchedule : public UpdateSchedule {
public:
    ConstantSchedule(double drop_fraction, int64_t begin_step,
                     int64_t end_step, int64_t frequency);

    double drop_fraction(int64_t step) const override;
    ScheduleKind kind() const override { return ScheduleKind::Constant; }

    double initial_drop_fraction() const { return drop_fraction_; }

private:
    double drop_fraction_;
};

/// Cosine decay: f(t) = f0 / 2 * (1 + cos(pi * (t - begin) / (end - begin)))
class CosineSchedule : public UpdateSchedule {
public:
    CosineSchedule(double initial_drop_fraction, int64_t begin_step,
                   int64_t end_step, int64_t frequency);

    double drop_fraction(int64_t step) const override;
    ScheduleKind kind() const override { return ScheduleKind::Cosine; }

    double initial_drop_fraction() const { return initial_drop_fraction_; }

private:
    double initial_drop_fraction_;
};

/// Factory used by configuration layers and the Python bindings
std::shared_ptr<UpdateSchedule> make_schedule(
    ScheduleKind kind,
    double drop_fraction,
    int64_t begin_step,
    int64_t end_step,
    int64_t frequency);

} // namespace pruning
} // namespace dynsparse
