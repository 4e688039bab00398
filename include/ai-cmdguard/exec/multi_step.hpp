// Multi-line model replies become a plan of steps that run one at a time.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "ai-cmdguard/exec/execution_mode.hpp"
#include "ai-cmdguard/validate/validator.hpp"

namespace cmdguard {

struct PlanStep {
    std::string command;
    std::string description;            // "Step N: <command>", long commands cut to 47 chars + "..."
    int number = 0;                     // 1-based
    bool depends_on_previous = false;   // skipped when the step before it failed
    std::optional<ValidationResult> validation;
    std::optional<ExecutionMode> mode;
};

class MultiStepPlan {
public:
    // Non-empty, non-comment lines; fewer than two -> nothing.
    static std::optional<MultiStepPlan> parse(const std::string& text);

    PlanStep* next_step();
    // Advances past the current step. False when the plan is exhausted or
    // when `success` is false and the next step depends on this one.
    bool complete_current_step(bool success);
    bool has_more_steps() const { return m_current < m_steps.size(); }
    std::pair<std::size_t, std::size_t> progress() const { return {m_current, m_steps.size()}; }
    std::string format_for_display() const;

    // Validates and resolves every step, storing the results on the step.
    void evaluate(const CommandValidator& validator, const Configuration& config);

    const std::vector<PlanStep>& steps() const { return m_steps; }
private:
    std::vector<PlanStep> m_steps;
    std::size_t m_current = 0;
};

} // namespace cmdguard
