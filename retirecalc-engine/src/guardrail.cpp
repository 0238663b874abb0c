#include "guardrail.hpp"
#include <algorithm>
#include <stdexcept>

namespace retirecalc {

std::string guardrail_state_to_string(GuardrailState state) {
    switch (state) {
        case GuardrailState::Normal: return "normal";
        case GuardrailState::UpperGuardrailTriggered: return "upper_guardrail";
        case GuardrailState::LowerGuardrailTriggered: return "lower_guardrail";
        default: return "unknown";
    }
}

GuardrailConfig::GuardrailConfig()
    : enabled(true), lower_guardrail(0.20), upper_guardrail(0.20),
      spending_cut(0.10), spending_raise(0.10) {}

void GuardrailConfig::validate() const {
    auto check = [](double value, const char* name) {
        if (value < 0.0 || value >= 1.0) {
            throw std::invalid_argument(std::string("Guardrail ") + name + " must be in [0, 1)");
        }
    };
    check(lower_guardrail, "lower_guardrail");
    check(upper_guardrail, "upper_guardrail");
    check(spending_cut, "spending_cut");
    check(spending_raise, "spending_raise");
}

GuardrailDecision::GuardrailDecision()
    : state(GuardrailState::Normal), spending(0.0), adjustment(0.0), withdrawal_rate(0.0) {}

GuardrailPolicy::GuardrailPolicy(const GuardrailConfig& config)
    : config_(config) {
    config_.validate();
}

double GuardrailPolicy::withdrawal_rate(double spending, double guaranteed_income, double portfolio_value) {
    if (portfolio_value <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, spending - guaranteed_income) / portfolio_value;
}

GuardrailDecision GuardrailPolicy::evaluate(double planned_spending, double guaranteed_income,
                                            double portfolio_value, double initial_rate) const {
    GuardrailDecision decision;
    decision.spending = planned_spending;
    decision.withdrawal_rate = withdrawal_rate(planned_spending, guaranteed_income, portfolio_value);

    // No band to compare against: inflation adjustment only
    if (!config_.enabled || portfolio_value <= 0.0 || initial_rate <= 0.0) {
        return decision;
    }

    if (decision.withdrawal_rate > initial_rate * (1.0 + config_.lower_guardrail)) {
        decision.state = GuardrailState::LowerGuardrailTriggered;
        decision.spending = planned_spending * (1.0 - config_.spending_cut);
    } else if (decision.withdrawal_rate < initial_rate * (1.0 - config_.upper_guardrail)) {
        decision.state = GuardrailState::UpperGuardrailTriggered;
        decision.spending = planned_spending * (1.0 + config_.spending_raise);
    }
    decision.adjustment = decision.spending - planned_spending;
    return decision;
}

} // namespace retirecalc
