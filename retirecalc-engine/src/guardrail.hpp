#ifndef RETIRECALC_GUARDRAIL_HPP
#define RETIRECALC_GUARDRAIL_HPP

#include <cstdint>
#include <string>

namespace retirecalc {

enum class GuardrailState : uint8_t {
    Normal = 0,
    UpperGuardrailTriggered = 1,    // Withdrawal rate fell below the band: raise spending
    LowerGuardrailTriggered = 2     // Withdrawal rate rose above the band: cut spending
};

std::string guardrail_state_to_string(GuardrailState state);

struct GuardrailConfig {
    bool enabled;
    double lower_guardrail;    // Cut when rate > initial * (1 + lower_guardrail)
    double upper_guardrail;    // Raise when rate < initial * (1 - upper_guardrail)
    double spending_cut;       // Single-year cut step
    double spending_raise;     // Single-year raise step

    GuardrailConfig();

    // Throws std::invalid_argument for bands or steps outside [0, 1)
    void validate() const;
};

struct GuardrailDecision {
    GuardrailState state;
    double spending;           // Spending authorized for the year
    double adjustment;         // spending minus the planned (inflation-adjusted) spending
    double withdrawal_rate;    // Portfolio draw rate measured on planned spending

    GuardrailDecision();
};

// Guyton-Klinger style guardrails. Memoryless apart from the initial rate:
// each year is evaluated against the rate set in the first retirement year.
class GuardrailPolicy {
public:
    explicit GuardrailPolicy(const GuardrailConfig& config = GuardrailConfig());

    const GuardrailConfig& config() const { return config_; }

    // Portfolio draw needed to fund spending, as a share of the portfolio.
    // Zero when the portfolio is empty or income covers spending.
    static double withdrawal_rate(double spending, double guaranteed_income, double portfolio_value);

    GuardrailDecision evaluate(double planned_spending, double guaranteed_income,
                               double portfolio_value, double initial_rate) const;

private:
    GuardrailConfig config_;
};

} // namespace retirecalc

#endif // RETIRECALC_GUARDRAIL_HPP
