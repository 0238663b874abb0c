#include "tax_engine.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace retirecalc {

HouseholdIncome::HouseholdIncome()
    : earned(0.0), pension(0.0), distributions(0.0),
      capital_gains(0.0), social_security(0.0) {}

IrmaaResult::IrmaaResult() : part_b(0.0), part_d(0.0) {}

TaxBreakdown::TaxBreakdown()
    : federal_ordinary(0.0), capital_gains(0.0), niit(0.0), state(0.0),
      taxable_social_security(0.0), agi(0.0), ordinary_taxable_income(0.0) {}

// ============================================================================
// TaxEngine Implementation
// ============================================================================

TaxEngine::TaxEngine()
    : TaxEngine(InflationIndexedProvider()) {}

TaxEngine::TaxEngine(const TaxTableProvider& provider, StateTaxTable states,
                     int first_year, int last_year)
    : first_year_(first_year), states_(std::move(states)) {
    if (last_year < first_year) {
        throw std::invalid_argument("Tax year range is empty");
    }
    years_.reserve(static_cast<size_t>(last_year - first_year + 1));
    for (int year = first_year; year <= last_year; ++year) {
        years_.push_back(provider.config_for_year(year));
    }
}

const TaxYearConfig& TaxEngine::year_config(int year) const {
    if (year < first_year_ || year > last_year()) {
        throw std::out_of_range("Tax year " + std::to_string(year) + " outside " +
                                std::to_string(first_year_) + "-" + std::to_string(last_year()));
    }
    return years_[static_cast<size_t>(year - first_year_)];
}

double TaxEngine::federal_tax(double taxable_income, FilingStatus status, int year) const {
    const FilingTables& t = year_config(year).for_status(status);
    double tax = 0.0;
    walk_stacked_brackets(t.ordinary, 0.0, taxable_income, [&tax](const Bracket& b, double width) {
        tax += width * b.rate;
    });
    return tax;
}

double TaxEngine::capital_gains_tax(double gains, double ordinary_taxable_income,
                                    FilingStatus status, int year) const {
    if (gains <= 0.0) {
        return 0.0;
    }
    const FilingTables& t = year_config(year).for_status(status);
    double start = std::max(0.0, ordinary_taxable_income);
    double tax = 0.0;
    walk_stacked_brackets(t.capital_gains, start, start + gains, [&tax](const Bracket& b, double width) {
        tax += width * b.rate;
    });
    return tax;
}

double TaxEngine::net_investment_income_tax(double investment_income, double magi,
                                            FilingStatus status, int year) const {
    const TaxYearConfig& config = year_config(year);
    double excess = magi - config.for_status(status).niit_threshold;
    if (investment_income <= 0.0 || excess <= 0.0) {
        return 0.0;
    }
    return config.niit_rate * std::min(investment_income, excess);
}

IrmaaResult TaxEngine::irmaa_surcharge(double magi, FilingStatus status, int year, int age) const {
    IrmaaResult result;
    if (age < MEDICARE_AGE) {
        return result;
    }

    const TaxYearConfig& config = year_config(year);
    const FilingTables& t = config.for_status(status);
    if (t.irmaa.empty()) {
        return result;
    }

    const IrmaaTier& tier = find_tier(t.irmaa, magi);
    result.part_b = std::max(0.0, tier.part_b_premium - config.part_b_base_premium) * 12.0;
    result.part_d = tier.part_d_addon * 12.0;
    return result;
}

SocialSecurityThresholds TaxEngine::social_security_thresholds(FilingStatus status) {
    if (status == FilingStatus::MarriedJoint) {
        return {32000.0, 44000.0};
    }
    return {25000.0, 34000.0};
}

double TaxEngine::taxable_social_security(double benefit, double other_income,
                                          FilingStatus status) const {
    if (benefit <= 0.0) {
        return 0.0;
    }
    SocialSecurityThresholds th = social_security_thresholds(status);
    double provisional = other_income + 0.5 * benefit;

    if (provisional <= th.base) {
        return 0.0;
    }
    if (provisional <= th.adjusted) {
        return std::min(0.5 * (provisional - th.base), 0.5 * benefit);
    }
    double middle_tier = std::min(0.5 * benefit, 0.5 * (th.adjusted - th.base));
    return std::min(0.85 * benefit, 0.85 * (provisional - th.adjusted) + middle_tier);
}

double TaxEngine::standard_deduction(FilingStatus status, int year, int seniors) const {
    const FilingTables& t = year_config(year).for_status(status);
    return t.standard_deduction + t.senior_deduction * std::max(0, seniors);
}

double TaxEngine::state_tax(const std::string& state, const HouseholdIncome& income,
                            double taxable_social_security) const {
    const StateTaxRule& rule = states_.rule(state);
    if (rule.rate <= 0.0) {
        return 0.0;
    }

    double taxable = income.earned + income.capital_gains +
                     std::max(0.0, income.retirement() - rule.retirement_exemption);
    if (rule.taxes_social_security) {
        taxable += taxable_social_security;
    }
    return rule.rate * std::max(0.0, taxable);
}

TaxBreakdown TaxEngine::household_tax(const HouseholdIncome& income, FilingStatus status, int year,
                                      int seniors, const std::string& state) const {
    TaxBreakdown result;

    double gains = std::max(0.0, income.capital_gains);
    double other_income = income.ordinary() + gains;
    result.taxable_social_security = taxable_social_security(income.social_security, other_income, status);
    result.agi = other_income + result.taxable_social_security;

    // Deduction offsets ordinary income first, any remainder offsets gains
    double deduction = standard_deduction(status, year, seniors);
    double ordinary_gross = income.ordinary() + result.taxable_social_security;
    result.ordinary_taxable_income = std::max(0.0, ordinary_gross - deduction);
    double total_taxable = std::max(0.0, ordinary_gross + gains - deduction);

    result.federal_ordinary = federal_tax(result.ordinary_taxable_income, status, year);
    result.capital_gains = capital_gains_tax(total_taxable - result.ordinary_taxable_income,
                                             result.ordinary_taxable_income, status, year);
    result.niit = net_investment_income_tax(gains, result.agi, status, year);
    result.state = state_tax(state, income, result.taxable_social_security);
    return result;
}

} // namespace retirecalc
