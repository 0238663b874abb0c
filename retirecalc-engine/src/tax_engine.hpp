#ifndef RETIRECALC_TAX_ENGINE_HPP
#define RETIRECALC_TAX_ENGINE_HPP

#include "tax_tables.hpp"
#include <string>
#include <vector>

namespace retirecalc {

// One household's income for a tax year, split by tax character
struct HouseholdIncome {
    double earned;            // Wages and part-time earnings
    double pension;
    double distributions;     // Tax-deferred account withdrawals, RMDs included
    double capital_gains;     // Realized long-term gains
    double social_security;   // Gross benefits

    HouseholdIncome();

    double ordinary() const { return earned + pension + distributions; }
    double retirement() const { return pension + distributions; }
};

// Provisional-income thresholds for taxing Social Security (not indexed)
struct SocialSecurityThresholds {
    double base;        // Up to 50% taxable above this
    double adjusted;    // Up to 85% taxable above this
};

struct IrmaaResult {
    double part_b;      // Annual Part B surcharge per beneficiary
    double part_d;      // Annual Part D surcharge per beneficiary

    IrmaaResult();
    double total() const { return part_b + part_d; }
};

struct TaxBreakdown {
    double federal_ordinary;
    double capital_gains;
    double niit;
    double state;
    double taxable_social_security;
    double agi;                       // Also the MAGI used for IRMAA and NIIT
    double ordinary_taxable_income;

    TaxBreakdown();
    double federal() const { return federal_ordinary + capital_gains + niit; }
    double total() const { return federal() + state; }
};

// TaxEngine: pure bracket-table tax functions over a read-only year cache.
// Safe to share across threads once constructed.
class TaxEngine {
public:
    static constexpr int MEDICARE_AGE = 65;
    static constexpr int IRMAA_LOOKBACK_YEARS = 2;
    static constexpr int DEFAULT_FIRST_YEAR = 2000;
    static constexpr int DEFAULT_LAST_YEAR = 2200;

    // Built-in 2024 tables, extrapolated at 2.5% a year
    TaxEngine();
    explicit TaxEngine(const TaxTableProvider& provider,
                       StateTaxTable states = StateTaxTable::builtin(),
                       int first_year = DEFAULT_FIRST_YEAR,
                       int last_year = DEFAULT_LAST_YEAR);

    // Throws std::out_of_range outside the cached year range
    const TaxYearConfig& year_config(int year) const;
    const StateTaxTable& state_table() const { return states_; }
    int first_year() const { return first_year_; }
    int last_year() const { return first_year_ + static_cast<int>(years_.size()) - 1; }

    double federal_tax(double taxable_income, FilingStatus status, int year) const;

    // Gains stack on top of ordinary taxable income
    double capital_gains_tax(double gains, double ordinary_taxable_income,
                             FilingStatus status, int year) const;

    double net_investment_income_tax(double investment_income, double magi,
                                     FilingStatus status, int year) const;

    // Zero below age 65. The caller passes MAGI from IRMAA_LOOKBACK_YEARS earlier.
    IrmaaResult irmaa_surcharge(double magi, FilingStatus status, int year, int age) const;

    double taxable_social_security(double benefit, double other_income, FilingStatus status) const;
    static SocialSecurityThresholds social_security_thresholds(FilingStatus status);

    double standard_deduction(FilingStatus status, int year, int seniors) const;

    double state_tax(const std::string& state, const HouseholdIncome& income,
                     double taxable_social_security) const;

    // Federal ordinary, capital gains with NIIT, and state tax for one year
    TaxBreakdown household_tax(const HouseholdIncome& income, FilingStatus status, int year,
                               int seniors, const std::string& state) const;

private:
    int first_year_;
    std::vector<TaxYearConfig> years_;
    StateTaxTable states_;
};

} // namespace retirecalc

#endif // RETIRECALC_TAX_ENGINE_HPP
