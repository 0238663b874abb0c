#ifndef RETIRECALC_TAX_TABLES_HPP
#define RETIRECALC_TAX_TABLES_HPP

#include <algorithm>
#include <cstdint>
#include <istream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace retirecalc {

enum class FilingStatus : uint8_t {
    Single = 0,
    MarriedJoint = 1,
    HeadOfHousehold = 2
};

std::string filing_status_to_string(FilingStatus status);
FilingStatus filing_status_from_string(const std::string& value);

// Open-ended upper bound for the top bracket of a table
constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

// One rate band: income in [lower, upper) is taxed at rate
struct Bracket {
    double lower;
    double upper;
    double rate;
};

// One IRMAA tier: MAGI above lower (and at or below upper) pays these monthly premiums
struct IrmaaTier {
    double lower;
    double upper;
    double part_b_premium;   // Total monthly Part B premium in this tier
    double part_d_addon;     // Monthly Part D income-related add-on
};

// Stacked-bracket walk shared by every bracketed tax.
// Visits each tier overlapping [from, to) with the width of the overlap.
// Federal tax walks [0, income), capital gains walk [ordinary, ordinary + gains),
// IRMAA takes the last tier touched by [0, magi).
template <typename Tier, typename Visitor>
void walk_stacked_brackets(const std::vector<Tier>& tiers, double from, double to, Visitor visit) {
    if (!(to > from)) {
        return;
    }
    for (const Tier& tier : tiers) {
        double lo = std::max(from, tier.lower);
        double hi = std::min(to, tier.upper);
        if (hi > lo) {
            visit(tier, hi - lo);
        }
    }
}

// Tier reached by a value: the highest tier the walk from zero enters.
// Values at or below zero land in the first tier.
template <typename Tier>
const Tier& find_tier(const std::vector<Tier>& tiers, double value) {
    const Tier* found = tiers.empty() ? nullptr : &tiers.front();
    walk_stacked_brackets(tiers, 0.0, value, [&found](const Tier& tier, double) {
        found = &tier;
    });
    if (found == nullptr) {
        throw std::out_of_range("Tier table is empty");
    }
    return *found;
}

// Tables that vary by filing status
struct FilingTables {
    std::vector<Bracket> ordinary;
    std::vector<Bracket> capital_gains;
    std::vector<IrmaaTier> irmaa;
    double standard_deduction;
    double senior_deduction;      // Additional deduction per person aged 65+
    double niit_threshold;        // Statutory, not indexed

    FilingTables();
};

// TaxYearConfig: immutable tax constants for one calendar year
struct TaxYearConfig {
    int year;
    double part_b_base_premium;   // Standard monthly Part B premium
    double niit_rate;
    std::map<FilingStatus, FilingTables> tables;

    TaxYearConfig();

    // Throws std::out_of_range if the status has no tables
    const FilingTables& for_status(FilingStatus status) const;

    // Compound inflation onto every threshold, deduction and premium.
    // Thresholds and deductions round to the nearest $50.
    TaxYearConfig extrapolate_to(int target_year, double inflation_rate) const;

    // 2024 federal tables (IRS Rev. Proc. 2023-34, CMS 2024 premiums)
    static TaxYearConfig builtin_2024();

    // JSON format: {"year", "part_b_base_premium", "niit_rate",
    //   "filing_status": {"single": {"standard_deduction", "senior_deduction",
    //   "niit_threshold", "ordinary": [...], "capital_gains": [...], "irmaa": [...]}}}
    // A null or missing "upper" means the top bracket.
    static TaxYearConfig load_from_json(const std::string& filepath);
    static TaxYearConfig load_from_json(std::istream& is);
};

// Provider of TaxYearConfig per year (lookup only, never mutated by the engine)
class TaxTableProvider {
public:
    virtual ~TaxTableProvider() = default;

    virtual TaxYearConfig config_for_year(int year) const = 0;
};

// Provider holding a set of known years; other years are extrapolated
// from the nearest known year at a fixed annual inflation rate.
class InflationIndexedProvider : public TaxTableProvider {
public:
    static constexpr double DEFAULT_INFLATION_RATE = 0.025;

    explicit InflationIndexedProvider(double inflation_rate = DEFAULT_INFLATION_RATE);
    InflationIndexedProvider(const TaxYearConfig& base, double inflation_rate = DEFAULT_INFLATION_RATE);

    void add_year(const TaxYearConfig& config);
    bool has_year(int year) const;
    double inflation_rate() const { return inflation_rate_; }

    TaxYearConfig config_for_year(int year) const override;

private:
    double inflation_rate_;
    std::map<int, TaxYearConfig> known_years_;
};

// State income tax rule: a flat effective rate with retiree carve-outs
struct StateTaxRule {
    double rate;
    bool taxes_social_security;
    double retirement_exemption;   // Pension and IRA income excluded per return

    StateTaxRule();
    StateTaxRule(double r, bool taxes_ss, double exemption);
};

// StateTaxTable: rules keyed by two-letter state code
class StateTaxTable {
public:
    static constexpr double DEFAULT_RATE = 0.05;

    StateTaxTable();

    void set_rule(const std::string& state, const StateTaxRule& rule);
    // Unknown states fall back to the default rule
    const StateTaxRule& rule(const std::string& state) const;
    bool has_state(const std::string& state) const;
    size_t size() const { return rules_.size(); }

    void set_default_rule(const StateTaxRule& rule) { default_rule_ = rule; }
    const StateTaxRule& default_rule() const { return default_rule_; }

    static StateTaxTable builtin();

    // CSV columns: state,rate,taxes_social_security,retirement_exemption
    static StateTaxTable load_from_csv(const std::string& filepath);
    static StateTaxTable load_from_csv(std::istream& is);

private:
    std::map<std::string, StateTaxRule> rules_;
    StateTaxRule default_rule_;
};

} // namespace retirecalc

#endif // RETIRECALC_TAX_TABLES_HPP
