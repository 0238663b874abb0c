#include "tax_tables.hpp"
#include "io/csv_reader.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

namespace retirecalc {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// State codes are stored upper case
std::string state_code(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // anonymous namespace

// ============================================================================
// FilingStatus
// ============================================================================

std::string filing_status_to_string(FilingStatus status) {
    switch (status) {
        case FilingStatus::Single: return "single";
        case FilingStatus::MarriedJoint: return "married_joint";
        case FilingStatus::HeadOfHousehold: return "head_of_household";
        default: return "unknown";
    }
}

FilingStatus filing_status_from_string(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "single") return FilingStatus::Single;
    if (v == "married_joint" || v == "married" || v == "mfj") return FilingStatus::MarriedJoint;
    if (v == "head_of_household" || v == "hoh") return FilingStatus::HeadOfHousehold;
    throw std::invalid_argument("Unknown filing status: " + value);
}

namespace {

double round_to(double value, double granularity) {
    if (std::isinf(value)) {
        return value;
    }
    return std::round(value / granularity) * granularity;
}

std::vector<Bracket> make_brackets(const std::vector<double>& upper_bounds,
                                   const std::vector<double>& rates) {
    std::vector<Bracket> brackets;
    double lower = 0.0;
    for (size_t i = 0; i < rates.size(); ++i) {
        double upper = i < upper_bounds.size() ? upper_bounds[i] : UNBOUNDED;
        brackets.push_back({lower, upper, rates[i]});
        lower = upper;
    }
    return brackets;
}

std::vector<IrmaaTier> make_irmaa(const std::vector<double>& thresholds) {
    // 2024 monthly premiums per tier
    static const double part_b[] = {174.70, 244.60, 349.40, 454.20, 559.00, 594.00};
    static const double part_d[] = {0.0, 12.90, 33.30, 53.80, 74.20, 81.00};

    std::vector<IrmaaTier> tiers;
    double lower = 0.0;
    for (size_t i = 0; i < 6; ++i) {
        double upper = i < thresholds.size() ? thresholds[i] : UNBOUNDED;
        tiers.push_back({lower, upper, part_b[i], part_d[i]});
        lower = upper;
    }
    return tiers;
}

std::vector<Bracket> parse_brackets(const json& j, const std::string& field) {
    std::vector<Bracket> brackets;
    for (const auto& b : j) {
        Bracket bracket;
        bracket.lower = b.at("lower").get<double>();
        bracket.upper = (b.contains("upper") && !b["upper"].is_null())
            ? b["upper"].get<double>() : UNBOUNDED;
        bracket.rate = b.at("rate").get<double>();
        if (bracket.upper <= bracket.lower || bracket.rate < 0.0 || bracket.rate >= 1.0) {
            throw std::runtime_error("Invalid bracket in " + field);
        }
        brackets.push_back(bracket);
    }
    return brackets;
}

std::vector<IrmaaTier> parse_irmaa(const json& j) {
    std::vector<IrmaaTier> tiers;
    for (const auto& t : j) {
        IrmaaTier tier;
        tier.lower = t.at("lower").get<double>();
        tier.upper = (t.contains("upper") && !t["upper"].is_null())
            ? t["upper"].get<double>() : UNBOUNDED;
        tier.part_b_premium = t.at("part_b").get<double>();
        tier.part_d_addon = t.value("part_d", 0.0);
        tiers.push_back(tier);
    }
    return tiers;
}

} // anonymous namespace

// ============================================================================
// FilingTables / TaxYearConfig
// ============================================================================

FilingTables::FilingTables()
    : standard_deduction(0.0), senior_deduction(0.0), niit_threshold(0.0) {}

TaxYearConfig::TaxYearConfig()
    : year(0), part_b_base_premium(0.0), niit_rate(0.038) {}

const FilingTables& TaxYearConfig::for_status(FilingStatus status) const {
    auto it = tables.find(status);
    if (it == tables.end()) {
        throw std::out_of_range("No tax tables for filing status " +
                                filing_status_to_string(status) + " in " + std::to_string(year));
    }
    return it->second;
}

TaxYearConfig TaxYearConfig::extrapolate_to(int target_year, double inflation_rate) const {
    if (inflation_rate <= -1.0) {
        throw std::invalid_argument("Inflation rate must be greater than -100%");
    }

    TaxYearConfig result = *this;
    result.year = target_year;
    if (target_year == year) {
        return result;
    }

    double factor = std::pow(1.0 + inflation_rate, target_year - year);
    result.part_b_base_premium = round_to(part_b_base_premium * factor, 0.01);

    for (auto& [status, t] : result.tables) {
        for (auto& b : t.ordinary) {
            b.lower = round_to(b.lower * factor, 50.0);
            b.upper = round_to(b.upper * factor, 50.0);
        }
        for (auto& b : t.capital_gains) {
            b.lower = round_to(b.lower * factor, 50.0);
            b.upper = round_to(b.upper * factor, 50.0);
        }
        for (auto& tier : t.irmaa) {
            tier.lower = round_to(tier.lower * factor, 50.0);
            tier.upper = round_to(tier.upper * factor, 50.0);
            tier.part_b_premium = round_to(tier.part_b_premium * factor, 0.01);
            tier.part_d_addon = round_to(tier.part_d_addon * factor, 0.01);
        }
        t.standard_deduction = round_to(t.standard_deduction * factor, 50.0);
        t.senior_deduction = round_to(t.senior_deduction * factor, 50.0);
    }
    return result;
}

TaxYearConfig TaxYearConfig::builtin_2024() {
    TaxYearConfig config;
    config.year = 2024;
    config.part_b_base_premium = 174.70;
    config.niit_rate = 0.038;

    const std::vector<double> ordinary_rates = {0.10, 0.12, 0.22, 0.24, 0.32, 0.35, 0.37};
    const std::vector<double> gains_rates = {0.0, 0.15, 0.20};

    FilingTables single;
    single.ordinary = make_brackets({11600, 47150, 100525, 191950, 243725, 609350}, ordinary_rates);
    single.capital_gains = make_brackets({47025, 518900}, gains_rates);
    single.irmaa = make_irmaa({103000, 129000, 161000, 193000, 500000});
    single.standard_deduction = 14600;
    single.senior_deduction = 1950;
    single.niit_threshold = 200000;

    FilingTables married;
    married.ordinary = make_brackets({23200, 94300, 201050, 383900, 487450, 731200}, ordinary_rates);
    married.capital_gains = make_brackets({94050, 583750}, gains_rates);
    married.irmaa = make_irmaa({206000, 258000, 322000, 386000, 750000});
    married.standard_deduction = 29200;
    married.senior_deduction = 1550;
    married.niit_threshold = 250000;

    FilingTables head;
    head.ordinary = make_brackets({16550, 63100, 100500, 191950, 243700, 609350}, ordinary_rates);
    head.capital_gains = make_brackets({63000, 551350}, gains_rates);
    head.irmaa = single.irmaa;  // Medicare uses the individual table
    head.standard_deduction = 21900;
    head.senior_deduction = 1950;
    head.niit_threshold = 200000;

    config.tables[FilingStatus::Single] = single;
    config.tables[FilingStatus::MarriedJoint] = married;
    config.tables[FilingStatus::HeadOfHousehold] = head;
    return config;
}

TaxYearConfig TaxYearConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_json(file);
}

TaxYearConfig TaxYearConfig::load_from_json(std::istream& is) {
    TaxYearConfig config;
    try {
        json j = json::parse(is);

        if (!j.contains("year")) {
            throw std::runtime_error("Tax table missing required field: year");
        }
        config.year = j["year"].get<int>();
        config.part_b_base_premium = j.value("part_b_base_premium", 0.0);
        config.niit_rate = j.value("niit_rate", 0.038);

        if (!j.contains("filing_status")) {
            throw std::runtime_error("Tax table missing required field: filing_status");
        }
        for (auto it = j["filing_status"].begin(); it != j["filing_status"].end(); ++it) {
            FilingStatus status = filing_status_from_string(it.key());
            const json& s = it.value();

            FilingTables t;
            t.standard_deduction = s.value("standard_deduction", 0.0);
            t.senior_deduction = s.value("senior_deduction", 0.0);
            t.niit_threshold = s.value("niit_threshold", UNBOUNDED);
            if (s.contains("ordinary")) {
                t.ordinary = parse_brackets(s["ordinary"], it.key() + ".ordinary");
            }
            if (s.contains("capital_gains")) {
                t.capital_gains = parse_brackets(s["capital_gains"], it.key() + ".capital_gains");
            }
            if (s.contains("irmaa")) {
                t.irmaa = parse_irmaa(s["irmaa"]);
            }
            if (t.ordinary.empty()) {
                throw std::runtime_error("Tax table has no ordinary brackets for " + it.key());
            }
            config.tables[status] = t;
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse tax table JSON: ") + e.what());
    }
    return config;
}

// ============================================================================
// InflationIndexedProvider
// ============================================================================

InflationIndexedProvider::InflationIndexedProvider(double inflation_rate)
    : inflation_rate_(inflation_rate) {
    add_year(TaxYearConfig::builtin_2024());
}

InflationIndexedProvider::InflationIndexedProvider(const TaxYearConfig& base, double inflation_rate)
    : inflation_rate_(inflation_rate) {
    add_year(base);
}

void InflationIndexedProvider::add_year(const TaxYearConfig& config) {
    known_years_[config.year] = config;
}

bool InflationIndexedProvider::has_year(int year) const {
    return known_years_.count(year) > 0;
}

TaxYearConfig InflationIndexedProvider::config_for_year(int year) const {
    if (known_years_.empty()) {
        throw std::out_of_range("No tax years configured");
    }
    auto exact = known_years_.find(year);
    if (exact != known_years_.end()) {
        return exact->second;
    }

    // Latest known year not after the target, else the earliest known year
    auto it = known_years_.upper_bound(year);
    const TaxYearConfig& base = (it == known_years_.begin()) ? it->second : std::prev(it)->second;
    return base.extrapolate_to(year, inflation_rate_);
}

// ============================================================================
// StateTaxTable
// ============================================================================

StateTaxRule::StateTaxRule()
    : rate(StateTaxTable::DEFAULT_RATE), taxes_social_security(false), retirement_exemption(0.0) {}

StateTaxRule::StateTaxRule(double r, bool taxes_ss, double exemption)
    : rate(r), taxes_social_security(taxes_ss), retirement_exemption(exemption) {}

StateTaxTable::StateTaxTable() = default;

void StateTaxTable::set_rule(const std::string& state, const StateTaxRule& rule) {
    if (rule.rate < 0.0 || rule.rate >= 1.0) {
        throw std::invalid_argument("State tax rate must be in [0, 1): " + state);
    }
    std::string code = state_code(state);
    rules_[code] = rule;
}

const StateTaxRule& StateTaxTable::rule(const std::string& state) const {
    std::string code = state_code(state);
    auto it = rules_.find(code);
    return it != rules_.end() ? it->second : default_rule_;
}

bool StateTaxTable::has_state(const std::string& state) const {
    std::string code = state_code(state);
    return rules_.count(code) > 0;
}

StateTaxTable StateTaxTable::builtin() {
    StateTaxTable table;

    // No broad income tax
    for (const char* code : {"AK", "FL", "NV", "NH", "SD", "TN", "TX", "WA", "WY"}) {
        table.set_rule(code, StateTaxRule(0.0, false, 0.0));
    }

    // Flat effective rates
    table.set_rule("CA", StateTaxRule(0.0600, false, 0.0));
    table.set_rule("NY", StateTaxRule(0.0585, false, 20000.0));
    table.set_rule("PA", StateTaxRule(0.0307, false, UNBOUNDED));
    table.set_rule("IL", StateTaxRule(0.0495, false, UNBOUNDED));
    table.set_rule("NC", StateTaxRule(0.0475, false, 0.0));
    table.set_rule("GA", StateTaxRule(0.0539, false, 65000.0));
    table.set_rule("MA", StateTaxRule(0.0500, false, 0.0));
    table.set_rule("CO", StateTaxRule(0.0440, true, 24000.0));
    table.set_rule("AZ", StateTaxRule(0.0250, false, 0.0));
    table.set_rule("VA", StateTaxRule(0.0575, false, 12000.0));
    table.set_rule("UT", StateTaxRule(0.0465, true, 0.0));
    table.set_rule("MN", StateTaxRule(0.0680, true, 0.0));

    return table;
}

StateTaxTable StateTaxTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

StateTaxTable StateTaxTable::load_from_csv(std::istream& is) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        throw std::runtime_error("Empty CSV file");
    }
    if (header.size() < 4) {
        throw std::runtime_error("State tax CSV needs columns state,rate,taxes_social_security,retirement_exemption");
    }

    StateTaxTable table;
    while (reader.has_more()) {
        auto row = reader.read_row();
        size_t line = reader.line_number();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;
        if (row.size() < 4) {
            throw std::runtime_error("State tax CSV line " + std::to_string(line) + " has too few columns");
        }

        std::string flag = to_lower(row[2]);
        bool taxes_ss = (flag == "1" || flag == "true" || flag == "yes");

        try {
            table.set_rule(row[0], StateTaxRule(std::stod(row[1]), taxes_ss, std::stod(row[3])));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("State tax CSV line " + std::to_string(line) + ": " + e.what());
        }
    }
    return table;
}

} // namespace retirecalc
