#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "tax_engine.hpp"

using namespace retirecalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

const TaxEngine& engine() {
    static const TaxEngine instance;
    return instance;
}

HouseholdIncome distributions_only(double amount) {
    HouseholdIncome income;
    income.distributions = amount;
    return income;
}

} // anonymous namespace

// ============================================================================
// Federal ordinary tax
// ============================================================================

TEST_CASE("Federal tax walks the 2024 single brackets", "[tax_engine]") {
    // 10% of 11,600 + 12% of 35,550 + 22% of 2,850
    REQUIRE_THAT(engine().federal_tax(50000.0, FilingStatus::Single, 2024), WithinAbs(6053.0, 1e-6));
}

TEST_CASE("Federal tax walks the 2024 married brackets", "[tax_engine]") {
    REQUIRE_THAT(engine().federal_tax(100000.0, FilingStatus::MarriedJoint, 2024), WithinAbs(12106.0, 1e-6));
}

TEST_CASE("Federal tax is exact at a bracket boundary", "[tax_engine][edge-case]") {
    REQUIRE_THAT(engine().federal_tax(11600.0, FilingStatus::Single, 2024), WithinAbs(1160.0, 1e-9));
    REQUIRE_THAT(engine().federal_tax(47150.0, FilingStatus::Single, 2024), WithinAbs(5426.0, 1e-9));
}

TEST_CASE("Federal tax on zero or negative income is zero", "[tax_engine][edge-case]") {
    REQUIRE(engine().federal_tax(0.0, FilingStatus::Single, 2024) == 0.0);
    REQUIRE(engine().federal_tax(-5000.0, FilingStatus::Single, 2024) == 0.0);
}

TEST_CASE("Federal tax is monotone and its marginal rate never exceeds the top rate", "[tax_engine]") {
    double previous = 0.0;
    for (double income = 0.0; income <= 1000000.0; income += 5000.0) {
        double tax = engine().federal_tax(income, FilingStatus::Single, 2024);
        REQUIRE(tax >= previous);
        REQUIRE(tax - previous <= 5000.0 * 0.37 + 1e-9);
        previous = tax;
    }
}

TEST_CASE("Tax plus after-tax income reconstructs gross income", "[tax_engine][property]") {
    for (double gross : {0.0, 1.0, 12345.67, 47150.0, 98765.43, 250000.01, 1234567.89}) {
        for (FilingStatus status : {FilingStatus::Single, FilingStatus::MarriedJoint,
                                    FilingStatus::HeadOfHousehold}) {
            double tax = engine().federal_tax(gross, status, 2024);
            double net = gross - tax;
            REQUIRE(std::fabs((tax + net) - gross) < 0.01);
            REQUIRE(net >= 0.0);
        }
    }
}

TEST_CASE("Years outside the cache are rejected", "[tax_engine][edge-case]") {
    REQUIRE_THROWS_AS(engine().year_config(1999), std::out_of_range);
    REQUIRE_THROWS_AS(engine().year_config(2201), std::out_of_range);
    REQUIRE(engine().year_config(2024).year == 2024);
    REQUIRE(engine().first_year() == TaxEngine::DEFAULT_FIRST_YEAR);
    REQUIRE(engine().last_year() == TaxEngine::DEFAULT_LAST_YEAR);
}

TEST_CASE("Later years index brackets upward", "[tax_engine]") {
    double tax_2024 = engine().federal_tax(80000.0, FilingStatus::Single, 2024);
    double tax_2040 = engine().federal_tax(80000.0, FilingStatus::Single, 2040);
    REQUIRE(tax_2040 < tax_2024);
}

TEST_CASE("Empty tax year range is rejected", "[tax_engine][edge-case]") {
    InflationIndexedProvider provider;
    REQUIRE_THROWS_AS(TaxEngine(provider, StateTaxTable::builtin(), 2030, 2029), std::invalid_argument);
}

// ============================================================================
// Capital gains and NIIT
// ============================================================================

TEST_CASE("Capital gains stack on top of ordinary income", "[tax_engine][capital-gains]") {
    // 7,025 fill the 0% band, the remaining 12,975 pay 15%
    double tax = engine().capital_gains_tax(20000.0, 40000.0, FilingStatus::Single, 2024);
    REQUIRE_THAT(tax, WithinAbs(1946.25, 1e-6));
}

TEST_CASE("Capital gains inside the 0% band are untaxed", "[tax_engine][capital-gains]") {
    REQUIRE(engine().capital_gains_tax(30000.0, 10000.0, FilingStatus::Single, 2024) == 0.0);
    REQUIRE(engine().capital_gains_tax(-100.0, 10000.0, FilingStatus::Single, 2024) == 0.0);
}

TEST_CASE("Capital gains above the top threshold pay 20%", "[tax_engine][capital-gains]") {
    double tax = engine().capital_gains_tax(100000.0, 600000.0, FilingStatus::Single, 2024);
    REQUIRE_THAT(tax, WithinAbs(20000.0, 1e-6));
}

TEST_CASE("NIIT applies to the lesser of gains and the MAGI excess", "[tax_engine][niit]") {
    REQUIRE_THAT(engine().net_investment_income_tax(100000.0, 250000.0, FilingStatus::Single, 2024),
                 WithinAbs(1900.0, 1e-9));
    REQUIRE_THAT(engine().net_investment_income_tax(10000.0, 250000.0, FilingStatus::Single, 2024),
                 WithinAbs(380.0, 1e-9));
    REQUIRE(engine().net_investment_income_tax(100000.0, 250000.0, FilingStatus::MarriedJoint, 2024) == 0.0);
}

TEST_CASE("NIIT threshold is not indexed", "[tax_engine][niit]") {
    REQUIRE_THAT(engine().net_investment_income_tax(50000.0, 210000.0, FilingStatus::Single, 2060),
                 WithinAbs(380.0, 1e-9));
}

// ============================================================================
// IRMAA
// ============================================================================

TEST_CASE("IRMAA surcharge uses the tier the MAGI reaches", "[tax_engine][irmaa]") {
    IrmaaResult result = engine().irmaa_surcharge(150000.0, FilingStatus::Single, 2024, 66);
    REQUIRE_THAT(result.part_b, WithinAbs((349.40 - 174.70) * 12.0, 1e-6));
    REQUIRE_THAT(result.part_d, WithinAbs(33.30 * 12.0, 1e-6));
    REQUIRE_THAT(result.total(), WithinAbs(2496.0, 1e-6));
}

TEST_CASE("IRMAA is zero in the base tier and at its upper bound", "[tax_engine][irmaa][edge-case]") {
    REQUIRE(engine().irmaa_surcharge(50000.0, FilingStatus::Single, 2024, 70).total() == 0.0);
    REQUIRE(engine().irmaa_surcharge(103000.0, FilingStatus::Single, 2024, 70).total() == 0.0);
    REQUIRE(engine().irmaa_surcharge(103000.01, FilingStatus::Single, 2024, 70).total() > 0.0);
}

TEST_CASE("IRMAA is zero before Medicare age", "[tax_engine][irmaa][edge-case]") {
    REQUIRE(engine().irmaa_surcharge(1000000.0, FilingStatus::Single, 2024, 64).total() == 0.0);
    REQUIRE(engine().irmaa_surcharge(1000000.0, FilingStatus::Single, 2024, 65).total() > 0.0);
}

TEST_CASE("IRMAA married thresholds are roughly double the single ones", "[tax_engine][irmaa]") {
    REQUIRE(engine().irmaa_surcharge(150000.0, FilingStatus::MarriedJoint, 2024, 70).total() == 0.0);
    REQUIRE(engine().irmaa_surcharge(300000.0, FilingStatus::MarriedJoint, 2024, 70).total() > 0.0);
}

// ============================================================================
// Social Security taxation
// ============================================================================

TEST_CASE("Social Security is untaxed below the base threshold", "[tax_engine][social-security]") {
    REQUIRE(engine().taxable_social_security(30000.0, 10000.0, FilingStatus::Single) == 0.0);
    REQUIRE(engine().taxable_social_security(0.0, 500000.0, FilingStatus::Single) == 0.0);
}

TEST_CASE("Social Security 50% tier", "[tax_engine][social-security]") {
    // Provisional income 40,000 sits between 32,000 and 44,000
    REQUIRE_THAT(engine().taxable_social_security(40000.0, 20000.0, FilingStatus::MarriedJoint),
                 WithinAbs(4000.0, 1e-9));
}

TEST_CASE("Social Security 85% tier", "[tax_engine][social-security]") {
    // Provisional 35,000: 4,500 from the middle tier plus 85% of 1,000
    REQUIRE_THAT(engine().taxable_social_security(30000.0, 20000.0, FilingStatus::Single),
                 WithinAbs(5350.0, 1e-9));
}

TEST_CASE("Taxable Social Security never exceeds 85% of benefits", "[tax_engine][social-security]") {
    double benefit = 40000.0;
    double taxable = engine().taxable_social_security(benefit, 1000000.0, FilingStatus::Single);
    REQUIRE_THAT(taxable, WithinAbs(0.85 * benefit, 1e-9));
}

TEST_CASE("Thresholds differ for married filers", "[tax_engine][social-security]") {
    SocialSecurityThresholds single = TaxEngine::social_security_thresholds(FilingStatus::Single);
    SocialSecurityThresholds married = TaxEngine::social_security_thresholds(FilingStatus::MarriedJoint);
    SocialSecurityThresholds head = TaxEngine::social_security_thresholds(FilingStatus::HeadOfHousehold);
    REQUIRE(single.base == 25000.0);
    REQUIRE(single.adjusted == 34000.0);
    REQUIRE(married.base == 32000.0);
    REQUIRE(married.adjusted == 44000.0);
    REQUIRE(head.base == single.base);
}

// ============================================================================
// Deductions and state tax
// ============================================================================

TEST_CASE("Standard deduction adds the senior amount per person", "[tax_engine][deduction]") {
    REQUIRE(engine().standard_deduction(FilingStatus::Single, 2024, 0) == 14600.0);
    REQUIRE(engine().standard_deduction(FilingStatus::Single, 2024, 1) == 16550.0);
    REQUIRE(engine().standard_deduction(FilingStatus::MarriedJoint, 2024, 2) == 32300.0);
    REQUIRE(engine().standard_deduction(FilingStatus::MarriedJoint, 2024, -1) == 29200.0);
}

TEST_CASE("State tax applies the flat rate to taxable income", "[tax_engine][state]") {
    HouseholdIncome income;
    income.earned = 100000.0;
    REQUIRE_THAT(engine().state_tax("CA", income, 0.0), WithinAbs(6000.0, 1e-9));
    REQUIRE(engine().state_tax("TX", income, 0.0) == 0.0);
}

TEST_CASE("State retirement exemptions shelter pension and IRA income", "[tax_engine][state]") {
    HouseholdIncome income = distributions_only(30000.0);
    REQUIRE(engine().state_tax("PA", income, 0.0) == 0.0);
    REQUIRE_THAT(engine().state_tax("NY", income, 0.0), WithinAbs(10000.0 * 0.0585, 1e-9));
}

TEST_CASE("Only some states tax Social Security", "[tax_engine][state]") {
    HouseholdIncome income;
    income.social_security = 30000.0;
    REQUIRE(engine().state_tax("CA", income, 20000.0) == 0.0);
    REQUIRE_THAT(engine().state_tax("CO", income, 20000.0), WithinAbs(880.0, 1e-9));
}

// ============================================================================
// Household tax
// ============================================================================

TEST_CASE("Household tax deducts before walking the brackets", "[tax_engine][household]") {
    TaxBreakdown tax = engine().household_tax(distributions_only(60000.0), FilingStatus::Single, 2024, 0, "TX");

    REQUIRE_THAT(tax.agi, WithinAbs(60000.0, 1e-9));
    REQUIRE_THAT(tax.ordinary_taxable_income, WithinAbs(45400.0, 1e-9));
    REQUIRE_THAT(tax.federal_ordinary, WithinAbs(5216.0, 1e-6));
    REQUIRE(tax.capital_gains == 0.0);
    REQUIRE(tax.state == 0.0);
    REQUIRE_THAT(tax.total(), WithinAbs(5216.0, 1e-6));
}

TEST_CASE("Unused deduction offsets capital gains", "[tax_engine][household]") {
    HouseholdIncome income;
    income.distributions = 10000.0;
    income.capital_gains = 100000.0;

    TaxBreakdown tax = engine().household_tax(income, FilingStatus::Single, 2024, 0, "TX");

    // Taxable total 95,400, all of it above ordinary income of zero is gains
    REQUIRE(tax.ordinary_taxable_income == 0.0);
    REQUIRE(tax.federal_ordinary == 0.0);
    REQUIRE_THAT(tax.capital_gains, WithinAbs((95400.0 - 47025.0) * 0.15, 1e-6));
    REQUIRE(tax.niit == 0.0);
}

TEST_CASE("Household tax includes taxable Social Security in AGI", "[tax_engine][household]") {
    HouseholdIncome income;
    income.pension = 20000.0;
    income.social_security = 30000.0;

    TaxBreakdown tax = engine().household_tax(income, FilingStatus::Single, 2024, 1, "TX");

    REQUIRE_THAT(tax.taxable_social_security, WithinAbs(5350.0, 1e-9));
    REQUIRE_THAT(tax.agi, WithinAbs(25350.0, 1e-9));
    REQUIRE_THAT(tax.ordinary_taxable_income, WithinAbs(25350.0 - 16550.0, 1e-9));
}

TEST_CASE("Household tax adds state tax to federal", "[tax_engine][household]") {
    HouseholdIncome income;
    income.earned = 100000.0;
    TaxBreakdown tax = engine().household_tax(income, FilingStatus::Single, 2024, 0, "CA");
    REQUIRE_THAT(tax.state, WithinAbs(6000.0, 1e-9));
    REQUIRE_THAT(tax.total(), WithinAbs(tax.federal() + 6000.0, 1e-9));
}
