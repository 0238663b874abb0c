#include "mortality.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace retirecalc {

namespace {

constexpr int SSA_FIRST_AGE = 50;

// qx for ages 50-120: { male, female }
const double SSA_2021_QX[][2] = {
    {0.004186, 0.002634}, {0.004530, 0.002838}, {0.004912, 0.003071}, {0.005346, 0.003344},
    {0.005838, 0.003658}, {0.006390, 0.004005}, {0.006993, 0.004379}, {0.007646, 0.004780},
    {0.008359, 0.005217}, {0.009147, 0.005710}, {0.010028, 0.006283}, {0.010998, 0.006920},
    {0.012047, 0.007610}, {0.013168, 0.008351}, {0.014366, 0.009154}, {0.015651, 0.010035},
    {0.017030, 0.010998}, {0.018506, 0.012049}, {0.020088, 0.013201}, {0.021791, 0.014477},
    {0.023640, 0.015901}, {0.025660, 0.017483}, {0.027872, 0.019230}, {0.030275, 0.021139},
    {0.032884, 0.023216}, {0.035746, 0.025490}, {0.038921, 0.027998}, {0.042465, 0.030774},
    {0.046414, 0.033834}, {0.050799, 0.037189}, {0.055651, 0.040853}, {0.061000, 0.044842},
    {0.066875, 0.049174}, {0.073305, 0.053870}, {0.080319, 0.058954}, {0.087945, 0.064449},
    {0.096211, 0.070379}, {0.105145, 0.076770}, {0.114772, 0.083647}, {0.125116, 0.091037},
    {0.136200, 0.098966}, {0.148046, 0.107461}, {0.160674, 0.116549}, {0.174102, 0.126257},
    {0.188348, 0.136613}, {0.203426, 0.147644}, {0.219352, 0.159378}, {0.236136, 0.171842},
    {0.253789, 0.185064}, {0.272320, 0.199071}, {0.291735, 0.213890}, {0.312043, 0.229548},
    {0.333249, 0.246073}, {0.355359, 0.263492}, {0.378378, 0.281832}, {0.402310, 0.301122},
    {0.427159, 0.321389}, {0.452928, 0.342661}, {0.479619, 0.364966}, {0.507236, 0.388332},
    {0.535782, 0.412788}, {0.565256, 0.438361}, {0.595662, 0.465082}, {0.627001, 0.492978},
    {0.659274, 0.522080}, {0.692482, 0.552418}, {0.726625, 0.584022}, {0.761705, 0.616923},
    {0.797720, 0.651152}, {0.834672, 0.686741}, {1.000000, 1.000000},
};

MortalityTable build_ssa_table() {
    MortalityTable table;
    for (int age = 0; age <= MortalityTable::MAX_AGE; ++age) {
        const double* row = SSA_2021_QX[std::max(age, SSA_FIRST_AGE) - SSA_FIRST_AGE];
        table.set_qx(age, Gender::Male, row[0]);
        table.set_qx(age, Gender::Female, row[1]);
    }
    return table;
}

void check_age(int age) {
    if (age < 0 || age > MortalityTable::MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " outside 0-" +
                                std::to_string(MortalityTable::MAX_AGE));
    }
}

} // anonymous namespace

// ============================================================================
// MortalityTable Implementation
// ============================================================================

MortalityTable::MortalityTable() {
    for (auto& gender_rates : rates_) {
        gender_rates.fill(0.0);
    }
}

void MortalityTable::set_qx(int age, Gender gender, double qx) {
    check_age(age);
    if (qx < 0.0 || qx > 1.0) {
        throw std::invalid_argument("qx must be between 0.0 and 1.0");
    }
    rates_[static_cast<size_t>(gender)][static_cast<size_t>(age)] = qx;
}

double MortalityTable::get_qx(int age, Gender gender) const {
    check_age(age);
    return rates_[static_cast<size_t>(gender)][static_cast<size_t>(age)];
}

double MortalityTable::get_qx(int age, Gender gender, double multiplier) const {
    return std::min(get_qx(age, gender) * multiplier, 1.0);
}

const MortalityTable& MortalityTable::ssa_period() {
    static const MortalityTable table = build_ssa_table();
    return table;
}

double MortalityTable::health_multiplier(HealthStatus health) {
    switch (health) {
        case HealthStatus::Excellent: return 0.7;
        case HealthStatus::Good: return 1.0;
        case HealthStatus::Fair: return 1.5;
        case HealthStatus::Poor: return 2.2;
    }
    return 1.0;
}

// ============================================================================
// Lifespan Draw
// ============================================================================

double draw_death_age(const MortalityTable& table, int current_age, Gender gender,
                      HealthStatus health, std::mt19937_64& rng) {
    check_age(current_age);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    double multiplier = MortalityTable::health_multiplier(health);

    int age = current_age;
    for (; age < MortalityTable::MAX_AGE; ++age) {
        if (uniform(rng) < table.get_qx(age, gender, multiplier)) {
            break;
        }
    }
    return age + 0.5;
}

} // namespace retirecalc
