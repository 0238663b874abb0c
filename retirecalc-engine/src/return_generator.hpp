#ifndef RETIRECALC_RETURN_GENERATOR_HPP
#define RETIRECALC_RETURN_GENERATOR_HPP

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace retirecalc {

enum class ReturnDistribution : uint8_t {
    Normal = 0,
    StudentT = 1
};

enum class MarketRegime : uint8_t {
    Bull = 0,
    Normal = 1,
    Bear = 2,
    Crisis = 3
};

constexpr size_t NUM_REGIMES = 4;
constexpr size_t NUM_ASSET_CLASSES = 3;

std::string return_distribution_to_string(ReturnDistribution distribution);
ReturnDistribution return_distribution_from_string(const std::string& value);
std::string market_regime_to_string(MarketRegime regime);

// AAGR = CAGR + volatility^2 / 2
inline double cagr_to_aagr(double cagr, double volatility) { return cagr + volatility * volatility / 2.0; }
inline double aagr_to_cagr(double aagr, double volatility) { return aagr - volatility * volatility / 2.0; }

// Standard normal CDF and its inverse (Beasley-Springer-Moro)
double normal_cdf(double x);
double inverse_normal_cdf(double p);

// splitmix64 finalizer over (base, salt): independent stream seeds
uint64_t mix_seed(uint64_t base, uint64_t salt);

struct AssetClassAssumption {
    double cagr;
    double volatility;
};

// Capital market assumptions for one scenario
struct ReturnModel {
    AssetClassAssumption stocks;
    AssetClassAssumption bonds;
    AssetClassAssumption cash;
    double stock_allocation;
    double bond_allocation;
    double cash_allocation;
    double corr_stock_bond;
    double corr_stock_cash;
    double corr_bond_cash;
    double return_floor;      // No asset or portfolio return below this

    ReturnModel();

    // Throws std::invalid_argument for negative volatility, allocations that do
    // not sum to 1, or a correlation matrix that is not positive definite
    void validate() const;
};

// Sampling options for one scenario's return path
struct ScenarioOptions {
    static constexpr double DEFAULT_DEGREES_OF_FREEDOM = 5.0;

    ReturnDistribution distribution;
    double degrees_of_freedom;
    bool regime_switching;
    bool antithetic;            // Mirror every Gaussian shock
    bool include_ltc;
    bool stochastic_mortality;  // Draw each lifespan instead of using life_expectancy
    uint32_t strata;            // 0 or 1 disables stratification
    uint32_t stratum;           // Block position of this scenario, in [0, strata)
    uint64_t stratification_seed;

    ScenarioOptions();
};

struct YearReturns {
    int year_index;
    double stocks;
    double bonds;
    double cash;
    double portfolio;       // Allocation-weighted blend
    double stock_shock;     // Standardized equity shock: mean 0, unit variance
    MarketRegime regime;
};

// ReturnGenerator: lazy, restartable stream of correlated annual returns.
// The path is a pure function of (model, options, seed); reset() replays it.
class ReturnGenerator {
public:
    ReturnGenerator(const ReturnModel& model, const ScenarioOptions& options, uint64_t seed);

    YearReturns next();
    void reset();

    int years_generated() const { return year_; }
    MarketRegime regime() const { return regime_; }

private:
    struct RegimeParams {
        double mean;
        double volatility;
        double stock_return_mult;
        double stock_vol_mult;
        double bond_return_mult;
        double bond_vol_mult;
        double cash_vol_mult;
    };

    static const std::array<RegimeParams, NUM_REGIMES> REGIMES;
    static const std::array<std::array<double, NUM_REGIMES>, NUM_REGIMES> TRANSITIONS;
    static const std::array<double, NUM_REGIMES> INITIAL_PROBABILITIES;

    ReturnModel model_;
    ScenarioOptions options_;
    uint64_t seed_;
    std::array<std::array<double, NUM_ASSET_CLASSES>, NUM_ASSET_CLASSES> cholesky_;

    std::mt19937_64 rng_;
    std::normal_distribution<double> normal_;
    std::uniform_real_distribution<double> uniform_;
    int year_;
    MarketRegime regime_;

    MarketRegime draw_regime(const std::array<double, NUM_REGIMES>& probabilities);
    double stratified_shock();
    double fat_tail_scale();
};

} // namespace retirecalc

#endif // RETIRECALC_RETURN_GENERATOR_HPP
