#include "return_generator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace retirecalc {

namespace {

using Matrix3 = std::array<std::array<double, NUM_ASSET_CLASSES>, NUM_ASSET_CLASSES>;

Matrix3 correlation_matrix(const ReturnModel& model) {
    Matrix3 c = {{
        {1.0, model.corr_stock_bond, model.corr_stock_cash},
        {model.corr_stock_bond, 1.0, model.corr_bond_cash},
        {model.corr_stock_cash, model.corr_bond_cash, 1.0}
    }};
    return c;
}

// Lower-triangular L with L * L^T = c
Matrix3 cholesky(const Matrix3& c) {
    Matrix3 l = {};
    for (size_t i = 0; i < NUM_ASSET_CLASSES; ++i) {
        for (size_t j = 0; j <= i; ++j) {
            double sum = c[i][j];
            for (size_t k = 0; k < j; ++k) {
                sum -= l[i][k] * l[j][k];
            }
            if (i == j) {
                if (sum <= 0.0) {
                    throw std::invalid_argument("Correlation matrix is not positive definite");
                }
                l[i][i] = std::sqrt(sum);
            } else {
                l[i][j] = sum / l[j][j];
            }
        }
    }
    return l;
}

} // anonymous namespace

std::string return_distribution_to_string(ReturnDistribution distribution) {
    switch (distribution) {
        case ReturnDistribution::Normal: return "normal";
        case ReturnDistribution::StudentT: return "student-t";
        default: return "unknown";
    }
}

ReturnDistribution return_distribution_from_string(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "normal") {
        return ReturnDistribution::Normal;
    }
    if (v == "student-t" || v == "student_t" || v == "studentt" || v == "t") {
        return ReturnDistribution::StudentT;
    }
    throw std::invalid_argument("Unknown return distribution: " + value);
}

std::string market_regime_to_string(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::Bull: return "bull";
        case MarketRegime::Normal: return "normal";
        case MarketRegime::Bear: return "bear";
        case MarketRegime::Crisis: return "crisis";
        default: return "unknown";
    }
}

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double inverse_normal_cdf(double p) {
    if (p <= 0.0 || p >= 1.0) {
        throw std::domain_error("inverse_normal_cdf requires p in (0, 1)");
    }
    static const double a[] = {2.50662823884, -18.61500062529, 41.39119773534, -25.44106049637};
    static const double b[] = {-8.47351093090, 23.08336743743, -21.06224101826, 3.13082909833};
    static const double c[] = {0.3374754822726147, 0.9761690190917186, 0.1607979714918209,
                               0.0276438810333863, 0.0038405729373609, 0.0003951896511919,
                               0.0000321767881768, 0.0000002888167364, 0.0000003960315187};

    double y = p - 0.5;
    if (std::abs(y) < 0.42) {
        double r = y * y;
        return y * (((a[3] * r + a[2]) * r + a[1]) * r + a[0]) /
               ((((b[3] * r + b[2]) * r + b[1]) * r + b[0]) * r + 1.0);
    }
    double r = y > 0.0 ? 1.0 - p : p;
    r = std::log(-std::log(r));
    double x = c[8];
    for (int i = 7; i >= 0; --i) {
        x = x * r + c[i];
    }
    return y > 0.0 ? x : -x;
}

uint64_t mix_seed(uint64_t base, uint64_t salt) {
    uint64_t z = base + 0x9E3779B97F4A7C15ULL * (salt + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

// ============================================================================
// ReturnModel / ScenarioOptions
// ============================================================================

ReturnModel::ReturnModel()
    : stocks{0.10, 0.18}, bonds{0.05, 0.05}, cash{0.02, 0.01},
      stock_allocation(0.60), bond_allocation(0.35), cash_allocation(0.05),
      corr_stock_bond(0.15), corr_stock_cash(0.0), corr_bond_cash(0.30),
      return_floor(-0.99) {}

void ReturnModel::validate() const {
    if (stocks.volatility < 0.0 || bonds.volatility < 0.0 || cash.volatility < 0.0) {
        throw std::invalid_argument("Volatility must be non-negative");
    }
    if (stock_allocation < 0.0 || bond_allocation < 0.0 || cash_allocation < 0.0) {
        throw std::invalid_argument("Allocations must be non-negative");
    }
    if (std::abs(stock_allocation + bond_allocation + cash_allocation - 1.0) > 1e-6) {
        throw std::invalid_argument("Allocations must sum to 1");
    }
    if (return_floor < -1.0 || return_floor >= 0.0) {
        throw std::invalid_argument("Return floor must be in [-1, 0)");
    }
    cholesky(correlation_matrix(*this));
}

ScenarioOptions::ScenarioOptions()
    : distribution(ReturnDistribution::StudentT),
      degrees_of_freedom(DEFAULT_DEGREES_OF_FREEDOM),
      regime_switching(false), antithetic(false), include_ltc(true),
      stochastic_mortality(false), strata(0), stratum(0), stratification_seed(0) {}

// ============================================================================
// ReturnGenerator Implementation
// ============================================================================

const std::array<ReturnGenerator::RegimeParams, NUM_REGIMES> ReturnGenerator::REGIMES = {{
    // mean, vol, stock ret/vol, bond ret/vol, cash vol
    { 0.14, 0.12, 1.2, 0.9, 0.8, 0.8, 1.0},   // bull
    { 0.07, 0.16, 1.0, 1.0, 1.0, 1.0, 1.0},   // normal
    {-0.12, 0.25, 1.0, 1.3, 1.2, 0.9, 1.0},   // bear
    {-0.35, 0.45, 1.0, 1.8, 1.5, 0.7, 1.5}    // crisis
}};

const std::array<std::array<double, NUM_REGIMES>, NUM_REGIMES> ReturnGenerator::TRANSITIONS = {{
    {0.70, 0.20, 0.08, 0.02},
    {0.25, 0.50, 0.20, 0.05},
    {0.20, 0.40, 0.30, 0.10},
    {0.05, 0.25, 0.60, 0.10}
}};

const std::array<double, NUM_REGIMES> ReturnGenerator::INITIAL_PROBABILITIES = {0.30, 0.50, 0.15, 0.05};

ReturnGenerator::ReturnGenerator(const ReturnModel& model, const ScenarioOptions& options, uint64_t seed)
    : model_(model), options_(options), seed_(seed), uniform_(0.0, 1.0),
      year_(0), regime_(MarketRegime::Normal) {
    model_.validate();
    if (options_.distribution == ReturnDistribution::StudentT && !(options_.degrees_of_freedom > 2.0)) {
        throw std::invalid_argument("Student-t returns need more than 2 degrees of freedom");
    }
    if (options_.strata > 1 && options_.stratum >= options_.strata) {
        throw std::invalid_argument("Stratum index outside the strata count");
    }
    cholesky_ = cholesky(correlation_matrix(model_));
    reset();
}

void ReturnGenerator::reset() {
    rng_.seed(seed_);
    normal_.reset();
    uniform_.reset();
    year_ = 0;
    regime_ = options_.regime_switching ? draw_regime(INITIAL_PROBABILITIES) : MarketRegime::Normal;
}

MarketRegime ReturnGenerator::draw_regime(const std::array<double, NUM_REGIMES>& probabilities) {
    double u = uniform_(rng_);
    double cumulative = 0.0;
    for (size_t i = 0; i < NUM_REGIMES; ++i) {
        cumulative += probabilities[i];
        if (u < cumulative) {
            return static_cast<MarketRegime>(i);
        }
    }
    return static_cast<MarketRegime>(NUM_REGIMES - 1);
}

double ReturnGenerator::stratified_shock() {
    // Per-year affine permutation of the stratum index: over any block of
    // `strata` scenarios every stratum is hit exactly once in every year
    uint64_t strata = options_.strata;
    uint64_t h = mix_seed(options_.stratification_seed, static_cast<uint64_t>(year_));
    uint64_t a = 1 + h % strata;
    while (std::gcd(a, strata) != 1) {
        ++a;
    }
    uint64_t b = (h >> 32) % strata;
    uint64_t bin = (a * options_.stratum + b) % strata;

    double u = (static_cast<double>(bin) + uniform_(rng_)) / static_cast<double>(strata);
    u = std::min(std::max(u, 1e-12), 1.0 - 1e-12);
    return inverse_normal_cdf(u);
}

double ReturnGenerator::fat_tail_scale() {
    double df = options_.degrees_of_freedom;
    std::chi_squared_distribution<double> chi_squared(df);
    double chi2 = chi_squared(rng_);
    if (chi2 <= 0.0) {
        return 1.0;
    }
    // Unit variance: Var(t) = df / (df - 2)
    return std::sqrt((df - 2.0) / df) / std::sqrt(chi2 / df);
}

YearReturns ReturnGenerator::next() {
    if (options_.regime_switching && year_ > 0) {
        regime_ = draw_regime(TRANSITIONS[static_cast<size_t>(regime_)]);
    }

    std::array<double, NUM_ASSET_CLASSES> z;
    z[0] = options_.strata > 1 ? stratified_shock() : normal_(rng_);
    z[1] = normal_(rng_);
    z[2] = normal_(rng_);

    double scale = options_.distribution == ReturnDistribution::StudentT ? fat_tail_scale() : 1.0;
    if (options_.antithetic) {
        scale = -scale;
    }

    std::array<double, NUM_ASSET_CLASSES> shock = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < NUM_ASSET_CLASSES; ++i) {
        for (size_t k = 0; k <= i; ++k) {
            shock[i] += cholesky_[i][k] * z[k];
        }
        shock[i] *= scale;
    }

    double stock_mean = cagr_to_aagr(model_.stocks.cagr, model_.stocks.volatility);
    double stock_vol = model_.stocks.volatility;
    double bond_mean = cagr_to_aagr(model_.bonds.cagr, model_.bonds.volatility);
    double bond_vol = model_.bonds.volatility;
    double cash_mean = cagr_to_aagr(model_.cash.cagr, model_.cash.volatility);
    double cash_vol = model_.cash.volatility;

    if (options_.regime_switching) {
        const RegimeParams& r = REGIMES[static_cast<size_t>(regime_)];
        double regime_vol = r.volatility * r.stock_vol_mult;
        stock_mean = (cagr_to_aagr(r.mean, regime_vol) * 0.6 + stock_mean * 0.4) * r.stock_return_mult;
        stock_vol *= r.stock_vol_mult;
        bond_mean *= r.bond_return_mult;
        bond_vol *= r.bond_vol_mult;
        cash_vol *= r.cash_vol_mult;
    }

    YearReturns result;
    result.year_index = year_;
    result.regime = regime_;
    result.stock_shock = shock[0];
    result.stocks = std::max(model_.return_floor, stock_mean + stock_vol * shock[0]);
    result.bonds = std::max(model_.return_floor, bond_mean + bond_vol * shock[1]);
    result.cash = std::max(model_.return_floor, cash_mean + cash_vol * shock[2]);
    result.portfolio = std::max(model_.return_floor,
                                model_.stock_allocation * result.stocks +
                                model_.bond_allocation * result.bonds +
                                model_.cash_allocation * result.cash);

    ++year_;
    return result;
}

} // namespace retirecalc
