#ifndef RETIRECALC_ASSET_BUCKETS_HPP
#define RETIRECALC_ASSET_BUCKETS_HPP

#include <array>
#include <cstdint>
#include <string>

namespace retirecalc {

enum class BucketType : uint8_t {
    TaxDeferred = 0,    // Traditional IRA / 401(k): withdrawals taxed as ordinary income
    TaxFree = 1,        // Roth: withdrawals untaxed
    CapitalGains = 2,   // Taxable brokerage: gains portion taxed at LTCG rates
    Cash = 3            // Cash equivalents: no tax drag on withdrawal
};

constexpr size_t NUM_BUCKETS = 4;

std::string bucket_type_to_string(BucketType type);

// Share of each year's contribution routed to each bucket
struct ContributionSplit {
    double tax_deferred;
    double tax_free;
    double capital_gains;
    double cash;

    ContributionSplit();
    ContributionSplit(double td, double tf, double cg, double c);

    // Throws std::invalid_argument unless shares are non-negative and sum to 1
    void validate() const;
};

// Per-bucket amounts drawn in one year
struct BucketDraws {
    double tax_deferred;
    double tax_free;
    double capital_gains;
    double cash;
    double realized_gains;    // Gain portion of the capital-gains draw

    BucketDraws();
    double total() const { return tax_deferred + tax_free + capital_gains + cash; }
};

// AssetBuckets: four non-negative balances plus the taxable account's cost basis.
// The total is always derived from the four balances.
class AssetBuckets {
public:
    AssetBuckets();
    AssetBuckets(double tax_deferred, double tax_free, double capital_gains, double cash);
    AssetBuckets(double tax_deferred, double tax_free, double capital_gains, double cash,
                 double capital_gains_basis);

    double balance(BucketType type) const;
    double tax_deferred() const { return balance(BucketType::TaxDeferred); }
    double tax_free() const { return balance(BucketType::TaxFree); }
    double capital_gains() const { return balance(BucketType::CapitalGains); }
    double cash() const { return balance(BucketType::Cash); }
    double capital_gains_basis() const { return basis_; }
    double total() const;

    // Share of a capital-gains sale that is gain (0 when the account is at a loss)
    double gain_ratio() const;

    // Throws std::invalid_argument for negative amounts
    void deposit(BucketType type, double amount);
    // Draws up to amount and returns what was drawn. Capital-gains draws
    // release cost basis pro rata.
    double withdraw(BucketType type, double amount);

    void contribute(double amount, const ContributionSplit& split);

    // Investment buckets earn the portfolio return, cash earns the cash return.
    // Returns below -100% are floored so balances never go negative.
    void apply_returns(double portfolio_return, double cash_return);

    bool is_depleted(double tolerance = 0.01) const { return total() <= tolerance; }

private:
    std::array<double, NUM_BUCKETS> balances_;
    double basis_;

    static size_t index(BucketType type) { return static_cast<size_t>(type); }
};

} // namespace retirecalc

#endif // RETIRECALC_ASSET_BUCKETS_HPP
