#include "asset_buckets.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace retirecalc {

std::string bucket_type_to_string(BucketType type) {
    switch (type) {
        case BucketType::TaxDeferred: return "tax_deferred";
        case BucketType::TaxFree: return "tax_free";
        case BucketType::CapitalGains: return "capital_gains";
        case BucketType::Cash: return "cash";
        default: return "unknown";
    }
}

// ============================================================================
// ContributionSplit / BucketDraws
// ============================================================================

ContributionSplit::ContributionSplit()
    : tax_deferred(0.6), tax_free(0.2), capital_gains(0.2), cash(0.0) {}

ContributionSplit::ContributionSplit(double td, double tf, double cg, double c)
    : tax_deferred(td), tax_free(tf), capital_gains(cg), cash(c) {}

void ContributionSplit::validate() const {
    if (tax_deferred < 0.0 || tax_free < 0.0 || capital_gains < 0.0 || cash < 0.0) {
        throw std::invalid_argument("Contribution shares must be non-negative");
    }
    double sum = tax_deferred + tax_free + capital_gains + cash;
    if (std::abs(sum - 1.0) > 1e-6) {
        throw std::invalid_argument("Contribution shares must sum to 1");
    }
}

BucketDraws::BucketDraws()
    : tax_deferred(0.0), tax_free(0.0), capital_gains(0.0), cash(0.0), realized_gains(0.0) {}

// ============================================================================
// AssetBuckets Implementation
// ============================================================================

AssetBuckets::AssetBuckets() : basis_(0.0) {
    balances_.fill(0.0);
}

AssetBuckets::AssetBuckets(double tax_deferred, double tax_free, double capital_gains, double cash)
    : AssetBuckets(tax_deferred, tax_free, capital_gains, cash, capital_gains) {}

AssetBuckets::AssetBuckets(double tax_deferred, double tax_free, double capital_gains, double cash,
                           double capital_gains_basis)
    : balances_{tax_deferred, tax_free, capital_gains, cash}, basis_(capital_gains_basis) {
    for (double b : balances_) {
        if (b < 0.0 || !std::isfinite(b)) {
            throw std::invalid_argument("Bucket balances must be finite and non-negative");
        }
    }
    if (basis_ < 0.0) {
        throw std::invalid_argument("Cost basis must be non-negative");
    }
}

double AssetBuckets::balance(BucketType type) const {
    size_t i = index(type);
    if (i >= NUM_BUCKETS) {
        throw std::out_of_range("Unknown bucket type");
    }
    return balances_[i];
}

double AssetBuckets::total() const {
    return balances_[0] + balances_[1] + balances_[2] + balances_[3];
}

double AssetBuckets::gain_ratio() const {
    double cg = balances_[index(BucketType::CapitalGains)];
    if (cg <= 0.0 || basis_ >= cg) {
        return 0.0;
    }
    return 1.0 - basis_ / cg;
}

void AssetBuckets::deposit(BucketType type, double amount) {
    if (amount < 0.0 || !std::isfinite(amount)) {
        throw std::invalid_argument("Deposit must be finite and non-negative");
    }
    balances_[index(type)] += amount;
    if (type == BucketType::CapitalGains) {
        basis_ += amount;
    }
}

double AssetBuckets::withdraw(BucketType type, double amount) {
    if (amount < 0.0 || !std::isfinite(amount)) {
        throw std::invalid_argument("Withdrawal must be finite and non-negative");
    }
    double& bal = balances_[index(type)];
    double drawn = std::min(amount, bal);
    if (type == BucketType::CapitalGains && bal > 0.0) {
        basis_ -= basis_ * (drawn / bal);
        basis_ = std::max(0.0, basis_);
    }
    bal -= drawn;
    if (bal < 1e-9) {
        bal = 0.0;
        if (type == BucketType::CapitalGains) {
            basis_ = 0.0;
        }
    }
    return drawn;
}

void AssetBuckets::contribute(double amount, const ContributionSplit& split) {
    if (amount <= 0.0) {
        return;
    }
    deposit(BucketType::TaxDeferred, amount * split.tax_deferred);
    deposit(BucketType::TaxFree, amount * split.tax_free);
    deposit(BucketType::CapitalGains, amount * split.capital_gains);
    deposit(BucketType::Cash, amount * split.cash);
}

void AssetBuckets::apply_returns(double portfolio_return, double cash_return) {
    double growth = 1.0 + std::max(portfolio_return, -1.0);
    double cash_growth = 1.0 + std::max(cash_return, -1.0);

    balances_[index(BucketType::TaxDeferred)] *= growth;
    balances_[index(BucketType::TaxFree)] *= growth;
    balances_[index(BucketType::CapitalGains)] *= growth;
    balances_[index(BucketType::Cash)] *= cash_growth;
}

} // namespace retirecalc
