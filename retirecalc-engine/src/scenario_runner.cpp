#include "scenario_runner.hpp"
#include "benefits.hpp"
#include "ltc_overlay.hpp"
#include "mortality.hpp"
#include "risk_metrics.hpp"
#include "withdrawal_solver.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace retirecalc {

YearState::YearState()
    : year_index(0), calendar_year(0), age(0), spouse_age(-1), retired(false),
      tax_deferred(0.0), tax_free(0.0), capital_gains(0.0), cash(0.0), total_assets(0.0),
      portfolio_return(0.0), cash_return(0.0), regime(MarketRegime::Normal),
      contributions(0.0), social_security(0.0), pension(0.0), earned_income(0.0),
      guaranteed_income(0.0), planned_spending(0.0), spending(0.0), healthcare(0.0),
      spending_need(0.0), gross_withdrawal(0.0), net_withdrawal(0.0), rmd(0.0),
      realized_gains(0.0), federal_tax(0.0), state_tax(0.0), irmaa(0.0), magi(0.0),
      ltc_gross(0.0), ltc_insurance_offset(0.0), ltc_premiums(0.0), ltc_cost(0.0),
      guardrail_state(GuardrailState::Normal), guardrail_adjustment(0.0), shortfall(0.0) {}

ScenarioOutcome::ScenarioOutcome()
    : scenario_index(0), seed(0), success(true), legacy_goal_met(false),
      ending_balance(0.0), total_shortfall(0.0), shortfall_years(0), depletion_age(-1),
      max_drawdown(0.0), ulcer_index(0.0), drawdown_duration(0),
      early_negative_returns(0), control_value(0.0), total_ltc_cost(0.0), ltc_event(false),
      primary_death_age(0.0), spouse_death_age(-1.0) {}

namespace {

// Share of the year starting at `age` that falls on or after `start_age`
double share_of_year_from(double start_age, int age) {
    return std::min(1.0, std::max(0.0, age + 1.0 - start_age));
}

struct Lifespans {
    double primary;
    double spouse;      // -1 without a spouse
};

// Fixed life expectancies, or one draw per member from the SSA table
Lifespans draw_lifespans(const ScenarioParams& params, const ScenarioOptions& options, uint64_t seed) {
    Lifespans lives{params.primary.life_expectancy,
                    params.has_spouse ? params.spouse.life_expectancy : -1.0};
    if (!options.stochastic_mortality) {
        return lives;
    }
    std::mt19937_64 rng(mix_seed(seed, MORTALITY_STREAM));
    const MortalityTable& table = MortalityTable::ssa_period();
    const PersonParams& primary = params.primary;
    lives.primary = draw_death_age(table, primary.current_age, primary.gender, primary.health, rng);
    if (params.has_spouse) {
        const PersonParams& spouse = params.spouse;
        lives.spouse = draw_death_age(table, spouse.current_age, spouse.gender, spouse.health, rng);
    }
    return lives;
}

// Years until the last member dies
int horizon_for(const ScenarioParams& params, const Lifespans& lives) {
    double years = lives.primary - params.primary.current_age;
    if (params.has_spouse) {
        years = std::max(years, lives.spouse - params.spouse.current_age);
    }
    return static_cast<int>(std::ceil(years));
}

LtcOverlay make_ltc_overlay(const ScenarioParams& params, const Lifespans& lives) {
    std::vector<LtcPerson> persons;
    auto add = [&persons](const PersonParams& p, double death_age) {
        LtcPerson person;
        person.current_age = p.current_age;
        person.life_expectancy = death_age;
        person.gender = p.gender;
        person.health = p.health;
        person.insurance = p.ltc_insurance;
        persons.push_back(person);
    };
    add(params.primary, lives.primary);
    if (params.has_spouse) {
        add(params.spouse, lives.spouse);
    }
    return LtcOverlay(params.ltc, persons);
}

// Annual Social Security for one person in simulated year t
double social_security_for(const ScenarioParams& params, const PersonParams& person, int age, int t) {
    if (person.social_security_pia <= 0.0) {
        return 0.0;
    }
    double share = share_of_year_from(person.social_security_claim_age, age);
    if (share <= 0.0) {
        return 0.0;
    }
    double monthly = benefit_at_claim_age(person.social_security_claim_age,
                                          person.full_retirement_age(params.start_year),
                                          person.social_security_pia);
    return monthly * 12.0 * share * std::pow(1.0 + params.social_security_cola, t);
}

// Survivor benefit in year t: the deceased's own benefit, paid in full from
// the first year after death provided they had reached their claiming age
double survivor_benefit(const ScenarioParams& params, const PersonParams& deceased,
                        double death_age, int t) {
    if (deceased.social_security_pia <= 0.0 || death_age < deceased.social_security_claim_age) {
        return 0.0;
    }
    double monthly = benefit_at_claim_age(deceased.social_security_claim_age,
                                          deceased.full_retirement_age(params.start_year),
                                          deceased.social_security_pia);
    return monthly * 12.0 * std::pow(1.0 + params.social_security_cola, t);
}

// Adds one person's guaranteed income for the year
// Called for retired households only
void add_person_income(const ScenarioParams& params, const PersonParams& person, int age,
                       bool alive, bool survivor_alive, int t,
                       double price_index, GuaranteedIncome& income) {
    double pension = 0.0;
    if (person.pension_annual > 0.0 && age >= person.retirement_age) {
        pension = person.pension_annual * std::pow(1.0 + params.pension_cola, t);
    }

    if (!alive) {
        if (survivor_alive) {
            income.pension += pension * person.pension_survivor_fraction;
        }
        return;
    }

    income.pension += pension;
    income.social_security += social_security_for(params, person, age, t);
    if (age < person.retirement_age) {
        income.earned += person.employment_income * price_index;
    }
    if (age >= person.retirement_age && age < person.part_time_end_age) {
        income.earned += person.part_time_income * price_index;
    }
}

} // anonymous namespace

// ============================================================================
// Scenario Runner
// ============================================================================

ScenarioOutcome run_scenario(const ScenarioParams& params, const TaxEngine& tax_engine,
                             uint64_t seed, const ScenarioOptions& options) {
    ScenarioOutcome outcome;
    outcome.seed = seed;

    Lifespans lives = draw_lifespans(params, options, seed);
    outcome.primary_death_age = lives.primary;
    outcome.spouse_death_age = lives.spouse;

    ReturnGenerator returns(params.returns, options, mix_seed(seed, RETURN_STREAM));
    std::mt19937_64 ltc_rng(mix_seed(seed, LTC_STREAM));
    LtcPlan ltc_plan = make_ltc_overlay(params, lives).draw(ltc_rng);
    outcome.ltc_event = options.include_ltc && ltc_plan.any_event();

    WithdrawalSolver solver(tax_engine);
    GuardrailPolicy guardrails(params.guardrails);
    AssetBuckets buckets = params.initial_assets;

    int horizon = horizon_for(params, lives);
    outcome.years.reserve(static_cast<size_t>(std::max(horizon, 0)));
    outcome.balances.reserve(static_cast<size_t>(std::max(horizon, 0)));

    std::vector<double> magi_history;
    std::vector<double> retirement_balances;
    double spending = 0.0;
    double initial_rate = 0.0;
    int retirement_start = -1;
    double control_sum = 0.0;
    int control_count = 0;

    for (int t = 0; t < horizon; ++t) {
        YearState ys;
        ys.year_index = t;
        ys.calendar_year = params.start_year + t;
        ys.age = params.primary.current_age + t;
        ys.spouse_age = params.has_spouse ? params.spouse.current_age + t : -1;
        ys.retired = ys.age >= params.primary.retirement_age;

        bool primary_alive = ys.age < lives.primary;
        bool spouse_alive = params.has_spouse && ys.spouse_age < lives.spouse;

        FilingStatus status = params.filing_status;
        if (status == FilingStatus::MarriedJoint && !(primary_alive && spouse_alive)) {
            status = FilingStatus::Single;
        }
        int seniors = (primary_alive && ys.age >= TaxEngine::MEDICARE_AGE ? 1 : 0) +
                      (spouse_alive && ys.spouse_age >= TaxEngine::MEDICARE_AGE ? 1 : 0);

        double price_index = std::pow(1.0 + params.general_inflation, t);
        double healthcare_index = std::pow(1.0 + params.healthcare_inflation, t);

        YearReturns r = returns.next();
        ys.portfolio_return = r.portfolio;
        ys.cash_return = r.cash;
        ys.regime = r.regime;

        LtcYearCost ltc = options.include_ltc ? ltc_plan.cost_at(t) : LtcYearCost();
        ys.ltc_gross = ltc.gross;
        ys.ltc_insurance_offset = ltc.insurance_offset;
        ys.ltc_premiums = ltc.premiums;
        ys.ltc_cost = ltc.net();
        outcome.total_ltc_cost += ltc.net();

        GuaranteedIncome income;
        if (ys.retired) {
            add_person_income(params, params.primary, ys.age, primary_alive, spouse_alive,
                              t, price_index, income);
            if (params.has_spouse) {
                add_person_income(params, params.spouse, ys.spouse_age, spouse_alive, primary_alive,
                                  t, price_index, income);

                // A widow(er) keeps the larger of their own and the deceased's benefit
                if (primary_alive != spouse_alive) {
                    const PersonParams& survivor = primary_alive ? params.primary : params.spouse;
                    const PersonParams& deceased = primary_alive ? params.spouse : params.primary;
                    int survivor_age = primary_alive ? ys.age : ys.spouse_age;
                    double death_age = primary_alive ? lives.spouse : lives.primary;
                    double own = social_security_for(params, survivor, survivor_age, t);
                    income.social_security += std::max(0.0, survivor_benefit(params, deceased, death_age, t) - own);
                }
            }
        }
        ys.social_security = income.social_security;
        ys.pension = income.pension;
        ys.earned_income = income.earned;
        ys.guaranteed_income = income.total();

        WithdrawalRequest request;
        request.buckets = buckets;
        request.income = income;
        request.age = ys.age;
        request.seniors = seniors;
        request.filing_status = status;
        request.state = params.state;
        request.year = ys.calendar_year;
        request.rmd_start_age = params.rmd_start_age();

        double portfolio_start = buckets.total();
        WithdrawalResult wr;
        double contribution = 0.0;

        if (!ys.retired) {
            // Savings fund LTC costs first; any excess cost comes from the portfolio
            double net_saving = params.annual_savings * price_index - ltc.net();
            request.net_need = std::max(0.0, -net_saving);
            wr = solver.solve(request);
            contribution = std::max(0.0, net_saving);
            ys.spending_need = request.net_need;
        } else {
            if (retirement_start < 0) {
                retirement_start = t;
                retirement_balances.push_back(portfolio_start);
                spending = params.annual_expenses * price_index;
                ys.planned_spending = spending;
                initial_rate = GuardrailPolicy::withdrawal_rate(spending, income.total(), portfolio_start);
            } else {
                ys.planned_spending = spending * (1.0 + params.general_inflation);
                GuardrailDecision decision = guardrails.evaluate(ys.planned_spending, income.total(),
                                                                 portfolio_start, initial_rate);
                spending = decision.spending;
                ys.guardrail_state = decision.state;
                ys.guardrail_adjustment = decision.adjustment;
            }
            ys.spending = spending;
            ys.healthcare = params.healthcare_expenses * healthcare_index;
            double base_need = spending + ys.healthcare + ltc.net();

            auto irmaa_for = [&](double magi) {
                double total = 0.0;
                if (primary_alive) {
                    total += tax_engine.irmaa_surcharge(magi, status, ys.calendar_year, ys.age).total();
                }
                if (spouse_alive) {
                    total += tax_engine.irmaa_surcharge(magi, status, ys.calendar_year, ys.spouse_age).total();
                }
                return total;
            };

            // Lookback MAGI comes from retirement years only; working years carry no wages
            if (t - TaxEngine::IRMAA_LOOKBACK_YEARS >= retirement_start) {
                ys.irmaa = irmaa_for(magi_history[static_cast<size_t>(t - TaxEngine::IRMAA_LOOKBACK_YEARS)]);
                request.net_need = base_need + ys.irmaa;
                wr = solver.solve(request);
            } else {
                // No retirement history yet: price IRMAA off this year's own MAGI
                request.net_need = base_need;
                wr = solver.solve(request);
                ys.irmaa = irmaa_for(wr.taxes.agi);
                if (ys.irmaa > 0.0) {
                    request.net_need = base_need + ys.irmaa;
                    wr = solver.solve(request);
                }
            }
            ys.spending_need = request.net_need;
        }

        buckets = wr.buckets_after;
        if (contribution > 0.0) {
            buckets.contribute(contribution, params.contribution_split);
        }
        buckets.apply_returns(r.portfolio, r.cash);

        ys.contributions = contribution;
        ys.gross_withdrawal = wr.gross_withdrawal;
        ys.net_withdrawal = std::max(0.0, wr.net_available - income.total());
        ys.rmd = wr.rmd_withdrawn;
        ys.realized_gains = wr.draws.realized_gains;
        ys.federal_tax = wr.taxes.federal();
        ys.state_tax = wr.taxes.state;
        ys.magi = wr.taxes.agi;
        ys.shortfall = wr.shortfall;
        magi_history.push_back(ys.magi);

        ys.tax_deferred = buckets.tax_deferred();
        ys.tax_free = buckets.tax_free();
        ys.capital_gains = buckets.capital_gains();
        ys.cash = buckets.cash();
        ys.total_assets = buckets.total();

        if (ys.shortfall > 0.0) {
            outcome.shortfall_years++;
            outcome.total_shortfall += ys.shortfall;
        }

        if (ys.retired) {
            int k = t - retirement_start;
            retirement_balances.push_back(ys.total_assets);
            if (k < EARLY_RETIREMENT_YEARS && r.portfolio < 0.0) {
                outcome.early_negative_returns++;
            }
            if (k < CONTROL_WINDOW_YEARS) {
                control_sum += r.stock_shock;
                control_count++;
            }
            if (outcome.depletion_age < 0 && buckets.is_depleted()) {
                outcome.depletion_age = ys.age;
            }
        }

        outcome.balances.push_back(ys.total_assets);
        outcome.years.push_back(ys);
    }

    outcome.ending_balance = buckets.total();
    outcome.success = outcome.shortfall_years == 0;
    outcome.legacy_goal_met = outcome.ending_balance >= params.legacy_goal;
    outcome.control_value = control_count > 0 ? control_sum / control_count : 0.0;

    DrawdownMetrics drawdown = calculate_drawdown_metrics(retirement_balances);
    outcome.max_drawdown = drawdown.max_drawdown;
    outcome.ulcer_index = drawdown.ulcer_index;
    outcome.drawdown_duration = drawdown.duration;
    return outcome;
}

} // namespace retirecalc
