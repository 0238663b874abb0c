/**
 * @file worker_factory.hpp
 * @brief Factory for creating scenario workers by type
 *
 * Design Pattern: Factory Method with Registry
 * - Each worker type registers a factory function
 * - The orchestrator requests a fresh worker per pool thread and per retry
 */

#ifndef RETIRECALC_WORKER_FACTORY_HPP
#define RETIRECALC_WORKER_FACTORY_HPP

#include "worker_interface.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace retirecalc {

/**
 * @brief Worker type identifiers
 */
namespace WorkerType {
    constexpr const char* LOCAL = "local";
}

/**
 * @brief Factory for creating worker instances
 *
 * Usage Example:
 *   @code
 *   TaxEngine tax_engine;
 *   WorkerFactory factory(tax_engine);
 *   auto worker = factory.create_worker("local");
 *   @endcode
 */
class WorkerFactory {
public:
    /**
     * @brief Factory function type for creating workers
     */
    using FactoryFunction = std::function<std::unique_ptr<IScenarioWorker>()>;

    /**
     * @brief Constructor - registers the built-in "local" worker
     *
     * @param tax_engine Tax tables shared read-only by local workers
     */
    explicit WorkerFactory(const TaxEngine& tax_engine);

    /**
     * @brief Create a worker instance by type
     *
     * @throws ConfigurationError If worker type is unknown
     */
    std::unique_ptr<IScenarioWorker> create_worker(const std::string& worker_type) const;

    /**
     * @brief Register a custom worker type
     *
     * @throws ConfigurationError If worker_type already registered
     */
    void register_worker(const std::string& worker_type, FactoryFunction factory_fn);

    bool is_registered(const std::string& worker_type) const;

    std::vector<std::string> list_worker_types() const;

private:
    std::map<std::string, FactoryFunction> registry_;
};

} // namespace retirecalc

#endif // RETIRECALC_WORKER_FACTORY_HPP
