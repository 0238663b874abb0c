/**
 * @file worker_factory.cpp
 * @brief Implementation of WorkerFactory
 */

#include "worker_factory.hpp"
#include <utility>

namespace retirecalc {

WorkerFactory::WorkerFactory(const TaxEngine& tax_engine) {
    registry_[WorkerType::LOCAL] = [&tax_engine]() -> std::unique_ptr<IScenarioWorker> {
        return std::make_unique<LocalScenarioWorker>(tax_engine);
    };
}

std::unique_ptr<IScenarioWorker> WorkerFactory::create_worker(const std::string& worker_type) const {
    auto it = registry_.find(worker_type);
    if (it == registry_.end()) {
        std::string types;
        for (const auto& pair : registry_) {
            if (!types.empty()) types += ", ";
            types += pair.first;
        }
        throw ConfigurationError("Unknown worker type: " + worker_type +
                                 ". Available types: " + types);
    }

    std::unique_ptr<IScenarioWorker> worker = it->second();
    if (!worker) {
        throw ConfigurationError("Factory for worker type " + worker_type + " returned no worker");
    }
    return worker;
}

void WorkerFactory::register_worker(const std::string& worker_type, FactoryFunction factory_fn) {
    if (registry_.find(worker_type) != registry_.end()) {
        throw ConfigurationError("Worker type already registered: " + worker_type);
    }
    registry_[worker_type] = std::move(factory_fn);
}

bool WorkerFactory::is_registered(const std::string& worker_type) const {
    return registry_.find(worker_type) != registry_.end();
}

std::vector<std::string> WorkerFactory::list_worker_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

} // namespace retirecalc
