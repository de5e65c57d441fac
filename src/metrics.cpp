#include "metrics.hpp"

namespace hjudge {
namespace metrics {

std::shared_ptr<prometheus::Registry> global_registry() {
    static std::shared_ptr<prometheus::Registry> registry = std::make_shared<prometheus::Registry>();
    return registry;
}

std::unique_ptr<prometheus::Exposer> expose(const std::string &address) {
    auto exposer = std::make_unique<prometheus::Exposer>(address);
    exposer->RegisterCollectable(global_registry());
    return exposer;
}

}  // namespace metrics
}  // namespace hjudge
