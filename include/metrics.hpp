#pragma once

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <memory>
#include <string>

namespace hjudge {
namespace metrics {

std::shared_ptr<prometheus::Registry> global_registry();

/**
 * @brief 在 address 上开启 HTTP 服务，供 Prometheus 拉取 global_registry 中的指标
 * @param address 形如 0.0.0.0:9100
 */
std::unique_ptr<prometheus::Exposer> expose(const std::string &address);

}  // namespace metrics
}  // namespace hjudge
