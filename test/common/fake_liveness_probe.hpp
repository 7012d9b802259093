// LivenessProbe double: a fixed set of addresses answers
#pragma once

#include "scan/liveness_probe.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <string>

namespace netsnmp {
namespace test {

class FakeLivenessProbe : public scan::LivenessProbe {
public:
    FakeLivenessProbe() = default;
    explicit FakeLivenessProbe(std::set<std::string> alive) : alive_(std::move(alive)) {}

    void SetAlive(const std::string& address);

    bool IsAlive(const std::string& address, std::chrono::milliseconds timeout) override;

    size_t calls() const { return calls_.load(); }

private:
    mutable std::mutex mutex_;
    std::set<std::string> alive_;
    std::atomic<size_t> calls_{0};
};

}  // namespace test
}  // namespace netsnmp
