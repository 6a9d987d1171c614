#pragma once
#include "process.hpp"
#include <memory>
#include <string>

namespace procrt {

/// Work units per second granted to a process by its reservation. Implementations
/// must be deterministic and must not decrease when any dimension grows.
class ThroughputPolicy {
public:
    virtual ~ThroughputPolicy() = default;
    virtual std::string name() const = 0;
    virtual double rate(ProcessType type, const Resources& reservation) const = 0;
};

struct ThroughputWeights {
    double cpu = 1.0;
    double ram = 0.0;
    double hdd = 0.0;
    double net = 0.0;
    double floor = 0.0;  // rate granted even to an empty reservation
};

/// Weighted sum of the reservation, identical for every process type.
class LinearThroughput : public ThroughputPolicy {
public:
    explicit LinearThroughput(ThroughputWeights w = {});
    std::string name() const override { return "linear"; }
    double rate(ProcessType type, const Resources& reservation) const override;
private:
    ThroughputWeights w_;
};

/// File transfers run at net_weight per NET unit, every other type at
/// cpu_weight per CPU unit.
class TypedThroughput : public ThroughputPolicy {
public:
    TypedThroughput(double cpu_weight, double net_weight, double floor = 0.0);
    std::string name() const override { return "typed"; }
    double rate(ProcessType type, const Resources& reservation) const override;
private:
    double cpu_weight_;
    double net_weight_;
    double floor_;
};

std::unique_ptr<ThroughputPolicy> make_linear_policy(ThroughputWeights w = {});
std::unique_ptr<ThroughputPolicy> make_typed_policy(double cpu_weight = 1.0, double net_weight = 1.0);

} // namespace procrt
