#include "procrt/throughput.hpp"

#include <algorithm>

namespace procrt {

namespace {
double non_negative(double v) { return v < 0.0 ? 0.0 : v; }
}

LinearThroughput::LinearThroughput(ThroughputWeights w) : w_(w) {
    w_.cpu = non_negative(w_.cpu);
    w_.ram = non_negative(w_.ram);
    w_.hdd = non_negative(w_.hdd);
    w_.net = non_negative(w_.net);
    w_.floor = non_negative(w_.floor);
}

double LinearThroughput::rate(ProcessType, const Resources& r) const {
    double sum = w_.cpu * static_cast<double>(r.cpu) + w_.ram * static_cast<double>(r.ram) +
                 w_.hdd * static_cast<double>(r.hdd) + w_.net * static_cast<double>(r.net);
    return std::max(sum, w_.floor);
}

TypedThroughput::TypedThroughput(double cpu_weight, double net_weight, double floor)
    : cpu_weight_(non_negative(cpu_weight)),
      net_weight_(non_negative(net_weight)),
      floor_(non_negative(floor)) {}

double TypedThroughput::rate(ProcessType type, const Resources& r) const {
    double raw = is_transfer(type) ? net_weight_ * static_cast<double>(r.net)
                                   : cpu_weight_ * static_cast<double>(r.cpu);
    return std::max(raw, floor_);
}

std::unique_ptr<ThroughputPolicy> make_linear_policy(ThroughputWeights w) {
    return std::make_unique<LinearThroughput>(w);
}

std::unique_ptr<ThroughputPolicy> make_typed_policy(double cpu_weight, double net_weight) {
    return std::make_unique<TypedThroughput>(cpu_weight, net_weight);
}

} // namespace procrt
