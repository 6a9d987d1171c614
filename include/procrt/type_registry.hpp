#pragma once
#include "process.hpp"
#include <cmath>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace procrt {

struct TypeSpec {
    ProcessType type{ProcessType::Download};
    double min_seconds{0.0};
    double max_seconds{0.0};
};

/// Base duration range for every process type. Work is measured in seconds at
/// a throughput of 1.0, so required_work scales with difficulty inside [min, max].
class TypeRegistry {
public:
    // Refuses a range that is not finite, negative or inverted.
    bool register_type(const TypeSpec& spec) {
        if (!valid(spec)) return false;
        std::lock_guard<std::mutex> lk(mu_);
        specs_[spec.type] = spec;
        return true;
    }
    static bool valid(const TypeSpec& spec) {
        return std::isfinite(spec.min_seconds) && std::isfinite(spec.max_seconds) && spec.min_seconds >= 0.0 &&
               spec.max_seconds >= spec.min_seconds;
    }
    std::optional<TypeSpec> lookup(ProcessType type) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = specs_.find(type);
        if (it == specs_.end()) return std::nullopt;
        return it->second;
    }
    // std::nullopt for an unregistered type or a difficulty that is not finite.
    std::optional<double> required_work(ProcessType type, double difficulty) const;

private:
    mutable std::mutex mu_;
    std::unordered_map<ProcessType, TypeSpec> specs_;
};

/// Ranges from the game configuration.
void register_default_types(TypeRegistry& reg);

} // namespace procrt
