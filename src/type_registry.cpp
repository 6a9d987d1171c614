#include "procrt/type_registry.hpp"

#include <algorithm>
#include <cmath>

namespace procrt {

std::optional<double> TypeRegistry::required_work(ProcessType type, double difficulty) const {
    auto spec = lookup(type);
    if (!spec || !std::isfinite(difficulty)) return std::nullopt;
    double d = std::clamp(difficulty, 0.0, 1.0);
    return spec->min_seconds + (spec->max_seconds - spec->min_seconds) * d;
}

void register_default_types(TypeRegistry& reg) {
    reg.register_type({ProcessType::Download, 20, 7200});
    reg.register_type({ProcessType::Upload, 20, 7200});
    reg.register_type({ProcessType::Delete, 20, 1200});
    reg.register_type({ProcessType::Hide, 5, 1200});
    reg.register_type({ProcessType::Seek, 5, 1200});
    reg.register_type({ProcessType::Install, 4, 1200});
    reg.register_type({ProcessType::Uninstall, 4, 1200});
    reg.register_type({ProcessType::Antivirus, 60, 600});
    reg.register_type({ProcessType::EditLog, 4, 60});
    reg.register_type({ProcessType::Format, 1200, 3600});
    reg.register_type({ProcessType::Hack, 10, 600});
    reg.register_type({ProcessType::BankHack, 10, 600});
    reg.register_type({ProcessType::PortScan, 60, 300});
}

} // namespace procrt
