#include "procrt/resources.hpp"

#include <limits>
#include <sstream>

namespace procrt {

namespace {
bool add_within(uint64_t value, uint64_t delta, uint64_t cap) {
    if (delta > std::numeric_limits<uint64_t>::max() - value) return false;
    return value + delta <= cap;
}
}

std::string Resources::to_string() const {
    std::ostringstream os;
    os << "cpu=" << cpu << " ram=" << ram << " hdd=" << hdd << " net=" << net;
    return os.str();
}

bool operator==(const Resources& a, const Resources& b) {
    return a.cpu == b.cpu && a.ram == b.ram && a.hdd == b.hdd && a.net == b.net;
}

bool operator!=(const Resources& a, const Resources& b) { return !(a == b); }

Resources operator+(const Resources& a, const Resources& b) {
    return {a.cpu + b.cpu, a.ram + b.ram, a.hdd + b.hdd, a.net + b.net};
}

bool ResourcePool::debit(const Resources& amount) {
    if (!covers(amount)) return false;
    available.cpu -= amount.cpu;
    available.ram -= amount.ram;
    available.hdd -= amount.hdd;
    available.net -= amount.net;
    return true;
}

bool ResourcePool::credit(const Resources& amount) {
    if (!add_within(available.cpu, amount.cpu, total.cpu) ||
        !add_within(available.ram, amount.ram, total.ram) ||
        !add_within(available.hdd, amount.hdd, total.hdd) ||
        !add_within(available.net, amount.net, total.net)) {
        return false;
    }
    available = available + amount;
    return true;
}

Resources ResourcePool::used() const {
    return {total.cpu - available.cpu, total.ram - available.ram,
            total.hdd - available.hdd, total.net - available.net};
}

bool ResourcePool::resize(const Resources& new_total) {
    Resources in_use = used();
    if (!in_use.fits_in(new_total)) return false;
    total = new_total;
    available = {new_total.cpu - in_use.cpu, new_total.ram - in_use.ram,
                 new_total.hdd - in_use.hdd, new_total.net - in_use.net};
    return true;
}

bool operator==(const ResourcePool& a, const ResourcePool& b) {
    return a.total == b.total && a.available == b.available;
}

} // namespace procrt
