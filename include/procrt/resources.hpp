#pragma once
#include <cstdint>
#include <string>

namespace procrt {

struct Resources {
    uint64_t cpu{0};
    uint64_t ram{0};
    uint64_t hdd{0};
    uint64_t net{0};

    bool is_zero() const { return cpu == 0 && ram == 0 && hdd == 0 && net == 0; }
    bool fits_in(const Resources& limit) const {
        return cpu <= limit.cpu && ram <= limit.ram && hdd <= limit.hdd && net <= limit.net;
    }
    std::string to_string() const;
};

bool operator==(const Resources& a, const Resources& b);
bool operator!=(const Resources& a, const Resources& b);
Resources operator+(const Resources& a, const Resources& b);

/// Capacity ledger of one server. available <= total on every dimension.
struct ResourcePool {
    Resources total{};
    Resources available{};

    static ResourcePool full(const Resources& total) { return {total, total}; }

    bool covers(const Resources& amount) const { return amount.fits_in(available); }
    // Both leave the pool untouched when they return false.
    bool debit(const Resources& amount);
    bool credit(const Resources& amount);
    Resources used() const;
    // Changes capacity while keeping what is in use; false if that no longer fits.
    bool resize(const Resources& new_total);
    bool consistent() const { return available.fits_in(total); }
};

bool operator==(const ResourcePool& a, const ResourcePool& b);

} // namespace procrt
