#pragma once
#include "process.hpp"

namespace procrt {

/// Row of the servers table. Rows are never deleted; a server that goes away
/// is decommissioned (online = false) so its pool can still take credits.
struct ServerRow {
    ServerId id{};
    OwnerId owner_id{};
    ResourcePool pool{};
    bool online{true};
    Timestamp updated_at{};
};

} // namespace procrt
