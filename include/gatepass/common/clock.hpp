#pragma once

#include <gatepass/schema/primitives.hpp>

#include <functional>

namespace gatepass::common {

/// Source of "now" in unix milliseconds. Injected so tests can pin time.
using clock_t = std::function<gatepass::schema::timestamp_milliseconds_t()>;

gatepass::schema::timestamp_milliseconds_t system_now();

clock_t system_clock();

}  // namespace gatepass::common
