#pragma once

#include <nlohmann/json.hpp>

namespace jcomp {

// Document value type.  Object keys keep the order they were parsed or
// inserted in, so scans, leaf iteration and dumps follow the source text.
using json = nlohmann::ordered_json;

} // namespace jcomp
