// core/default_catalog.hpp - Catalog bundled with the binary
#pragma once

namespace saveli {

// Generated from res/catalog.json at configure time.
const char *default_catalog_json();

} // namespace saveli
