// Constants and definitions
#pragma once

namespace saveli {

constexpr const char *SAVELI_VERSION = "0.4.0";

// Catalog
constexpr int CATALOG_VERSION = 1;
constexpr const char *CATALOG_FILE_NAME = "catalog.json";

// Settings
constexpr const char *APP_DIR_NAME = "saveli";
constexpr const char *SETTINGS_FILE_NAME = "settings.conf";

// Save path id used by `add` when the template has no usable last component
constexpr const char *DEFAULT_SAVE_ID = "save";

// Scratch directory prefix for the link capability probe
constexpr const char *PROBE_DIR_PREFIX = "saveli-probe-";

} // namespace saveli
