#pragma once

#include <iosfwd>

namespace lintel {

/// lintel_preview entry point: <scene.json> [--log-level LEVEL] [--log-file PATH].
/// Writes the layout result as JSON to `out` and usage or setup errors to `err`.
/// Returns 0 on success (or --help) and 1 on any argument, load or layout error.
int runPreview(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace lintel
