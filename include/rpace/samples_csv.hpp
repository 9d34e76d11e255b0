#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <rpace/geo.hpp>

namespace rpace {

// Stream-based loader for "lat,lon[,ele]" rows (test-friendly; no filesystem required).
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Rows with a bad or out-of-range lat/lon
// are skipped; a missing or empty elevation becomes 0.
std::vector<Sample> samples_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Sample>> load_samples_csv(const std::string& path);

} // namespace rpace
