#pragma once
#include <ostream>
#include <string>
#include <rpace/route.hpp>

namespace rpace {

// Header row, then one row per segment in route order with cumulative columns.
void write_cycling_csv(std::ostream& out, const CyclingRoute& route);
void write_running_csv(std::ostream& out, const RunningRoute& route);

// Filesystem wrappers; false if the file cannot be opened.
bool save_cycling_csv(const std::string& path, const CyclingRoute& route);
bool save_running_csv(const std::string& path, const RunningRoute& route);

} // namespace rpace
