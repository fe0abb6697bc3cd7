#pragma once

#include "oncourt/config.hpp"
#include "oncourt/pipeline.hpp"
#include <iosfwd>

namespace oncourt {

void display_lineups(const GameLineups& result, OutputFormat format, std::ostream& out);
void display_stints(const GameLineups& result, OutputFormat format, std::ostream& out);
void display_minutes(const GameLineups& result, OutputFormat format, std::ostream& out);

// Full screen browser over one reconstructed game.
void run_viewer(const GameLineups& result);

} // namespace oncourt
