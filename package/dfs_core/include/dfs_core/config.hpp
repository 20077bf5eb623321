#pragma once

#include <string>

#include "dfs_core/errors.hpp"
#include "dfs_core/log.hpp"

namespace dfs_core {

// Per-player value maximized by the optimizer.
enum class Objective { projection, ev, ceiling };

// Marginal distribution of a player's simulated score.
enum class DistributionMode { normal, lognormal, empirical };

enum class ContestType { cash, gpp };

enum class Sport { nfl, nba };

Objective objective_from_string(const std::string &name);
DistributionMode distribution_from_string(const std::string &name);
ContestType contest_from_string(const std::string &name);
Sport sport_from_string(const std::string &name);
LogLevel log_level_from_string(const std::string &name);

const char *to_string(Objective o);
const char *to_string(DistributionMode d);
const char *to_string(ContestType c);
const char *to_string(Sport s);

} // namespace dfs_core
