#include "dfs_core/cancellation.hpp"
#include "dfs_core/config.hpp"
#include "dfs_core/constraints.hpp"
#include "dfs_core/correlation.hpp"
#include "dfs_core/errors.hpp"
#include "dfs_core/field.hpp"
#include "dfs_core/lineup.hpp"
#include "dfs_core/optimizer.hpp"
#include "dfs_core/player.hpp"
#include "dfs_core/portfolio.hpp"
#include "dfs_core/projection.hpp"
#include "dfs_core/roster.hpp"
#include "dfs_core/simulator.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace nb::literals;

// The NB_MODULE macro defines the entry point for the Python module.
NB_MODULE(dfs_core, m) {
  m.doc() = "DFS lineup optimizer and correlated Monte Carlo simulation core.";

  // Errors
  auto validation_error = nb::exception<dfs_core::ValidationError>(
      m, "ValidationError", PyExc_ValueError);
  nb::exception<dfs_core::InvalidCorrelationError>(
      m, "InvalidCorrelationError", validation_error.ptr());
  nb::exception<dfs_core::ConstraintConfigError>(m, "ConstraintConfigError",
                                                 PyExc_ValueError);
  nb::exception<dfs_core::InfeasibleError>(m, "InfeasibleError");
  nb::exception<dfs_core::TimeoutError>(m, "TimeoutError");
  nb::exception<dfs_core::SolverError>(m, "SolverError");
  nb::exception<dfs_core::ResourceBudgetExceeded>(m, "ResourceBudgetExceeded");

  // Enums
  nb::enum_<dfs_core::LogLevel>(m, "LogLevel")
      .value("off", dfs_core::LogLevel::off)
      .value("error", dfs_core::LogLevel::error)
      .value("warn", dfs_core::LogLevel::warn)
      .value("info", dfs_core::LogLevel::info)
      .value("debug", dfs_core::LogLevel::debug);
  nb::enum_<dfs_core::Objective>(m, "Objective")
      .value("projection", dfs_core::Objective::projection)
      .value("ev", dfs_core::Objective::ev)
      .value("ceiling", dfs_core::Objective::ceiling);
  nb::enum_<dfs_core::DistributionMode>(m, "DistributionMode")
      .value("normal", dfs_core::DistributionMode::normal)
      .value("lognormal", dfs_core::DistributionMode::lognormal)
      .value("empirical", dfs_core::DistributionMode::empirical);
  nb::enum_<dfs_core::ContestType>(m, "ContestType")
      .value("cash", dfs_core::ContestType::cash)
      .value("gpp", dfs_core::ContestType::gpp);
  nb::enum_<dfs_core::Sport>(m, "Sport")
      .value("nfl", dfs_core::Sport::nfl)
      .value("nba", dfs_core::Sport::nba);
  nb::enum_<dfs_core::InfeasibilityReason>(m, "InfeasibilityReason")
      .value("salary_cap", dfs_core::InfeasibilityReason::salary_cap)
      .value("salary_floor", dfs_core::InfeasibilityReason::salary_floor)
      .value("roster_size", dfs_core::InfeasibilityReason::roster_size)
      .value("position", dfs_core::InfeasibilityReason::position)
      .value("locks", dfs_core::InfeasibilityReason::locks)
      .value("team_limit", dfs_core::InfeasibilityReason::team_limit)
      .value("stack", dfs_core::InfeasibilityReason::stack)
      .value("games", dfs_core::InfeasibilityReason::games)
      .value("uniqueness", dfs_core::InfeasibilityReason::uniqueness)
      .value("exposure", dfs_core::InfeasibilityReason::exposure)
      .value("unknown", dfs_core::InfeasibilityReason::unknown);
  nb::enum_<dfs_core::BatchState>(m, "BatchState")
      .value("initializing", dfs_core::BatchState::initializing)
      .value("solving", dfs_core::BatchState::solving)
      .value("emitted", dfs_core::BatchState::emitted)
      .value("complete", dfs_core::BatchState::complete)
      .value("failed", dfs_core::BatchState::failed);

  m.def("objective_from_string", &dfs_core::objective_from_string);
  m.def("distribution_from_string", &dfs_core::distribution_from_string);
  m.def("contest_from_string", &dfs_core::contest_from_string);
  m.def("sport_from_string", &dfs_core::sport_from_string);

  nb::class_<dfs_core::CancellationToken>(m, "CancellationToken")
      .def(nb::init<>())
      .def("cancel", &dfs_core::CancellationToken::cancel)
      .def("reset", &dfs_core::CancellationToken::reset)
      .def("cancelled", &dfs_core::CancellationToken::cancelled);

  // Roster
  nb::class_<dfs_core::RosterSlot>(m, "RosterSlot")
      .def(nb::init<>())
      .def(nb::init<std::string, std::vector<std::string>>())
      .def_rw("name", &dfs_core::RosterSlot::name)
      .def_rw("positions", &dfs_core::RosterSlot::positions)
      .def("is_flex", &dfs_core::RosterSlot::is_flex)
      .def("__repr__", [](const dfs_core::RosterSlot &s) {
        return fmt::format("RosterSlot(name={}, positions={})", s.name,
                           fmt::join(s.positions, "/"));
      });

  nb::class_<dfs_core::RosterSpec>(m, "RosterSpec")
      .def(nb::init<>())
      .def_rw("name", &dfs_core::RosterSpec::name)
      .def_rw("slots", &dfs_core::RosterSpec::slots)
      .def_rw("default_salary_cap", &dfs_core::RosterSpec::default_salary_cap)
      .def("size", &dfs_core::RosterSpec::size)
      .def("__repr__", [](const dfs_core::RosterSpec &r) {
        return fmt::format("RosterSpec(name={}, slots={}, cap={})", r.name,
                           r.slots.size(), r.default_salary_cap);
      });
  m.def("roster_from_string", &dfs_core::roster_from_string);

  // Player
  nb::class_<dfs_core::Player>(m, "Player")
      .def(nb::init<>())
      .def(nb::init<std::string, std::string, std::vector<std::string>,
                    std::string, std::string, int, double>(),
           "id"_a, "name"_a, "positions"_a, "team"_a, "opponent"_a,
           "salary"_a, "projection"_a)
      .def_rw("id", &dfs_core::Player::id)
      .def_rw("name", &dfs_core::Player::name)
      .def_rw("positions", &dfs_core::Player::positions)
      .def_rw("team", &dfs_core::Player::team)
      .def_rw("opponent", &dfs_core::Player::opponent)
      .def_rw("game_id", &dfs_core::Player::game_id)
      .def_rw("salary", &dfs_core::Player::salary)
      .def_rw("projection", &dfs_core::Player::projection)
      .def_rw("floor", &dfs_core::Player::floor)
      .def_rw("ceiling", &dfs_core::Player::ceiling)
      .def_rw("stdev", &dfs_core::Player::stdev)
      .def_rw("volatility", &dfs_core::Player::volatility)
      .def_rw("ownership", &dfs_core::Player::ownership)
      .def_rw("locked", &dfs_core::Player::locked)
      .def_rw("banned", &dfs_core::Player::banned)
      .def_rw("outcome_samples", &dfs_core::Player::outcome_samples)
      .def("__repr__", [](const dfs_core::Player &p) {
        return fmt::format(
            "Player(id={}, name={}, positions={}, team={}, salary={}, "
            "projection={})",
            p.id, p.name, fmt::join(p.positions, "/"), p.team, p.salary,
            p.projection);
      });

  nb::class_<dfs_core::PlayerPool>(m, "PlayerPool")
      .def(nb::init<>())
      .def_static("load", &dfs_core::PlayerPool::load)
      .def("add_player", &dfs_core::PlayerPool::add_player)
      .def("size", &dfs_core::PlayerPool::size)
      .def("has_id", &dfs_core::PlayerPool::has_id)
      .def("index_of", &dfs_core::PlayerPool::index_of)
      .def("get_by_id", &dfs_core::PlayerPool::get_by_id)
      .def("players", &dfs_core::PlayerPool::players)
      .def("eligible_for_slot", &dfs_core::PlayerPool::eligible_for_slot)
      .def("team_players", &dfs_core::PlayerPool::team_players)
      .def("count_by_position", &dfs_core::PlayerPool::count_by_position)
      .def("count_by_team", &dfs_core::PlayerPool::count_by_team)
      .def("teams", &dfs_core::PlayerPool::teams)
      .def("games", &dfs_core::PlayerPool::games)
      .def("projections", &dfs_core::PlayerPool::projections)
      .def("stdevs", &dfs_core::PlayerPool::stdevs)
      .def("ownerships", &dfs_core::PlayerPool::ownerships)
      .def("__repr__", [](const dfs_core::PlayerPool &p) {
        return fmt::format("PlayerPool(size={})", p.size());
      });

  // Triangular distribution
  nb::class_<dfs_core::Triangular>(m, "Triangular")
      .def(nb::init<>())
      .def(nb::init<double, double, double>())
      .def_rw("low", &dfs_core::Triangular::low)
      .def_rw("mode", &dfs_core::Triangular::mode)
      .def_rw("high", &dfs_core::Triangular::high)
      .def("mean", &dfs_core::Triangular::mean)
      .def("variance", &dfs_core::Triangular::variance)
      .def("quantile", &dfs_core::Triangular::quantile)
      .def_static("with_mean", &dfs_core::Triangular::with_mean, "low"_a,
                  "mean"_a, "high"_a)
      .def("__repr__", [](const dfs_core::Triangular &t) {
        return fmt::format("Triangular(low={}, mode={}, high={})", t.low,
                           t.mode, t.high);
      });

  // Correlation
  nb::class_<dfs_core::CorrelationEntry>(m, "CorrelationEntry")
      .def(nb::init<>())
      .def(nb::init<std::string, std::string, double, std::string>(),
           "player_a"_a, "player_b"_a, "coefficient"_a, "reason"_a = "")
      .def_rw("player_a", &dfs_core::CorrelationEntry::player_a)
      .def_rw("player_b", &dfs_core::CorrelationEntry::player_b)
      .def_rw("coefficient", &dfs_core::CorrelationEntry::coefficient)
      .def_rw("reason", &dfs_core::CorrelationEntry::reason)
      .def("__repr__", [](const dfs_core::CorrelationEntry &e) {
        return fmt::format("CorrelationEntry({}, {}, {}, reason={})",
                           e.player_a, e.player_b, e.coefficient, e.reason);
      });

  nb::class_<dfs_core::CorrelationRules>(m, "CorrelationRules")
      .def(nb::init<>())
      .def_rw("qb_pass_catcher", &dfs_core::CorrelationRules::qb_pass_catcher)
      .def_rw("qb_rb", &dfs_core::CorrelationRules::qb_rb)
      .def_rw("pass_catchers", &dfs_core::CorrelationRules::pass_catchers)
      .def_rw("bring_back", &dfs_core::CorrelationRules::bring_back)
      .def_rw("rb_own_dst", &dfs_core::CorrelationRules::rb_own_dst)
      .def_rw("dst_vs_qb", &dfs_core::CorrelationRules::dst_vs_qb)
      .def_rw("dst_vs_rb", &dfs_core::CorrelationRules::dst_vs_rb)
      .def_rw("dst_vs_pass_catcher",
              &dfs_core::CorrelationRules::dst_vs_pass_catcher);
  m.def("heuristic_entries", &dfs_core::heuristic_entries);

  nb::class_<dfs_core::CorrelationBuildConfig>(m, "CorrelationBuildConfig")
      .def(nb::init<>())
      .def_rw("min_eigenvalue", &dfs_core::CorrelationBuildConfig::min_eigenvalue)
      .def_rw("max_iterations", &dfs_core::CorrelationBuildConfig::max_iterations);

  nb::class_<dfs_core::CorrelationAdjustment>(m, "CorrelationAdjustment")
      .def(nb::init<>())
      .def_rw("adjusted", &dfs_core::CorrelationAdjustment::adjusted)
      .def_rw("min_eigenvalue_before",
              &dfs_core::CorrelationAdjustment::min_eigenvalue_before)
      .def_rw("max_abs_change", &dfs_core::CorrelationAdjustment::max_abs_change)
      .def_rw("iterations", &dfs_core::CorrelationAdjustment::iterations);

  nb::class_<dfs_core::CorrelationMatrix>(m, "CorrelationMatrix")
      .def(nb::init<>())
      .def_static("build", &dfs_core::CorrelationMatrix::build, "pool"_a,
                  "entries"_a, "cfg"_a = dfs_core::CorrelationBuildConfig{})
      .def_static("independent", &dfs_core::CorrelationMatrix::independent)
      .def("size", &dfs_core::CorrelationMatrix::size)
      .def("at", &dfs_core::CorrelationMatrix::at)
      .def("matrix", &dfs_core::CorrelationMatrix::matrix)
      .def("cholesky", &dfs_core::CorrelationMatrix::cholesky)
      .def("adjustment", &dfs_core::CorrelationMatrix::adjustment);

  // Constraints
  nb::class_<dfs_core::StackRule>(m, "StackRule")
      .def(nb::init<>())
      .def_rw("name", &dfs_core::StackRule::name)
      .def_rw("player_ids", &dfs_core::StackRule::player_ids)
      .def_rw("team", &dfs_core::StackRule::team)
      .def_rw("positions", &dfs_core::StackRule::positions)
      .def_rw("min_count", &dfs_core::StackRule::min_count)
      .def_rw("max_count", &dfs_core::StackRule::max_count)
      .def_rw("bring_back_min", &dfs_core::StackRule::bring_back_min)
      .def_rw("bring_back_positions",
              &dfs_core::StackRule::bring_back_positions);

  nb::class_<dfs_core::Constraints>(m, "Constraints")
      .def(nb::init<>())
      .def_rw("salary_cap", &dfs_core::Constraints::salary_cap)
      .def_rw("salary_floor", &dfs_core::Constraints::salary_floor)
      .def_rw("max_per_team", &dfs_core::Constraints::max_per_team)
      .def_rw("min_games", &dfs_core::Constraints::min_games)
      .def_rw("min_unique", &dfs_core::Constraints::min_unique)
      .def_rw("locked_ids", &dfs_core::Constraints::locked_ids)
      .def_rw("banned_ids", &dfs_core::Constraints::banned_ids)
      .def_rw("stacks", &dfs_core::Constraints::stacks);

  // Lineups
  nb::class_<dfs_core::SlotAssignment>(m, "SlotAssignment")
      .def(nb::init<>())
      .def_rw("slot_name", &dfs_core::SlotAssignment::slot_name)
      .def_rw("slot_index", &dfs_core::SlotAssignment::slot_index)
      .def_rw("player_id", &dfs_core::SlotAssignment::player_id)
      .def_rw("pool_index", &dfs_core::SlotAssignment::pool_index);

  nb::class_<dfs_core::Lineup>(m, "Lineup")
      .def(nb::init<>())
      .def_rw("id", &dfs_core::Lineup::id)
      .def_rw("generation_index", &dfs_core::Lineup::generation_index)
      .def_rw("slots", &dfs_core::Lineup::slots)
      .def_rw("total_salary", &dfs_core::Lineup::total_salary)
      .def_rw("total_projection", &dfs_core::Lineup::total_projection)
      .def_rw("objective_value", &dfs_core::Lineup::objective_value)
      .def_rw("proven_optimal", &dfs_core::Lineup::proven_optimal)
      .def_rw("stack_label", &dfs_core::Lineup::stack_label)
      .def("player_ids", &dfs_core::Lineup::player_ids)
      .def("__repr__", [](const dfs_core::Lineup &l) {
        return fmt::format("Lineup(id={}, salary={}, projection={:.2f}, "
                           "players=[{}])",
                           l.id, l.total_salary, l.total_projection,
                           fmt::join(l.player_ids(), ", "));
      });

  // Optimizer
  nb::class_<dfs_core::OptimizerConfig>(m, "OptimizerConfig")
      .def(nb::init<>())
      .def_rw("objective", &dfs_core::OptimizerConfig::objective)
      .def_rw("leverage_weight", &dfs_core::OptimizerConfig::leverage_weight)
      .def_rw("num_lineups", &dfs_core::OptimizerConfig::num_lineups)
      .def_rw("randomness", &dfs_core::OptimizerConfig::randomness)
      .def_rw("max_exposure", &dfs_core::OptimizerConfig::max_exposure)
      .def_rw("player_max_exposure",
              &dfs_core::OptimizerConfig::player_max_exposure)
      .def_rw("time_limit_seconds",
              &dfs_core::OptimizerConfig::time_limit_seconds)
      .def_rw("max_nodes", &dfs_core::OptimizerConfig::max_nodes)
      .def_rw("solver_backend", &dfs_core::OptimizerConfig::solver_backend)
      .def_rw("seed", &dfs_core::OptimizerConfig::seed)
      .def_rw("log_level", &dfs_core::OptimizerConfig::log_level);

  nb::class_<dfs_core::BatchTransition>(m, "BatchTransition")
      .def_ro("state", &dfs_core::BatchTransition::state)
      .def_ro("lineup_index", &dfs_core::BatchTransition::lineup_index)
      .def_ro("detail", &dfs_core::BatchTransition::detail);

  nb::class_<dfs_core::StackUsage>(m, "StackUsage")
      .def_ro("label", &dfs_core::StackUsage::label)
      .def_ro("count", &dfs_core::StackUsage::count)
      .def_ro("percentage", &dfs_core::StackUsage::percentage);

  nb::class_<dfs_core::BatchResult>(m, "BatchResult")
      .def_ro("lineups", &dfs_core::BatchResult::lineups)
      .def_ro("requested", &dfs_core::BatchResult::requested)
      .def_ro("delivered", &dfs_core::BatchResult::delivered)
      .def_ro("complete", &dfs_core::BatchResult::complete)
      .def_ro("reason", &dfs_core::BatchResult::reason)
      .def_ro("infeasibility", &dfs_core::BatchResult::infeasibility)
      .def_ro("transitions", &dfs_core::BatchResult::transitions)
      .def_ro("stack_summary", &dfs_core::BatchResult::stack_summary)
      .def("__repr__", [](const dfs_core::BatchResult &b) {
        return fmt::format("BatchResult(requested={}, delivered={}, reason={})",
                           b.requested, b.delivered, b.reason);
      });

  nb::class_<dfs_core::LineupOptimizer>(m, "LineupOptimizer")
      .def(nb::init<const dfs_core::PlayerPool &, const dfs_core::RosterSpec &,
                    const dfs_core::Constraints &, dfs_core::OptimizerConfig>(),
           nb::keep_alive<1, 2>())
      .def("objective_values", &dfs_core::LineupOptimizer::objective_values)
      .def("check_feasibility", &dfs_core::LineupOptimizer::check_feasibility)
      .def("solve_one", &dfs_core::LineupOptimizer::solve_one, "prior"_a,
           "generation_index"_a = -1,
           nb::call_guard<nb::gil_scoped_release>())
      .def("generate", &dfs_core::LineupOptimizer::generate,
           "num_lineups"_a = -1, "cancel"_a = nullptr,
           nb::call_guard<nb::gil_scoped_release>());

  m.def("classify_stack", &dfs_core::classify_stack, "lineup"_a, "pool"_a);
  m.def("summarize_stacks", &dfs_core::summarize_stacks, "lineups"_a);

  // Field + simulation
  nb::class_<dfs_core::FieldConfig>(m, "FieldConfig")
      .def(nb::init<>())
      .def_rw("n_lineups", &dfs_core::FieldConfig::n_lineups)
      .def_rw("seed", &dfs_core::FieldConfig::seed)
      .def_rw("salary_cap", &dfs_core::FieldConfig::salary_cap)
      .def_rw("ownership_floor", &dfs_core::FieldConfig::ownership_floor)
      .def_rw("max_attempts", &dfs_core::FieldConfig::max_attempts);

  nb::class_<dfs_core::OpponentField>(m, "OpponentField")
      .def(nb::init<>())
      .def_rw("lineups", &dfs_core::OpponentField::lineups)
      .def_rw("failed", &dfs_core::OpponentField::failed)
      .def("size", &dfs_core::OpponentField::size);

  nb::class_<dfs_core::FieldGenerator>(m, "FieldGenerator")
      .def(nb::init<const dfs_core::PlayerPool &, const dfs_core::RosterSpec &>(),
           nb::keep_alive<1, 2>())
      .def("generate", &dfs_core::FieldGenerator::generate);

  nb::class_<dfs_core::PayoutTier>(m, "PayoutTier")
      .def(nb::init<>())
      .def_rw("min_rank", &dfs_core::PayoutTier::min_rank)
      .def_rw("max_rank", &dfs_core::PayoutTier::max_rank)
      .def_rw("amount", &dfs_core::PayoutTier::amount);

  nb::class_<dfs_core::ContestConfig>(m, "ContestConfig")
      .def(nb::init<>())
      .def_rw("type", &dfs_core::ContestConfig::type)
      .def_rw("sport", &dfs_core::ContestConfig::sport)
      .def_rw("field_size", &dfs_core::ContestConfig::field_size)
      .def_rw("entry_fee", &dfs_core::ContestConfig::entry_fee)
      .def_rw("rake", &dfs_core::ContestConfig::rake)
      .def_rw("payouts", &dfs_core::ContestConfig::payouts);

  nb::class_<dfs_core::SimulationConfig>(m, "SimulationConfig")
      .def(nb::init<>())
      .def_rw("trials", &dfs_core::SimulationConfig::trials)
      .def_rw("seed", &dfs_core::SimulationConfig::seed)
      .def_rw("mode", &dfs_core::SimulationConfig::mode)
      .def_rw("clamp_negative", &dfs_core::SimulationConfig::clamp_negative)
      .def_rw("chunk_size", &dfs_core::SimulationConfig::chunk_size)
      .def_rw("histogram_bins", &dfs_core::SimulationConfig::histogram_bins)
      .def_rw("threads", &dfs_core::SimulationConfig::threads)
      .def_rw("target_score", &dfs_core::SimulationConfig::target_score)
      .def_rw("cash_line", &dfs_core::SimulationConfig::cash_line)
      .def_rw("boom_line", &dfs_core::SimulationConfig::boom_line)
      .def_rw("max_trials", &dfs_core::SimulationConfig::max_trials)
      .def_rw("max_memory_bytes", &dfs_core::SimulationConfig::max_memory_bytes)
      .def_rw("max_seconds", &dfs_core::SimulationConfig::max_seconds)
      .def_rw("log_level", &dfs_core::SimulationConfig::log_level);

  nb::class_<dfs_core::SimulationResult>(m, "SimulationResult")
      .def_ro("lineup_id", &dfs_core::SimulationResult::lineup_id)
      .def_ro("mean", &dfs_core::SimulationResult::mean)
      .def_ro("stdev", &dfs_core::SimulationResult::stdev)
      .def_ro("p5", &dfs_core::SimulationResult::p5)
      .def_ro("p25", &dfs_core::SimulationResult::p25)
      .def_ro("p50", &dfs_core::SimulationResult::p50)
      .def_ro("p75", &dfs_core::SimulationResult::p75)
      .def_ro("p95", &dfs_core::SimulationResult::p95)
      .def_ro("min", &dfs_core::SimulationResult::min)
      .def_ro("max", &dfs_core::SimulationResult::max)
      .def_ro("target_probability",
              &dfs_core::SimulationResult::target_probability)
      .def_ro("cash_rate", &dfs_core::SimulationResult::cash_rate)
      .def_ro("boom_rate", &dfs_core::SimulationResult::boom_rate)
      .def_ro("win_probability", &dfs_core::SimulationResult::win_probability)
      .def_ro("expected_payout", &dfs_core::SimulationResult::expected_payout)
      .def_ro("roi", &dfs_core::SimulationResult::roi)
      .def("__repr__", [](const dfs_core::SimulationResult &r) {
        return fmt::format("SimulationResult(lineup_id={}, mean={:.2f}, "
                           "stdev={:.2f}, p50={:.2f}, win={:.4f}, roi={:.3f})",
                           r.lineup_id, r.mean, r.stdev, r.p50,
                           r.win_probability, r.roi);
      });

  nb::class_<dfs_core::PlayerSimMetrics>(m, "PlayerSimMetrics")
      .def_ro("player_id", &dfs_core::PlayerSimMetrics::player_id)
      .def_ro("mean", &dfs_core::PlayerSimMetrics::mean)
      .def_ro("stdev", &dfs_core::PlayerSimMetrics::stdev)
      .def_ro("boom_rate", &dfs_core::PlayerSimMetrics::boom_rate)
      .def_ro("bust_rate", &dfs_core::PlayerSimMetrics::bust_rate);

  nb::class_<dfs_core::SimulationReport>(m, "SimulationReport")
      .def_ro("trials_requested", &dfs_core::SimulationReport::trials_requested)
      .def_ro("trials_run", &dfs_core::SimulationReport::trials_run)
      .def_ro("seed", &dfs_core::SimulationReport::seed)
      .def_ro("mode", &dfs_core::SimulationReport::mode)
      .def_ro("elapsed_seconds", &dfs_core::SimulationReport::elapsed_seconds)
      .def_ro("chunks", &dfs_core::SimulationReport::chunks)
      .def_ro("cancelled", &dfs_core::SimulationReport::cancelled)
      .def_ro("target_score", &dfs_core::SimulationReport::target_score)
      .def_ro("cash_line", &dfs_core::SimulationReport::cash_line)
      .def_ro("boom_line", &dfs_core::SimulationReport::boom_line)
      .def_ro("field_lineups", &dfs_core::SimulationReport::field_lineups)
      .def_ro("correlation", &dfs_core::SimulationReport::correlation)
      .def_ro("results", &dfs_core::SimulationReport::results)
      .def_ro("players", &dfs_core::SimulationReport::players);

  nb::class_<dfs_core::SimulationEngine>(m, "SimulationEngine")
      .def(nb::init<const dfs_core::PlayerPool &,
                    const dfs_core::CorrelationMatrix &,
                    dfs_core::SimulationConfig, dfs_core::ContestConfig>(),
           "pool"_a, "corr"_a, "cfg"_a,
           "contest"_a = dfs_core::ContestConfig{}, nb::keep_alive<1, 2>(),
           nb::keep_alive<1, 3>())
      .def("run", &dfs_core::SimulationEngine::run, "lineups"_a,
           "field"_a = dfs_core::OpponentField{}, "cancel"_a = nullptr,
           nb::call_guard<nb::gil_scoped_release>())
      .def("sample_chunk", &dfs_core::SimulationEngine::sample_chunk)
      .def("analytic_mean", &dfs_core::SimulationEngine::analytic_mean)
      .def("analytic_stdev", &dfs_core::SimulationEngine::analytic_stdev);

  // Portfolio
  nb::class_<dfs_core::ExposureTarget>(m, "ExposureTarget")
      .def(nb::init<>())
      .def_rw("player_id", &dfs_core::ExposureTarget::player_id)
      .def_rw("min_exposure", &dfs_core::ExposureTarget::min_exposure)
      .def_rw("max_exposure", &dfs_core::ExposureTarget::max_exposure);

  nb::class_<dfs_core::PortfolioThresholds>(m, "PortfolioThresholds")
      .def(nb::init<>())
      .def_rw("min_roi", &dfs_core::PortfolioThresholds::min_roi)
      .def_rw("min_win_probability",
              &dfs_core::PortfolioThresholds::min_win_probability)
      .def_rw("max_duplicate_risk",
              &dfs_core::PortfolioThresholds::max_duplicate_risk)
      .def_rw("min_leverage", &dfs_core::PortfolioThresholds::min_leverage)
      .def_rw("max_total_ownership",
              &dfs_core::PortfolioThresholds::max_total_ownership)
      .def_rw("field_size", &dfs_core::PortfolioThresholds::field_size)
      .def_rw("log_level", &dfs_core::PortfolioThresholds::log_level);

  nb::class_<dfs_core::ExcludedLineup>(m, "ExcludedLineup")
      .def_ro("lineup_id", &dfs_core::ExcludedLineup::lineup_id)
      .def_ro("reason", &dfs_core::ExcludedLineup::reason);

  nb::class_<dfs_core::UnmetMinimum>(m, "UnmetMinimum")
      .def_ro("player_id", &dfs_core::UnmetMinimum::player_id)
      .def_ro("target", &dfs_core::UnmetMinimum::target)
      .def_ro("achieved", &dfs_core::UnmetMinimum::achieved);

  nb::class_<dfs_core::FilterResult>(m, "FilterResult")
      .def_ro("kept", &dfs_core::FilterResult::kept)
      .def_ro("excluded", &dfs_core::FilterResult::excluded)
      .def_ro("exposure", &dfs_core::FilterResult::exposure)
      .def_ro("unmet_minimums", &dfs_core::FilterResult::unmet_minimums);

  nb::class_<dfs_core::PortfolioFilter>(m, "PortfolioFilter")
      .def(nb::init<const dfs_core::PlayerPool &>(), nb::keep_alive<1, 2>())
      .def("filter", &dfs_core::PortfolioFilter::filter);
}
