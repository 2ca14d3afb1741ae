#pragma once

#include <map>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/routing/routing_decision.hpp"
#include "internal/session/session.hpp"
#include "internal/state/project_state.hpp"

namespace proposal::settings {

struct ResolvedSettings {
  std::map<std::string, double> rates;
  std::string                   currency;
  std::string                   instructions;
  std::optional<std::string>    budget;
  std::optional<std::string>    timeline;
};

/*
  Result of one merge. `remembered` is what the session should keep for
  later turns; the *_changed flags say which constraints this turn
  brought in.
*/
struct Resolution {
  ResolvedSettings        settings;
  session::ScopedSettings remembered;
  bool                    rates_changed    = false;
  bool                    budget_changed   = false;
  bool                    timeline_changed = false;
};

/*
  Layers settings in ascending priority:

      configured defaults < session-remembered < extracted this turn

  Budget and timeline only live in the session slot and never reach the
  configured defaults.
*/
class SettingsResolver {
 public:
  explicit SettingsResolver(const proposal::runtime::config::RuntimeConfig& config);

  Resolution Resolve(const routing::ExtractedSettings& extracted, const session::ScopedSettings& remembered) const;

  // Resolve + remember in `session` + InjectConstraints.
  ResolvedSettings Apply(routing::RoutingDecision& decision, session::Session& session) const;

  /*
    New rates add resource_allocation; a new budget or timeline adds
    project_manager; a new budget also adds resource_allocation. Any of
    them forces kEdit unless the decision already is kGenerate.
  */
  static void InjectConstraints(routing::RoutingDecision& decision, const Resolution& resolution);

  static void ApplyToState(const ResolvedSettings& settings, state::ProjectState& state);

 private:
  std::map<std::string, double> defaults_;
  std::string                   currency_;
  std::string                   instructions_;
};

} // namespace proposal::settings
