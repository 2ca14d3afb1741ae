#include "settings_resolver.hpp"

#include "internal/observability/logging.hpp"
#include "internal/settings/rate_normalizer.hpp"

namespace proposal::settings {

using registry::TaskId;

SettingsResolver::SettingsResolver(const proposal::runtime::config::RuntimeConfig& config)
    : defaults_(config.settings().default_rates().begin(), config.settings().default_rates().end()),
      currency_(config.settings().currency()),
      instructions_(config.settings().instructions()) {}

Resolution SettingsResolver::Resolve(const routing::ExtractedSettings& extracted,
                                     const session::ScopedSettings& remembered) const {
  Resolution resolution;
  resolution.remembered = remembered;

  const auto fresh = NormalizeRates(extracted.rates);
  for (const auto& [role, hourly] : fresh) {
    resolution.remembered.rates[role] = hourly;
  }
  resolution.rates_changed = !fresh.empty();

  if (extracted.budget) {
    resolution.remembered.budget = extracted.budget;
    resolution.budget_changed    = true;
  }
  if (extracted.timeline) {
    resolution.remembered.timeline = extracted.timeline;
    resolution.timeline_changed    = true;
  }

  auto& settings        = resolution.settings;
  settings.rates        = defaults_;
  settings.currency     = currency_;
  settings.instructions = instructions_;
  for (const auto& [role, hourly] : resolution.remembered.rates) {
    settings.rates[role] = hourly;
  }
  settings.budget   = resolution.remembered.budget;
  settings.timeline = resolution.remembered.timeline;
  return resolution;
}

void SettingsResolver::InjectConstraints(routing::RoutingDecision& decision, const Resolution& resolution) {
  bool injected = false;

  if (resolution.rates_changed) {
    decision.task_ids.Insert(TaskId::kResourceAllocation);
    injected = true;
  }
  if (resolution.budget_changed || resolution.timeline_changed) {
    decision.task_ids.Insert(TaskId::kProjectManager);
    injected = true;
  }
  if (resolution.budget_changed) {
    decision.task_ids.Insert(TaskId::kResourceAllocation);
  }

  if (injected && decision.action != routing::Action::kGenerate) {
    decision.action = routing::Action::kEdit;
  }
}

ResolvedSettings SettingsResolver::Apply(routing::RoutingDecision& decision, session::Session& session) const {
  auto resolution = Resolve(decision.extracted_settings, session.ScopedState());

  if (resolution.rates_changed || resolution.budget_changed || resolution.timeline_changed) {
    session.SetScopedState(resolution.remembered);
    if (!session.Save()) {
      PROPOSAL_LOG_WARN("session save after settings update failed");
    }
    PROPOSAL_LOG_INFO("settings updated",
                      {observability::BoolField("rates", resolution.rates_changed),
                       observability::BoolField("budget", resolution.budget_changed),
                       observability::BoolField("timeline", resolution.timeline_changed)});
  }

  InjectConstraints(decision, resolution);
  return std::move(resolution.settings);
}

void SettingsResolver::ApplyToState(const ResolvedSettings& settings, state::ProjectState& state) {
  auto& rates = *state.mutable_rates();
  for (const auto& [role, hourly] : settings.rates) {
    rates[role] = hourly;
  }
  state.set_currency(settings.currency);
  state.set_instructions(settings.instructions);
  state.set_budget(settings.budget.value_or(""));
  state.set_timeline(settings.timeline.value_or(""));
}

} // namespace proposal::settings
