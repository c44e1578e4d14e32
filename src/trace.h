#pragma once

#include "internal_state.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace depconf {

namespace trace_events {

struct identifier_interned {
  std::string group;
  std::string name;
};

struct state_observed {
  std::string configuration;
  internal_state old_state;
  internal_state new_state;
};

struct dependency_actions_run {
  std::string configuration;
  std::int64_t action_count;
};

struct configuration_locked {
  std::string configuration;
  std::int64_t failure_count;
};

struct mutation_rejected {
  std::string configuration;
  std::string mutation;
  std::string reason;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::identifier_interned,
                                   trace_events::state_observed,
                                   trace_events::dependency_actions_run,
                                   trace_events::configuration_locked,
                                   trace_events::mutation_rejected>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace depconf

#define DEPCONF_TRACE_UNLIKELY [[unlikely]]

#define DEPCONF_TRACE_EMIT(event_expr) \
  do { \
    if (::depconf::tui::g_trace_enabled) DEPCONF_TRACE_UNLIKELY { \
        ::depconf::tui::trace event_expr; \
      } \
  } while (0)

#define DEPCONF_TRACE_IDENTIFIER_INTERNED(group_value, name_value) \
  DEPCONF_TRACE_EMIT((::depconf::trace_events::identifier_interned{ \
      .group = (group_value), \
      .name = (name_value), \
  }))

#define DEPCONF_TRACE_STATE_OBSERVED(configuration_value, old_value, new_value) \
  DEPCONF_TRACE_EMIT((::depconf::trace_events::state_observed{ \
      .configuration = (configuration_value), \
      .old_state = (old_value), \
      .new_state = (new_value), \
  }))

#define DEPCONF_TRACE_DEPENDENCY_ACTIONS_RUN(configuration_value, count_value) \
  DEPCONF_TRACE_EMIT((::depconf::trace_events::dependency_actions_run{ \
      .configuration = (configuration_value), \
      .action_count = static_cast<std::int64_t>(count_value), \
  }))

#define DEPCONF_TRACE_CONFIGURATION_LOCKED(configuration_value, failures_value) \
  DEPCONF_TRACE_EMIT((::depconf::trace_events::configuration_locked{ \
      .configuration = (configuration_value), \
      .failure_count = static_cast<std::int64_t>(failures_value), \
  }))

#define DEPCONF_TRACE_MUTATION_REJECTED(configuration_value, mutation_value, reason_value) \
  DEPCONF_TRACE_EMIT((::depconf::trace_events::mutation_rejected{ \
      .configuration = (configuration_value), \
      .mutation = (mutation_value), \
      .reason = (reason_value), \
  }))
