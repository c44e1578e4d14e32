#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace depconf {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_state(std::string &out, char const *key, internal_state state) {
  append_kv(out, key, internal_state_name(state));

  char number_key[64]{};
  std::snprintf(number_key, sizeof number_key, "%s_num", key);
  append_kv(out, number_key, static_cast<std::int64_t>(static_cast<int>(state)));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(identifier_interned),
          TRACE_NAME(state_observed),
          TRACE_NAME(dependency_actions_run),
          TRACE_NAME(configuration_locked),
          TRACE_NAME(mutation_rejected),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::identifier_interned const &value) {
            std::ostringstream oss;
            oss << "identifier_interned group=" << value.group << " name=" << value.name;
            return oss.str();
          },
          [](trace_events::state_observed const &value) {
            std::ostringstream oss;
            oss << "state_observed configuration=" << value.configuration
                << " old_state=" << internal_state_name(value.old_state)
                << " new_state=" << internal_state_name(value.new_state);
            return oss.str();
          },
          [](trace_events::dependency_actions_run const &value) {
            std::ostringstream oss;
            oss << "dependency_actions_run configuration=" << value.configuration
                << " action_count=" << value.action_count;
            return oss.str();
          },
          [](trace_events::configuration_locked const &value) {
            std::ostringstream oss;
            oss << "configuration_locked configuration=" << value.configuration
                << " failure_count=" << value.failure_count;
            return oss.str();
          },
          [](trace_events::mutation_rejected const &value) {
            std::ostringstream oss;
            oss << "mutation_rejected configuration=" << value.configuration
                << " mutation=" << value.mutation << " reason=" << value.reason;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  auto const append_configuration{ [&](std::string_view value) {
    append_kv(output, "configuration", value);
  } };

  std::visit(
      match{
          [&](trace_events::identifier_interned const &value) {
            append_kv(output, "group", value.group);
            append_kv(output, "name", value.name);
          },
          [&](trace_events::state_observed const &value) {
            append_configuration(value.configuration);
            append_state(output, "old_state", value.old_state);
            append_state(output, "new_state", value.new_state);
          },
          [&](trace_events::dependency_actions_run const &value) {
            append_configuration(value.configuration);
            append_kv(output, "action_count", value.action_count);
          },
          [&](trace_events::configuration_locked const &value) {
            append_configuration(value.configuration);
            append_kv(output, "failure_count", value.failure_count);
          },
          [&](trace_events::mutation_rejected const &value) {
            append_configuration(value.configuration);
            append_kv(output, "mutation", value.mutation);
            append_kv(output, "reason", value.reason);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace depconf
