#include "pipeaudit/scheduler/systemd_task_query.h"

#include "pipeaudit/core/text.h"
#include "pipeaudit/core/time.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>

namespace pipeaudit::scheduler {

namespace {

using TaskList = core::Result<std::vector<ScheduledTask>, std::string>;

std::string string_field(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

// list-timers reports "last" in microseconds since the epoch; 0 or null means never.
std::string last_run_from_usec(const nlohmann::json& obj) {
  auto it = obj.find("last");
  if (it == obj.end() || !it->is_number()) {
    return "never";
  }
  const auto usec = it->get<std::int64_t>();
  if (usec <= 0) {
    return "never";
  }
  return core::format_iso8601_utc(core::from_unix_seconds(usec / 1000000));
}

std::string strip_suffix(const std::string& name, std::string_view suffix) {
  if (name.size() > suffix.size() && name.ends_with(suffix)) {
    return name.substr(0, name.size() - suffix.size());
  }
  return name;
}

}  // namespace

TaskList parse_timer_listing(const std::string& json_text, const std::string& pattern) {
  nlohmann::json listing;
  try {
    listing = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    return TaskList::err(std::string("unparsable timer listing: ") + e.what());
  }
  if (!listing.is_array()) {
    return TaskList::err("unexpected timer listing: not an array");
  }

  std::vector<ScheduledTask> tasks;
  for (const auto& timer : listing) {
    if (!timer.is_object()) {
      continue;
    }
    const std::string unit = string_field(timer, "unit");
    const std::string activates = string_field(timer, "activates");
    if (!core::contains_ascii_ci(unit, pattern) && !core::contains_ascii_ci(activates, pattern)) {
      continue;
    }

    ScheduledTask task;
    task.name = strip_suffix(activates.empty() ? unit : activates, ".service");
    task.state = "unknown";
    task.last_run_time = last_run_from_usec(timer);
    task.triggers.push_back(unit);
    tasks.push_back(std::move(task));
  }
  return TaskList::ok(std::move(tasks));
}

std::map<std::string, std::string> parse_unit_properties(const std::string& text) {
  std::map<std::string, std::string> props;
  for (const auto& line : core::split_lines(text)) {
    const auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    props[line.substr(0, eq)] = core::trim(line.substr(eq + 1));
  }
  return props;
}

TaskList SystemdTaskQuery::list_tasks(const std::string& pattern) {
  process::SubprocessRequest listing_request;
  listing_request.program = "systemctl";
  listing_request.args = {"list-timers", "--all", "--output=json", "--no-pager"};
  listing_request.timeout = kQueryTimeout;

  auto listing = runner_.run(listing_request);
  if (!listing.has_value()) {
    return TaskList::err(listing.error());
  }
  if (listing.value().timed_out || listing.value().exit_code != 0) {
    return TaskList::err("systemctl list-timers exited with code " +
                         std::to_string(listing.value().exit_code));
  }

  auto tasks = parse_timer_listing(listing.value().stdout_text, pattern);
  if (!tasks.has_value()) {
    return tasks;
  }

  for (auto& task : tasks.value()) {
    process::SubprocessRequest show_request;
    show_request.program = "systemctl";
    show_request.args = {"show", task.name + ".service",
                         "--property=ActiveState,ExecMainStatus,ExecMainExitTimestamp",
                         "--no-pager"};
    show_request.timeout = kQueryTimeout;

    auto show = runner_.run(show_request);
    if (!show.has_value() || show.value().exit_code != 0) {
      continue;  // listing data stands on its own
    }
    const auto props = parse_unit_properties(show.value().stdout_text);
    if (auto it = props.find("ActiveState"); it != props.end() && !it->second.empty()) {
      task.state = it->second;
    }
    if (auto it = props.find("ExecMainStatus"); it != props.end() && !it->second.empty()) {
      char* end = nullptr;
      const long code = std::strtol(it->second.c_str(), &end, 10);
      if (end != nullptr && *end == '\0') {
        task.last_result = static_cast<int>(code);
      }
    }
  }

  std::sort(tasks.value().begin(), tasks.value().end(),
            [](const ScheduledTask& a, const ScheduledTask& b) { return a.name < b.name; });
  return tasks;
}

}  // namespace pipeaudit::scheduler
