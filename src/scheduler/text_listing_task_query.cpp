#include "pipeaudit/scheduler/text_listing_task_query.h"

#include "pipeaudit/core/text.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>

namespace pipeaudit::scheduler {

namespace {

using TaskList = core::Result<std::vector<ScheduledTask>, std::string>;

std::vector<std::string> split_whitespace(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> tokens;
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

bool is_date_token(const std::string& token) {
  // YYYY-MM-DD
  if (token.size() != 10 || token[4] != '-' || token[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < token.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(token[i])) == 0) {
      return false;
    }
  }
  return true;
}

core::Result<std::string, std::string> run_listing(process::ISubprocessRunner& runner,
                                                   const std::string& program,
                                                   std::vector<std::string> args) {
  using R = core::Result<std::string, std::string>;

  process::SubprocessRequest request;
  request.program = program;
  request.args = std::move(args);
  request.timeout = kQueryTimeout;

  auto run = runner.run(request);
  if (!run.has_value()) {
    return R::err(run.error());
  }
  if (run.value().timed_out || run.value().exit_code != 0) {
    return R::err(program + " exited with code " + std::to_string(run.value().exit_code));
  }
  return R::ok(run.value().stdout_text);
}

}  // namespace

std::vector<ScheduledTask> scan_timer_text(const std::string& text, const std::string& pattern) {
  std::vector<ScheduledTask> tasks;
  for (const auto& line : core::split_lines(text)) {
    if (!core::contains_ascii_ci(line, pattern)) {
      continue;
    }
    const auto tokens = split_whitespace(line);

    ScheduledTask task;
    task.state = "unknown";
    task.last_run_time = "unknown";

    std::vector<std::string> stamps;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
      if (tokens[i].ends_with(".timer")) {
        task.triggers.push_back(tokens[i]);
        if (task.name.empty()) {
          task.name = tokens[i].substr(0, tokens[i].size() - 6);
        }
      } else if (tokens[i].ends_with(".service")) {
        task.name = tokens[i].substr(0, tokens[i].size() - 8);
      } else if (is_date_token(tokens[i]) && i + 1 < tokens.size()) {
        stamps.push_back(tokens[i] + "T" + tokens[i + 1] + "Z");
      }
    }
    // Columns: NEXT LEFT LAST PASSED UNIT ACTIVATES. The second stamp is LAST.
    if (stamps.size() >= 2) {
      task.last_run_time = stamps[1];
    }
    if (task.name.empty()) {
      task.name = core::trim(line);
    }
    tasks.push_back(std::move(task));
  }
  return tasks;
}

std::vector<ScheduledTask> scan_crontab_text(const std::string& text, const std::string& pattern) {
  std::vector<ScheduledTask> tasks;
  for (const auto& raw : core::split_lines(text)) {
    const std::string line = core::trim(raw);
    if (line.empty() || line[0] == '#' || !core::contains_ascii_ci(line, pattern)) {
      continue;
    }
    const auto tokens = split_whitespace(line);
    if (tokens.empty() || tokens[0].find('=') != std::string::npos) {
      continue;
    }

    // "@hourly cmd" or "m h dom mon dow cmd"
    const std::size_t schedule_fields = tokens[0][0] == '@' ? 1 : 5;
    if (tokens.size() <= schedule_fields) {
      continue;
    }
    std::vector<std::string> schedule(tokens.begin(),
                                      tokens.begin() + static_cast<std::ptrdiff_t>(schedule_fields));
    std::vector<std::string> command(tokens.begin() + static_cast<std::ptrdiff_t>(schedule_fields),
                                     tokens.end());

    ScheduledTask task;
    task.name = core::join(command, " ");
    task.state = "cron";
    task.last_run_time = "unknown";
    task.triggers.push_back(core::join(schedule, " "));
    tasks.push_back(std::move(task));
  }
  return tasks;
}

TaskList TextListingTaskQuery::list_tasks(const std::string& pattern) {
  std::vector<ScheduledTask> tasks;
  std::vector<std::string> errors;

  auto timers = run_listing(runner_, "systemctl",
                            {"list-timers", "--all", "--no-pager", "--no-legend"});
  if (timers.has_value()) {
    auto found = scan_timer_text(timers.value(), pattern);
    tasks.insert(tasks.end(), found.begin(), found.end());
  } else {
    errors.push_back(timers.error());
  }

  auto crontab = run_listing(runner_, "crontab", {"-l"});
  if (crontab.has_value()) {
    auto found = scan_crontab_text(crontab.value(), pattern);
    tasks.insert(tasks.end(), found.begin(), found.end());
  } else {
    errors.push_back(crontab.error());
  }

  if (errors.size() == 2) {
    return TaskList::err(core::join(errors, "; "));
  }

  std::stable_sort(tasks.begin(), tasks.end(),
                   [](const ScheduledTask& a, const ScheduledTask& b) { return a.name < b.name; });
  return TaskList::ok(std::move(tasks));
}

}  // namespace pipeaudit::scheduler
