#include "pipeaudit/report/report_assembler.h"

#include "pipeaudit/core/version.h"
#include "pipeaudit/fs/filesystem.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace pipeaudit::report {

namespace {

constexpr int kMaxNameAttempts = 1000;

using WriteResult = core::Result<std::string, std::string>;

std::string candidate_name(const std::string& base_name, int attempt) {
  if (attempt == 0) {
    return base_name;
  }
  const std::string stem = base_name.substr(0, base_name.size() - 5);  // drop ".json"
  return stem + "_" + std::to_string(attempt) + ".json";
}

// Writes the whole body to a freshly created file. Returns errno on failure.
int write_exclusive(const std::string& path, const std::string& body) {
  const int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    return errno;
  }

  std::size_t offset = 0;
  while (offset < body.size()) {
    const ssize_t n = ::write(fd, body.data() + offset, body.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int code = errno;
      ::close(fd);
      ::unlink(path.c_str());
      return code;
    }
    offset += static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    const int code = errno;
    ::unlink(path.c_str());
    return code;
  }
  return 0;
}

}  // namespace

nlohmann::json finding_to_json(const audit::Finding& finding) {
  return nlohmann::json{
      {"level", std::string(audit::to_string(finding.level))},
      {"kind", std::string(audit::to_string(finding.kind))},
      {"resource_id", finding.resource_id},
      {"message", finding.message},
      {"produced_at", finding.produced_at},
  };
}

nlohmann::json report_to_json(const audit::AuditReport& report) {
  const auto counts = audit::count_levels(report.findings);

  nlohmann::json findings = nlohmann::json::array();
  for (const auto& finding : report.findings) {
    findings.push_back(finding_to_json(finding));
  }

  nlohmann::json doc;
  doc["format"] = core::kReportFormat;
  doc["version"] = core::kBuildVersion;
  doc["run_id"] = report.run_id;
  doc["started_at"] = report.started_at;
  doc["completed_at"] = report.completed_at;
  doc["root"] = report.root;
  doc["status"] = std::string(audit::to_string(audit::compute_status(report.findings)));
  doc["counts"] = {
      {"OK", counts.ok}, {"INFO", counts.info}, {"WARN", counts.warn}, {"ERROR", counts.error}};
  doc["findings"] = std::move(findings);
  doc["stages"] = report.stage_detail;
  return doc;
}

std::string render_report(const audit::AuditReport& report, const int indent) {
  return report_to_json(report).dump(indent, ' ', false,
                                     nlohmann::json::error_handler_t::replace);
}

std::string report_file_name(const core::Timestamp started_at) {
  return "audit_" + core::format_file_stamp_utc(started_at) + ".json";
}

WriteResult write_report(audit::AuditReport& report, const std::string& out_dir,
                         const core::Timestamp started_at) {
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    return WriteResult::err("cannot create report directory " + out_dir + ": " + ec.message());
  }

  const std::string base_name = report_file_name(started_at);
  const std::string base_run_id = report.run_id;

  for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
    report.run_id = attempt == 0 ? base_run_id : base_run_id + "_" + std::to_string(attempt);
    const std::string path = fs::join_path(out_dir, candidate_name(base_name, attempt));
    const int code = write_exclusive(path, render_report(report) + "\n");
    if (code == 0) {
      return WriteResult::ok(path);
    }
    if (code != EEXIST) {
      report.run_id = base_run_id;
      return WriteResult::err("cannot write report " + path + ": " + std::strerror(code));
    }
  }
  report.run_id = base_run_id;
  return WriteResult::err("cannot write report in " + out_dir + ": too many reports for " +
                          base_name);
}

}  // namespace pipeaudit::report
