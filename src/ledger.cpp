#include "asteria/ledger.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string_view>

#include "asteria/hash.hpp"
#include "asteria/jsonlite.hpp"
#include "asteria/version.hpp"

namespace asteria {

namespace {

// Always the last field of a line; the embedded report runs to the closing brace.
constexpr std::string_view kReportField = ",\"report\":";

}  // namespace

std::string ledger_entry_to_json(const LedgerEntry& e) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << e.sequence
    << ",\"prev\":\"" << e.previous_digest << "\""
    << ",\"ledger_version\":" << version::LEDGER_FORMAT_VERSION
    << ",\"timestamp_unix_ms\":" << e.timestamp_unix_ms
    << ",\"report_digest\":\"" << e.report_digest << "\""
    << ",\"status\":\"" << to_string(e.status) << "\""
    << kReportField << (e.report_json.empty() ? "{}" : e.report_json)
    << "}";
  return o.str();
}

namespace {

struct Tail {
  std::uint64_t seq{0};
  std::string digest{kLedgerGenesisDigest};
};

// Last non-empty line of an existing ledger. A missing file is an empty ledger.
bool read_tail(const std::string& path, Tail* tail, Error* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return true;
  std::string line, last;
  while (std::getline(ifs, line)) {
    if (!line.empty()) last = line;
  }
  if (last.empty()) return true;

  std::optional<jsonlite::JsonError> jerr;
  const auto obj = jsonlite::parse(last, &jerr);
  const jsonlite::Value* seq = jerr ? nullptr : jsonlite::find(obj, "seq");
  const auto seq_value = seq ? jsonlite::as_int64(*seq) : std::nullopt;
  if (!seq_value || *seq_value < 0) {
    if (error) *error = make_error(ErrorCode::parse_error, "ledger tail is not a valid entry: " + path);
    return false;
  }
  tail->seq = static_cast<std::uint64_t>(*seq_value);
  tail->digest = ledger_entry_hash(last);
  return true;
}

// Checks one line against its position in the file: seq, prev link, the
// report digest and the status the embedded report carries.
bool entry_consistent(const std::string& line, std::uint64_t expected_seq,
                      const std::string& expected_prev) {
  std::optional<jsonlite::JsonError> jerr;
  const auto obj = jsonlite::parse(line, &jerr);
  if (jerr) return false;

  const jsonlite::Value* seq = jsonlite::find(obj, "seq");
  const auto seq_value = seq ? jsonlite::as_int64(*seq) : std::nullopt;
  if (!seq_value || *seq_value < 0 || static_cast<std::uint64_t>(*seq_value) != expected_seq) {
    return false;
  }
  if (jsonlite::get_string(obj, "prev") != expected_prev) return false;

  const std::string digest = jsonlite::get_string(obj, "report_digest");
  const auto at = line.find(kReportField);
  if (!is_hex_digest(digest) || at == std::string::npos) return false;
  const size_t begin = at + kReportField.size();
  if (report_hash(std::string_view(line).substr(begin, line.size() - 1 - begin)) != digest) {
    return false;
  }

  const std::string status = jsonlite::get_string(obj, "status");
  if (status != "pass" && status != "warn" && status != "fail") return false;
  const jsonlite::Value* report = jsonlite::find(obj, "report");
  const auto* report_obj = report ? std::get_if<jsonlite::Object>(&report->v) : nullptr;
  if (!report_obj) return false;
  const std::string report_status = jsonlite::get_string(*report_obj, "status", status);
  return report_status == status;
}

}  // namespace

struct GovernanceLedger::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  std::uint64_t seq{0};
  std::uint64_t entry_count{0};
  std::uint64_t failure_count{0};
  std::string last_digest{kLedgerGenesisDigest};
  bool open_failed{false};
  Error open_error;
};

GovernanceLedger::GovernanceLedger(const std::string& path)
    : path_(path), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;

  Tail tail;
  if (!read_tail(path_, &tail, &impl_->open_error)) {
    impl_->open_failed = true;
    return;
  }
  impl_->seq = tail.seq;
  impl_->last_digest = tail.digest;

  impl_->file = std::fopen(path_.c_str(), "a");
  if (!impl_->file) {
    impl_->open_failed = true;
    impl_->open_error = make_error(ErrorCode::io_error, "cannot open ledger for append: " + path_);
  }
}

GovernanceLedger::~GovernanceLedger() {
  if (impl_ && impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool GovernanceLedger::enabled() const { return !path_.empty(); }

bool GovernanceLedger::append(LedgerEntry& entry, Error* error) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  if (path_.empty()) return true;
  if (impl_->open_failed || !impl_->file) {
    ++impl_->failure_count;
    if (error) *error = impl_->open_error;
    return false;
  }

  // Append-only: always write at the end, whatever the stream position.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    if (error) *error = make_error(ErrorCode::io_error, "cannot position ledger: " + path_);
    return false;
  }

  if (entry.report_json.empty()) entry.report_json = "{}";
  entry.report_digest = report_hash(entry.report_json);
  entry.sequence = impl_->seq + 1;
  entry.previous_digest = impl_->last_digest;
  using SC = std::chrono::system_clock;
  entry.timestamp_unix_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());

  const std::string line = ledger_entry_to_json(entry);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  const bool flushed = std::fflush(impl_->file) == 0;

  if (!written || !flushed) {
    ++impl_->failure_count;
    if (error) *error = make_error(ErrorCode::io_error, "short write to ledger: " + path_);
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 &&
      post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    // File shrank or the write landed short: append-only violated.
    ++impl_->failure_count;
    if (error) *error = make_error(ErrorCode::io_error, "ledger did not grow by the entry size: " + path_);
    return false;
  }

  impl_->seq = entry.sequence;
  impl_->last_digest = ledger_entry_hash(line);
  ++impl_->entry_count;
  return true;
}

bool GovernanceLedger::append_report(const GovernanceReport& report, Error* error) {
  LedgerEntry entry;
  entry.report_json = report.to_json();
  entry.status = report.status;
  return append(entry, error);
}

std::uint64_t GovernanceLedger::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

std::uint64_t GovernanceLedger::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

const std::string& GovernanceLedger::last_digest() const {
  return impl_->last_digest;
}

bool verify_ledger_chain(const std::string& path, std::uint64_t* broken_at, Error* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = make_error(ErrorCode::io_error, "cannot read ledger: " + path);
    return false;
  }
  std::string expected_prev = kLedgerGenesisDigest;
  std::string line;
  std::uint64_t lineno = 0;
  std::uint64_t entries = 0;
  while (std::getline(ifs, line)) {
    ++lineno;
    if (line.empty()) continue;
    if (!entry_consistent(line, ++entries, expected_prev)) {
      if (broken_at) *broken_at = lineno;
      if (error) *error = make_error(ErrorCode::digest_mismatch,
                                     "ledger chain broken at line " + std::to_string(lineno));
      return false;
    }
    expected_prev = ledger_entry_hash(line);
  }
  return true;
}

}  // namespace asteria
