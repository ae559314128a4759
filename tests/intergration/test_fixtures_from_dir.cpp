#include "ivmtr_scanner/feed_session.hpp"
#include "ivmtr_scanner/log.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <cctype>
#include <cstring>

namespace fs = std::filesystem;

static bool ieq_ext(const std::string& s, const char* ext) {
  if (s.size() != std::strlen(ext)) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(ext[i]))) return false;
  return true;
}

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  return true;
}

// Record counts for the well-formed fixtures that carry data.
static const std::map<std::string, uint64_t> kExpectedRows = {
  {"two_records.json", 2},
  {"pretty_feed.json", 3},
};

struct Res {
  bool ok{true};
  uint64_t rows{0};
  uint64_t bytes{0};
  ivmtr::ScanStatus status{ivmtr::ScanStatus::Ok};
  std::string err;
  std::string where;
};

static Res run_feed(const fs::path& f, bool prefetch){
  Res r;
  ivmtr::FeedSession::Config cfg;
  cfg.stream.prefetch = prefetch;
  cfg.stream.chunk_bytes = 32;   // many chunk seams even for small fixtures

  ivmtr::FeedSession session;
  r.status = session.open(f.string(), cfg);
  if (r.status != ivmtr::ScanStatus::Ok) { r.ok = false; r.err = session.last_error(); return r; }

  ivmtr::ScanRecord rec;
  while ((r.status = session.next(rec)) == ivmtr::ScanStatus::Ok) {
    if (rec.imb.empty() || rec.mail_phase.empty()) { r.ok = false; r.err = "empty field"; break; }
  }
  if (r.status != ivmtr::ScanStatus::EndOfFile) r.ok = false;
  r.rows = session.records();
  r.bytes = session.bytes_read();
  if (r.err.empty()) r.err = session.last_error();
  if (const ivmtr::Telemetry* t = session.telemetry())
    r.where = "line " + std::to_string(t->line) + ", column " + std::to_string(t->column);
  return r;
}

int main(int argc, char** argv){
  ivmtr::log::set_level(ivmtr::log::Level::Off);

  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (!ieq_ext(p.extension().string(), ".json")) continue;

    const bool expect_ok = expected_ok_for(p);
    auto want = kExpectedRows.find(p.filename().string());
    const uint64_t expect_rows = (want != kExpectedRows.end()) ? want->second : 0;

    for (bool prefetch : {true, false}) {
      Res r = run_feed(p, prefetch);
      bool verdict = (r.ok == expect_ok);
      if (verdict && expect_ok && r.rows != expect_rows) verdict = false;

      ++total; verdict ? ++passed : ++failed;

      const char* mode = prefetch ? "prefetch" : "sync";
      if (verdict) {
        std::cout << "[PASS] " << p.filename().string() << " (" << mode << ")"
                  << "  rows=" << r.rows
                  << "  bytes=" << r.bytes
                  << "  status=" << ivmtr::to_string(r.status) << "\n";
      } else {
        std::cout << "[FAIL] " << p.filename().string() << " (" << mode << ")"
                  << "  rows=" << r.rows << " expected_rows=" << expect_rows
                  << "  expected_ok=" << (expect_ok?"true":"false")
                  << "  actual_ok=" << (r.ok?"true":"false") << "\n";
        if (!r.err.empty())
          std::cout << "       error: " << r.err << "\n";
        if (!r.where.empty())
          std::cout << "       at " << r.where << "\n";
      }
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 && total > 0 ? 0 : 1;
}
