#include "ivmtr_scanner/feed_session.hpp"
#include "ivmtr_scanner/log.hpp"
#include "ivmtr_scanner/mail_phase.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::int64_t count = -1;          // records to print per file; -1 = all
  bool print = false;
  bool summary = false;
  ivmtr::FeedSession::Config cfg;
  std::vector<std::string> files;
};

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat_u = [&](const char* pfx, auto* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoull(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    std::uint64_t n = 0;
    if (eat_u("--count=", &n)) { c.count = static_cast<std::int64_t>(n); c.print = true; continue; }
    if (eat_u("--chunk-bytes=", &c.cfg.stream.chunk_bytes)) continue;
    if (eat_u("--object-bytes=", &c.cfg.object_bytes)) continue;
    if (a.rfind("--swap-timeout-ms=", 0) == 0) {
      c.cfg.stream.swap_timeout = std::chrono::milliseconds(std::stoll(a.substr(18)));
      continue;
    }
    if (a.rfind("--log-level=", 0) == 0) { ivmtr::log::set_level(ivmtr::log::parse_level(a.substr(12))); continue; }
    if (a == "--print")       { c.print = true; continue; }
    if (a == "--summary")     { c.summary = true; continue; }
    if (a == "--no-prefetch") { c.cfg.stream.prefetch = false; continue; }
    if (a == "--lock")        { c.cfg.lock_file = true; continue; }
    if (a == "-h" || a == "--help") {
      std::cout <<
        "Usage: ivmtr-scan [--print] [--count=N] [--summary] [--no-prefetch] [--lock]\n"
        "                  [--chunk-bytes=N] [--object-bytes=N] [--swap-timeout-ms=N]\n"
        "                  [--log-level=debug|info|warn|error|off] <feed.json>...\n";
      std::exit(0);
    }
    if (a.rfind("--", 0) == 0) {
      std::cerr << "[scan] unknown option: " << a << "\n";
      std::exit(2);
    }
    c.files.push_back(a);
  }
  return c;
}

void print_summary(const std::map<std::string, std::uint64_t>& tally) {
  std::size_t n = 0;
  const ivmtr::MailPhase* phases = ivmtr::mail_phases(n);
  std::vector<const ivmtr::MailPhase*> order;
  for (std::size_t i = 0; i < n; ++i) order.push_back(&phases[i]);
  std::sort(order.begin(), order.end(), [](auto* a, auto* b){ return *a < *b; });

  for (auto* p : order) {
    auto it = tally.find(std::string(p->name));
    if (it != tally.end()) std::cout << "  " << it->second << "\t" << p->name << "\n";
  }
  for (auto& kv : tally) {
    if (!ivmtr::find_mail_phase(kv.first)) std::cout << "  " << kv.second << "\t" << kv.first << " (unrecognized)\n";
  }
}

int scan_one_file(const std::string& path, const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  ivmtr::FeedSession session;
  ivmtr::ScanStatus st = session.open(path, cli.cfg);
  if (st != ivmtr::ScanStatus::Ok) {
    std::cerr << "[scan] " << ivmtr::to_string(st) << ": " << session.last_error() << "\n";
    return 3;
  }

  std::map<std::string, std::uint64_t> tally;
  std::int64_t printed = 0;
  ivmtr::ScanRecord rec;
  // --count=0 without --summary reads nothing.
  const bool want_records = cli.count != 0 || cli.summary;
  while (want_records && (st = session.next(rec)) == ivmtr::ScanStatus::Ok) {
    if (cli.print && (cli.count < 0 || printed < cli.count)) {
      std::cout << rec.imb << "\t" << rec.mail_phase << "\n";
      ++printed;
    }
    if (cli.summary) ++tally[std::string(rec.mail_phase)];
    if (!cli.summary && cli.count >= 0 && printed >= cli.count) break;
  }

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const std::uint64_t rows = session.records();
  const std::uint64_t bytes = session.bytes_read();
  const double sec = wall_ms / 1000.0;
  const double mb_s = sec > 0.0 ? (bytes / (1024.0 * 1024.0)) / sec : 0.0;
  const bool ok = !ivmtr::is_fatal(st);
  const std::string err = session.last_error();
  session.close();

  if (cli.summary) print_summary(tally);

  if (!ok) {
    std::cerr << "[scan] failed: " << path << " after " << rows << " records: "
              << ivmtr::to_string(st) << ": " << err << "\n";
    return 3;
  }
  std::cerr << "[scan] ok: " << path << " rows=" << rows << " bytes=" << bytes
            << " time=" << wall_ms << "ms throughput=" << mb_s << " MiB/s\n";
  return 0;
}

}

int main(int argc, char** argv) {
  ivmtr::log::init_from_env();
  auto cli = parse_cli(argc, argv);
  if (cli.files.empty()) {
    std::cerr << "[scan] missing required argument: a json-formatted IV-MTR feed file (see --help)\n";
    return 2;
  }

  int rc = 0;
  for (const auto& f : cli.files) {
    if (scan_one_file(f, cli) != 0) rc = 3;
  }
  return rc;
}
