#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <unistd.h>

#include "admission_gate.hpp"
#include "cancellation.hpp"
#include "checksum.hpp"
#include "concurrency_governor.hpp"
#include "file_helpers.hpp"
#include "file_lock.hpp"
#include "load_sampler.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "metrics_store.hpp"
#include "notifications.hpp"
#include "orchestrator.hpp"
#include "pushover_notifier.hpp"
#include "run_statistics.hpp"
#include "settings.hpp"
#include "stability_detector.hpp"
#include "task_group.hpp"
#include "transfer_engine.hpp"

namespace fs = std::filesystem;
using namespace filemover;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/filemover_test_XXXXXX";
    char* created = mkdtemp(tmpl);
    expect(created != nullptr, "mkdtemp must succeed");
    path_ = created;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }
  std::string file(const std::string& name) const { return path_ + "/" + name; }
  std::string subdir(const std::string& name) const {
    std::string dir = file(name);
    fs::create_directories(dir);
    return dir;
  }

 private:
  std::string path_;
};

void write_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();
  expect(static_cast<bool>(out), "write_file " + path);
}

void write_bytes(const std::string& path, size_t size, char fill = 'x') {
  write_file(path, std::string(size, fill));
}

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

class RecordingNotifier : public NotificationSink {
 public:
  bool notify(const std::string& message, const std::string& title, NotificationType) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.emplace_back(title, message);
    return true;
  }

  size_t count(const std::string& title) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& entry : entries_) {
      if (entry.first == title) n++;
    }
    return n;
  }

  size_t total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  std::string last_message(const std::string& title) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
      if (it->first == title) return it->second;
    }
    return "";
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, std::string>> entries_;
};

class FakeLoadSampler : public LoadSampler {
 public:
  explicit FakeLoadSampler(LoadSample sample) : sample_(sample) {}

  bool available() const override { return true; }
  std::optional<LoadSample> sample() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_;
  }
  void set(LoadSample sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    sample_ = sample;
  }

 private:
  std::mutex mutex_;
  LoadSample sample_;
};

LoadSample cpu_sample(double cpu, double load = -1.0) {
  LoadSample s;
  s.cpu_percent = cpu;
  s.load_average = load;
  return s;
}

TransferOptions fast_options() {
  TransferOptions options;
  options.retry_attempts = 3;
  options.backoff_base_seconds = 0.01;
  options.backoff_multiplier = 2.0;
  options.max_bandwidth = 0;
  return options;
}

MoverConfig quick_config(const std::string& source, const std::string& destination) {
  MoverConfig config;
  config.source_dir = source;
  config.destination_dir = destination;
  config.stability_window = 200ms;
  config.stability_poll_interval = 50ms;
  config.scan_interval = 100ms;
  config.inactivity_threshold = std::chrono::hours(1);
  config.health_check_interval = std::chrono::hours(1);
  config.shutdown_grace = 5s;
  config.max_bandwidth = 0;
  config.max_workers = 4;
  config.retry_attempts = 2;
  config.backoff_base_seconds = 0.01;
  config.backoff_multiplier = 2.0;
  return config;
}

struct OrchestratorFixture {
  TempDir root;
  std::string source = root.subdir("incoming");
  std::string destination = root.subdir("archive");
  std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
  std::shared_ptr<MetricsCollector> metrics = std::make_shared<MetricsCollector>();

  EngineContext context(const MoverConfig& config) const {
    EngineContext ctx;
    ctx.config = config;
    ctx.notifier = notifier;
    ctx.metrics = metrics;
    ctx.load_sampler = std::make_shared<NullLoadSampler>();
    return ctx;
  }
};

// ============================================================================
// Checksums
// ============================================================================

void test_sha256_known_vectors() {
  expect(checksum::sha256_hex("abc") ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");
  expect(checksum::sha256_hex("") ==
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "SHA-256 empty vector");
}

void test_sha256_file_matches_buffer() {
  TempDir dir;
  // Larger than one read chunk
  std::string content(checksum::CHUNK_SIZE * 2 + 17, 'q');
  write_file(dir.file("data.bin"), content);

  auto digest = checksum::sha256_file(dir.file("data.bin"));
  expect(digest.has_value(), "file digest computed");
  expect(*digest == checksum::sha256_hex(content), "file digest equals buffer digest");
  expect(digest->size() == checksum::DIGEST_HEX_LENGTH, "digest is 64 hex chars");
  expect(!checksum::sha256_file(dir.file("missing.bin")).has_value(), "missing file has no digest");
}

// ============================================================================
// Stability Detector
// ============================================================================

void test_filter_suffix_and_regex() {
  FileFilter all;
  expect(all.matches("anything.bin"), "empty filter matches everything");

  FileFilter suffix(".mp4");
  expect(suffix.matches("take1.mp4"), "suffix match");
  expect(!suffix.matches("take1.mp4.part"), "suffix must be at the end");

  FileFilter regex("regex:^cam[0-9]+_.*\\.mov$");
  expect(regex.matches("cam12_intro.mov"), "regex match");
  expect(!regex.matches("xcam12_intro.mov"), "regex anchored");

  expect(FileFilter::validate("regex:([").size() > 0, "broken regex rejected");
  expect(FileFilter::validate("regex:").size() > 0, "empty regex rejected");
  expect(FileFilter::validate(".mp4").empty(), "suffix always valid");
}

void test_scan_orders_by_change_time_and_skips_artifacts() {
  TempDir dir;
  write_bytes(dir.file("b_first.dat"), 10);
  std::this_thread::sleep_for(30ms);
  write_bytes(dir.file("a_second.dat"), 10);
  write_bytes(dir.file("a_second.dat.lock"), 1);
  write_bytes(dir.file("notes.txt"), 5);
  fs::create_directories(dir.file("nested.dat"));

  StabilityDetector::Options options;
  options.source_dir = dir.path();
  options.filter = ".dat";
  StabilityDetector detector(options);

  auto candidates = detector.scan();
  expect(candidates.size() == 2, "only regular .dat files are candidates");
  expect(candidates[0].name == "b_first.dat", "oldest file first");
  expect(candidates[1].name == "a_second.dat", "newer file second");
  expect(candidates[0].size == 10, "size recorded at discovery");
}

void test_scan_keeps_user_tmp_and_orphaned_lock_files() {
  TempDir dir;
  write_bytes(dir.file("plain.bin"), 4);
  write_bytes(dir.file("plain.bin.lock"), 1);
  write_bytes(dir.file("session.tmp"), 8);
  write_bytes(dir.file("orphan.lock"), 2);

  StabilityDetector::Options options;
  options.source_dir = dir.path();
  StabilityDetector detector(options);

  auto candidates = detector.scan();
  std::vector<std::string> names;
  for (const auto& c : candidates) names.push_back(c.name);
  std::sort(names.begin(), names.end());
  expect(names.size() == 3, "three candidates");
  expect(names[0] == "orphan.lock", "lock without its file is a user file");
  expect(names[1] == "plain.bin", "guarded file listed");
  expect(names[2] == "session.tmp", ".tmp in the source is a user file");

  options.filter = ".tmp";
  StabilityDetector tmp_only(options);
  auto tmp_candidates = tmp_only.scan();
  expect(tmp_candidates.size() == 1 && tmp_candidates[0].name == "session.tmp",
         "suffix filter selects .tmp files");

  // Once the guarded file is gone its marker is just another file
  fs::remove(dir.file("plain.bin"));
  auto after = detector.scan();
  bool marker_listed = false;
  for (const auto& c : after) marker_listed = marker_listed || c.name == "plain.bin.lock";
  expect(marker_listed, "orphaned marker listed");
}

void test_constant_file_is_stable() {
  TempDir dir;
  write_bytes(dir.file("done.bin"), 1000);

  StabilityDetector::Options options;
  options.source_dir = dir.path();
  options.window = 300ms;
  options.poll_interval = 50ms;
  StabilityDetector detector(options);

  CancellationToken token;
  auto candidates = detector.scan();
  expect(candidates.size() == 1, "one candidate");
  auto verdict = detector.check(candidates[0], token);
  expect(verdict.stable, "unchanged file is stable: " + verdict.reason);
}

void test_growing_file_is_unstable() {
  TempDir dir;
  std::string path = dir.file("growing.bin");
  write_bytes(path, 100);

  StabilityDetector::Options options;
  options.source_dir = dir.path();
  options.window = 600ms;
  options.poll_interval = 50ms;
  StabilityDetector detector(options);

  std::atomic<bool> stop{false};
  std::thread writer([&]() {
    while (!stop) {
      std::this_thread::sleep_for(40ms);
      std::ofstream out(path, std::ios::binary | std::ios::app);
      out << "more";
    }
  });

  CancellationToken token;
  auto start = std::chrono::steady_clock::now();
  auto candidates = detector.scan();
  auto verdict = detector.check(candidates.at(0), token);
  double elapsed = seconds_since(start);
  stop = true;
  writer.join();

  expect(!verdict.stable, "growing file is unstable");
  expect(elapsed < 0.5, "size change aborts the check early");
}

void test_empty_file_never_stable() {
  TempDir dir;
  write_file(dir.file("placeholder.bin"), "");

  StabilityDetector::Options options;
  options.source_dir = dir.path();
  options.window = 100ms;
  options.poll_interval = 20ms;
  StabilityDetector detector(options);

  CancellationToken token;
  expect(detector.detect(token).empty(), "empty file is not reported stable");
}

void test_vanished_file_is_unstable() {
  TempDir dir;
  StabilityDetector::Options options;
  options.source_dir = dir.path();
  StabilityDetector detector(options);

  CandidateFile ghost;
  ghost.path = dir.file("gone.bin");
  ghost.name = "gone.bin";
  CancellationToken token;
  auto verdict = detector.check(ghost, token);
  expect(!verdict.stable, "stat failure is unstable");
}

void test_detect_checks_candidates_concurrently() {
  TempDir dir;
  for (int i = 0; i < 6; ++i) {
    write_bytes(dir.file("f" + std::to_string(i) + ".bin"), 64);
  }

  StabilityDetector::Options options;
  options.source_dir = dir.path();
  options.window = 400ms;
  options.poll_interval = 100ms;
  StabilityDetector detector(options);

  CancellationToken token;
  auto start = std::chrono::steady_clock::now();
  auto stable = detector.detect(token);
  double elapsed = seconds_since(start);

  expect(stable.size() == 6, "all constant files stable");
  expect(elapsed < 1.5, "latency is about one window, not one per file");
}

void test_detect_cancelled_reports_nothing() {
  TempDir dir;
  write_bytes(dir.file("a.bin"), 64);

  StabilityDetector::Options options;
  options.source_dir = dir.path();
  options.window = 5s;
  StabilityDetector detector(options);

  CancellationToken token;
  std::thread canceller([&]() {
    std::this_thread::sleep_for(100ms);
    token.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  auto stable = detector.detect(token);
  canceller.join();
  expect(stable.empty(), "cancelled detection yields no stable files");
  expect(seconds_since(start) < 2.0, "cancellation interrupts polling");
}

// ============================================================================
// File lock
// ============================================================================

void test_concurrent_lock_has_single_winner() {
  TempDir dir;
  std::string path = dir.file("shared.bin");
  write_bytes(path, 10);

  constexpr int CONTENDERS = 8;
  std::atomic<int> ready{0};
  std::atomic<int> winners{0};
  std::atomic<int> finished{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < CONTENDERS; ++i) {
    threads.emplace_back([&]() {
      ready++;
      while (ready < CONTENDERS) std::this_thread::yield();
      auto lock = FileLock::acquire(path);
      if (lock) winners++;
      finished++;
      // Hold until every contender has tried
      while (finished < CONTENDERS) std::this_thread::yield();
    });
  }
  for (auto& t : threads) t.join();

  expect(winners == 1, "exactly one lock holder");
  expect(!exists(FileLock::marker_path_for(path)), "marker removed when holder released");
  expect(FileLock::marker_path_for(path) == path + ".lock", "marker sits beside the source");
}

// ============================================================================
// Transfer Engine
// ============================================================================

void test_transfer_success_moves_file() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/clip.bin";
  std::string dst = dir.subdir("dst") + "/clip.bin";
  std::string content(1000, 'a');
  content[500] = 'b';
  write_file(src, content);

  TransferEngine engine(fast_options(), std::make_shared<AdmissionGate>(2));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::Success, "transfer succeeds: " + result.error);
  expect(result.attempts == 1, "first attempt");
  expect(result.bytes == 1000, "bytes reported");
  expect(read_file(dst) == content, "destination content equals source");
  expect(!exists(src), "source removed");
  expect(!exists(TransferEngine::temp_path_for(dst)), "no temp artifact");
  expect(!exists(FileLock::marker_path_for(src)), "no lock marker");
}

void test_transfer_with_verification() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/doc.bin";
  std::string dst = dir.subdir("dst") + "/doc.bin";
  write_bytes(src, 200000, 'v');

  TransferOptions options = fast_options();
  options.verify_checksum = true;
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::Success, "verified transfer succeeds: " + result.error);
  expect(fs::file_size(dst) == 200000, "destination size");
  expect(!exists(src), "source removed");
}

void test_checksum_mismatch_exhausts_retries() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/bad.bin";
  std::string dst = dir.subdir("dst") + "/bad.bin";
  std::string content(4096, 'c');
  write_file(src, content);

  TransferOptions options = fast_options();
  options.verify_checksum = true;
  std::atomic<int> temp_hashes{0};
  options.hasher = [&temp_hashes](const std::string& path) -> std::optional<std::string> {
    if (path.size() > 4 && path.compare(path.size() - 4, 4, ".tmp") == 0) {
      temp_hashes++;
      return std::string(64, '0');
    }
    return checksum::sha256_file(path);
  };
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::RetriesExhausted, "mismatch exhausts retries");
  expect(result.cause == TransferOutcome::ChecksumMismatch, "last cause is the mismatch");
  expect(result.attempts == 3, "all attempts used");
  expect(temp_hashes == 3, "each attempt verified its copy");
  expect(read_file(src) == content, "source unchanged");
  expect(!exists(dst), "destination never committed");
  expect(!exists(TransferEngine::temp_path_for(dst)), "no temp artifact");
  expect(!exists(FileLock::marker_path_for(src)), "no lock marker");
}

void test_missing_source_reports_io_failure() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/vanished.bin";
  std::string dst = dir.subdir("dst") + "/vanished.bin";

  TransferOptions options = fast_options();
  options.retry_attempts = 2;
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::RetriesExhausted, "I/O failure retried then exhausted");
  expect(result.cause == TransferOutcome::IoError, "cause is I/O");
  expect(!result.error.empty(), "error message carried");
  expect(!exists(dst), "no destination");
  expect(!exists(FileLock::marker_path_for(src)), "no lock marker left");
}

void test_destination_exists_is_not_overwritten() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/same.bin";
  std::string dst = dir.subdir("dst") + "/same.bin";
  write_file(src, "incoming version");
  write_file(dst, "existing version");

  TransferEngine engine(fast_options(), std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::DestinationExists, "collision reported");
  expect(result.attempts == 1, "collision is not retried");
  expect(!result.succeeded(), "collision is a failure");
  expect(read_file(dst) == "existing version", "existing destination untouched");
  expect(read_file(src) == "incoming version", "source intact");
  expect(!exists(TransferEngine::temp_path_for(dst)), "no temp artifact");
  expect(!exists(FileLock::marker_path_for(src)), "no lock marker");
}

bool is_temp_path(const std::string& path) {
  return path.size() > 4 && path.compare(path.size() - 4, 4, ".tmp") == 0;
}

// Commit calls for a filesystem whose kernel lacks renameat2
CommitCalls without_renameat2() {
  CommitCalls calls;
  calls.rename_noreplace = [](const std::string&, const std::string&) {
    errno = EINVAL;
    return -1;
  };
  return calls;
}

void test_commit_without_hard_links_uses_rename() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/clip.bin";
  std::string dst = dir.subdir("dst") + "/clip.bin";
  write_file(src, "vfat payload");

  TransferOptions options = fast_options();
  options.commit_calls = without_renameat2();
  std::atomic<int> links{0};
  options.commit_calls.link = [&links](const std::string&, const std::string&) {
    links++;
    errno = EPERM;
    return -1;
  };
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::Success, "committed with plain rename");
  expect(result.attempts == 1, "first attempt succeeds");
  expect(links == 1, "hard link tried first");
  expect(read_file(dst) == "vfat payload", "destination content");
  expect(!exists(src), "source removed");
  expect(!exists(TransferEngine::temp_path_for(dst)), "no temp artifact");
}

void test_commit_without_hard_links_keeps_late_destination() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/race.bin";
  std::string dst = dir.subdir("dst") + "/race.bin";
  write_file(src, "ours");

  TransferOptions options = fast_options();
  // Another writer creates the destination between the collision check and the commit
  options.commit_calls.rename_noreplace = [&dst](const std::string&, const std::string&) {
    write_file(dst, "theirs");
    errno = EINVAL;
    return -1;
  };
  options.commit_calls.link = [](const std::string&, const std::string&) {
    errno = EOPNOTSUPP;
    return -1;
  };
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::DestinationExists, "late destination detected");
  expect(result.attempts == 1, "collision is not retried");
  expect(read_file(dst) == "theirs", "late destination untouched");
  expect(read_file(src) == "ours", "source intact");
  expect(!exists(TransferEngine::temp_path_for(dst)), "no temp artifact");
}

void test_commit_rolls_back_when_temp_survives_link() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/linked.bin";
  std::string dst = dir.subdir("dst") + "/linked.bin";
  write_file(src, "linked payload");

  // Every temp unlink fails: each attempt must undo its link
  TransferOptions options = fast_options();
  options.commit_calls = without_renameat2();
  options.commit_calls.unlink = [](const std::string& path) {
    if (is_temp_path(path)) {
      errno = EACCES;
      return -1;
    }
    return ::unlink(path.c_str());
  };
  {
    TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
    CancellationToken token;
    auto result = engine.transfer(src, dst, token);

    expect(result.outcome == TransferOutcome::RetriesExhausted, "commit failures retried");
    expect(result.cause == TransferOutcome::IoError, "cause is an I/O error");
    expect(result.attempts == 3, "all attempts used");
    expect(!exists(dst), "linked destination rolled back");
    expect(read_file(src) == "linked payload", "source intact");
    expect(!exists(TransferEngine::temp_path_for(dst)), "no temp artifact");
    expect(!exists(FileLock::marker_path_for(src)), "no lock marker");
  }

  // Only the first temp unlink fails: the retry commits
  std::atomic<int> temp_unlinks{0};
  options.commit_calls.unlink = [&temp_unlinks](const std::string& path) {
    if (is_temp_path(path) && temp_unlinks++ == 0) {
      errno = EBUSY;
      return -1;
    }
    return ::unlink(path.c_str());
  };
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::Success, "second attempt commits");
  expect(result.attempts == 2, "one retry");
  expect(read_file(dst) == "linked payload", "destination content");
  expect(!exists(src), "source removed");
  expect(!exists(TransferEngine::temp_path_for(dst)), "temp name gone after commit");
}

void test_lock_contention_is_not_retried() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/busy.bin";
  std::string dst = dir.subdir("dst") + "/busy.bin";
  write_bytes(src, 100);
  write_file(FileLock::marker_path_for(src), "12345\n");

  TransferEngine engine(fast_options(), std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto start = std::chrono::steady_clock::now();
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::LockContention, "contention reported");
  expect(result.attempts == 1, "no retry on contention");
  expect(seconds_since(start) < 0.5, "no backoff on contention");
  expect(exists(src), "source intact");
  expect(!exists(dst), "no destination");
  expect(exists(FileLock::marker_path_for(src)), "foreign marker left alone");
}

void test_dry_run_touches_nothing() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/plan.bin";
  std::string dst = dir.subdir("dst") + "/plan.bin";
  write_bytes(src, 100);

  TransferOptions options = fast_options();
  options.dry_run = true;
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto result = engine.transfer(src, dst, token);

  expect(result.outcome == TransferOutcome::DryRun, "dry run outcome");
  expect(result.succeeded(), "dry run counts as success");
  expect(exists(src), "source untouched");
  expect(!exists(dst), "no destination");
  expect(!exists(FileLock::marker_path_for(src)), "lock released");
}

void test_backoff_delay_bounds() {
  std::mt19937 rng(42);
  const double base = 1.0;
  const double multiplier = 2.0;
  for (int k = 1; k <= 5; ++k) {
    double nominal = base * std::pow(multiplier, k);
    for (int i = 0; i < 200; ++i) {
      double delay = TransferEngine::backoff_delay(k, base, multiplier, rng).count();
      expect(delay >= 0.8 * nominal - 1e-9, "backoff above lower jitter bound");
      expect(delay <= 1.2 * nominal + 1e-9, "backoff below upper jitter bound");
    }
  }
}

void test_no_backoff_after_final_attempt() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/none.bin";
  std::string dst = dir.subdir("dst") + "/none.bin";

  TransferOptions options;
  options.retry_attempts = 2;
  options.backoff_base_seconds = 0.2;
  options.backoff_multiplier = 1.0;
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto start = std::chrono::steady_clock::now();
  auto result = engine.transfer(src, dst, token);
  double elapsed = seconds_since(start);

  expect(result.outcome == TransferOutcome::RetriesExhausted, "missing source exhausts");
  expect(elapsed >= 0.15, "one backoff between the two attempts");
  expect(elapsed < 0.45, "no backoff after the last attempt");
}

void test_bandwidth_throttle() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/slow.bin";
  std::string dst = dir.subdir("dst") + "/slow.bin";
  write_bytes(src, 200 * 1024);

  TransferOptions options = fast_options();
  options.max_bandwidth = 400 * 1024;
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  auto start = std::chrono::steady_clock::now();
  auto result = engine.transfer(src, dst, token);
  double elapsed = seconds_since(start);

  expect(result.outcome == TransferOutcome::Success, "throttled transfer succeeds");
  expect(elapsed >= 0.4, "200 KiB at 400 KiB/s takes about half a second");
}

void test_cancellation_mid_copy_cleans_up() {
  TempDir dir;
  std::string src = dir.subdir("src") + "/big.bin";
  std::string dst = dir.subdir("dst") + "/big.bin";
  write_bytes(src, 1024 * 1024);

  TransferOptions options = fast_options();
  options.max_bandwidth = 256 * 1024;
  TransferEngine engine(options, std::make_shared<AdmissionGate>(1));
  CancellationToken token;
  std::thread canceller([&]() {
    std::this_thread::sleep_for(300ms);
    token.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  auto result = engine.transfer(src, dst, token);
  canceller.join();

  expect(result.outcome == TransferOutcome::Cancelled, "transfer cancelled");
  expect(seconds_since(start) < 2.0, "cancellation observed promptly");
  expect(fs::file_size(src) == 1024 * 1024, "source intact");
  expect(!exists(dst), "no destination");
  expect(!exists(TransferEngine::temp_path_for(dst)), "temp artifact removed");
  expect(!exists(FileLock::marker_path_for(src)), "lock released");
}

void test_engine_respects_gate_capacity() {
  TempDir dir;
  std::string src_dir = dir.subdir("src");
  std::string dst_dir = dir.subdir("dst");
  constexpr int FILES = 6;
  for (int i = 0; i < FILES; ++i) {
    write_bytes(src_dir + "/f" + std::to_string(i), 64 * 1024);
  }

  auto gate = std::make_shared<AdmissionGate>(2);
  TransferOptions options = fast_options();
  options.max_bandwidth = 512 * 1024;
  auto engine = std::make_shared<TransferEngine>(options, gate);
  CancellationToken token;

  std::atomic<int> successes{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < FILES; ++i) {
    workers.emplace_back([&, i]() {
      std::string name = "/f" + std::to_string(i);
      auto result = engine->transfer(src_dir + name, dst_dir + name, token);
      if (result.outcome == TransferOutcome::Success) successes++;
    });
  }
  for (auto& w : workers) w.join();

  expect(successes == FILES, "every file moved");
  expect(gate->peak_in_use() <= 2, "never more moves than the gate allows");
  expect(gate->in_use() == 0, "all permits returned");
}

// ============================================================================
// Admission gate
// ============================================================================

void test_gate_peak_never_exceeds_capacity() {
  AdmissionGate gate(3);
  CancellationToken token;
  std::atomic<int> current{0};
  std::atomic<int> observed_max{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 10; ++i) {
    threads.emplace_back([&]() {
      auto permit = gate.acquire(token);
      expect(static_cast<bool>(permit), "permit granted");
      int now = ++current;
      int prev = observed_max.load();
      while (now > prev && !observed_max.compare_exchange_weak(prev, now)) {}
      std::this_thread::sleep_for(20ms);
      --current;
    });
  }
  for (auto& t : threads) t.join();
  expect(observed_max <= 3, "holders never exceed capacity");
  expect(gate.peak_in_use() <= 3, "gate peak within capacity");
  expect(gate.in_use() == 0, "all released");
}

void test_gate_resize_keeps_held_permits() {
  AdmissionGate gate(2);
  auto first = gate.try_acquire();
  auto second = gate.try_acquire();
  expect(first && second, "two permits at capacity 2");
  expect(!gate.try_acquire(), "full gate refuses");

  gate.set_capacity(1);
  expect(gate.in_use() == 2, "shrinking does not revoke held permits");
  first.release();
  expect(!gate.try_acquire(), "still at new capacity with one holder");
  second.release();
  auto third = gate.try_acquire();
  expect(static_cast<bool>(third), "admits again once below capacity");

  gate.set_capacity(3);
  auto fourth = gate.try_acquire();
  auto fifth = gate.try_acquire();
  expect(fourth && fifth, "growing admits new acquirers");
  expect(gate.in_use() == 3, "three in use");

  gate.set_capacity(0);
  expect(gate.capacity() == 1, "capacity never below one");
}

void test_gate_acquire_honours_cancellation() {
  AdmissionGate gate(1);
  auto held = gate.try_acquire();
  CancellationToken token;
  std::thread canceller([&]() {
    std::this_thread::sleep_for(100ms);
    token.cancel();
  });
  auto permit = gate.acquire(token);
  canceller.join();
  expect(!permit, "cancelled waiter gets no permit");
  expect(gate.in_use() == 1, "only the first holder");
}

// ============================================================================
// Concurrency Governor
// ============================================================================

void test_governor_initial_limit() {
  expect(ConcurrencyGovernor::initial_limit(8, cpu_sample(10, 3.5)) == 5, "load 3.5 takes 3 slots");
  expect(ConcurrencyGovernor::initial_limit(4, cpu_sample(10, 10.0)) == 1, "heavy load floors at 1");
  expect(ConcurrencyGovernor::initial_limit(4, cpu_sample(90, 0.5)) == 3, "high cpu starts one below");
  expect(ConcurrencyGovernor::initial_limit(4, cpu_sample(10, 0.5)) == 4, "idle starts at max");
  expect(ConcurrencyGovernor::initial_limit(4, std::nullopt) == 4, "no signal starts at max");
  expect(ConcurrencyGovernor::initial_limit(1, cpu_sample(95)) == 1, "never below one");
}

void test_governor_adjusts_gate() {
  AdmissionGate gate(4);
  auto sampler = std::make_shared<FakeLoadSampler>(cpu_sample(20));
  ConcurrencyGovernor governor(4, gate, sampler, nullptr, 1s);
  expect(governor.current_limit() == 4, "starts at max when idle");

  expect(governor.adjust(cpu_sample(90)) == 3, "high cpu steps down");
  expect(gate.capacity() == 3, "gate follows");
  governor.adjust(cpu_sample(95));
  governor.adjust(cpu_sample(99));
  expect(governor.adjust(cpu_sample(99)) == 1, "floor at one");
  expect(governor.adjust(cpu_sample(65)) == 1, "moderate load holds");
  expect(governor.adjust(cpu_sample(30)) == 4, "low load restores max");
  expect(gate.capacity() == 4, "gate restored");
  expect(governor.last_sample().has_value(), "last sample kept");
}

void test_governor_without_signal_stays_at_max() {
  AdmissionGate gate(1);
  ConcurrencyGovernor governor(6, gate, std::make_shared<NullLoadSampler>(), nullptr, 10ms);
  governor.start();
  std::this_thread::sleep_for(50ms);
  governor.stop();
  expect(governor.current_limit() == 6, "fixed at configured max");
  expect(gate.capacity() == 6, "gate sized to max");
}

void test_governor_background_sampling() {
  AdmissionGate gate(4);
  auto sampler = std::make_shared<FakeLoadSampler>(cpu_sample(20));
  auto metrics = std::make_shared<MetricsCollector>();
  ConcurrencyGovernor governor(4, gate, sampler, metrics, 20ms);
  sampler->set(cpu_sample(95));
  governor.start();
  std::this_thread::sleep_for(250ms);
  governor.stop();

  expect(governor.current_limit() < 4, "background thread reduced the limit");
  auto samples = metrics->system_metrics();
  expect(!samples.empty(), "system samples recorded");
  expect(samples.back().cpu_percent == 95, "sample carries cpu");
}

// ============================================================================
// Task group
// ============================================================================

void test_task_group_isolates_failures() {
  TaskGroup group("test");
  std::atomic<int> completed{0};
  group.spawn([&]() { completed++; });
  group.spawn([]() { throw std::runtime_error("boom"); });
  group.spawn([&]() { completed++; });
  expect(group.wait_all_for(2s), "all tasks finish");
  expect(completed == 2, "failing task does not affect others");
  expect(group.pending() == 0, "nothing pending");
}

void test_task_group_bounded_wait_and_abandon() {
  auto release = std::make_shared<CancellationToken>();
  auto finished = std::make_shared<std::atomic<bool>>(false);
  {
    TaskGroup group("slow");
    group.spawn([release, finished]() {
      release->sleep_for(10s);
      finished->store(true);
    });
    auto start = std::chrono::steady_clock::now();
    expect(!group.wait_all_for(100ms), "slow task still running");
    expect(seconds_since(start) < 1.0, "wait is bounded");
    expect(group.abandon() == 1, "one task abandoned");
  }
  release->cancel();
  for (int i = 0; i < 100 && !finished->load(); ++i) std::this_thread::sleep_for(10ms);
  expect(finished->load(), "abandoned task still ran to completion on its own");
}

// ============================================================================
// Settings
// ============================================================================

void test_settings_defaults_and_validation() {
  TempDir dir;
  Settings settings(dir.file("settings.json"));
  expect(!settings.load(), "missing file reports false");
  expect(settings.get_int("max_workers") == 4, "default max_workers");
  expect(settings.get_int("retry_attempts") == 5, "default retry_attempts");
  expect(settings.get_int("max_bandwidth") == 1048576, "default bandwidth");

  auto errors = settings.validate();
  expect(errors.size() >= 2, "both directories required");

  settings.set_string("source_dir", dir.subdir("in"));
  settings.set_string("destination_dir", dir.file("out"));
  expect(settings.validate().empty(), "valid with defaults and directories");

  settings.set_int("max_workers", 40);
  settings.set_int("retry_attempts", 0);
  settings.set_int("stability_wait", 0);
  settings.set_string("file_filter", "regex:(");
  settings.set_string("backoff_base", "abc");
  errors = settings.validate();
  expect(errors.size() == 5, "each bad value reported once");
}

void test_settings_save_load_and_config() {
  TempDir dir;
  std::string path = dir.file("conf/settings.json");
  {
    Settings settings(path);
    settings.set_string("source_dir", "/data/in");
    settings.set_string("destination_dir", "/data/out");
    settings.set_int("stability_wait", 7);
    settings.set_bool("verify_checksum", true);
    settings.set_string("file_filter", "regex:^cam\\d+");
    expect(settings.save(), "save succeeds");
  }

  Settings loaded(path);
  expect(loaded.load(), "load succeeds");
  MoverConfig config = loaded.to_config();
  expect(config.source_dir == "/data/in", "source_dir round trip");
  expect(config.stability_window == 7s, "stability window in seconds");
  expect(config.verify_checksum, "bool round trip");
  expect(config.file_filter == "regex:^cam\\d+", "escaped string round trip");
  expect(config.inactivity_threshold == std::chrono::minutes(5), "inactivity default in minutes");
  expect(config.health_check_interval == 3600s, "health default");
}

// ============================================================================
// Metrics
// ============================================================================

FileOperationMetric op(const std::string& name, bool success, uint64_t bytes, double seconds,
                       std::chrono::system_clock::time_point when = std::chrono::system_clock::now()) {
  FileOperationMetric metric;
  metric.timestamp = when;
  metric.filename = name;
  metric.success = success;
  metric.file_size_bytes = bytes;
  metric.duration_seconds = seconds;
  if (!success) metric.error = "failed";
  return metric;
}

void test_metrics_summary_and_pruning() {
  MetricsCollector metrics;
  metrics.record_file_operation(op("a", true, 1000, 1.0));
  metrics.record_file_operation(op("b", true, 3000, 1.0));
  metrics.record_file_operation(op("c", false, 500, 0.5));
  metrics.record_file_operation(op("ancient", true, 1, 1.0,
                                   std::chrono::system_clock::now() - std::chrono::hours(24 * 31)));

  auto summary = metrics.performance_summary(24);
  expect(summary.total_operations == 3, "three recent operations");
  expect(summary.successful_operations == 2, "two successes");
  expect(summary.failed_operations == 1, "one failure");
  expect(summary.total_bytes == 4000, "bytes of successes");
  expect(std::abs(summary.average_speed_bytes_per_second - 2000.0) < 1e-6, "average speed");
  expect(metrics.file_operations().size() == 3, "records older than 30 days pruned");

  MetricsCollector empty;
  expect(empty.performance_summary(24).total_operations == 0, "empty summary");
}

void test_metrics_persistence() {
  TempDir dir;
  std::string db = dir.file("metrics/metrics.db");
  {
    auto store = std::make_shared<MetricsStore>(db);
    expect(store->initialize(), "store opens");
    MetricsCollector metrics(store);
    metrics.record_file_operation(op("kept.bin", true, 4096, 0.25));
    SystemMetric sample;
    sample.timestamp = std::chrono::system_clock::now();
    sample.cpu_percent = 42.0;
    sample.concurrency_limit = 3;
    metrics.record_system_metrics(sample);
    expect(metrics.flush(), "flush succeeds");
  }

  auto store = std::make_shared<MetricsStore>(db);
  expect(store->initialize(), "store reopens");
  MetricsCollector reloaded(store);
  expect(reloaded.load(), "load succeeds");
  auto ops = reloaded.file_operations();
  expect(ops.size() == 1, "operation persisted");
  expect(ops[0].filename == "kept.bin" && ops[0].file_size_bytes == 4096, "operation fields persisted");
  auto samples = reloaded.system_metrics();
  expect(samples.size() == 1 && samples[0].cpu_percent == 42.0, "system sample persisted");
  expect(store->prune_older_than(std::chrono::system_clock::now() + std::chrono::hours(1)) == 2,
         "prune removes everything older than cutoff");
}

// ============================================================================
// Notifications
// ============================================================================

void test_notification_rate_limit() {
  auto recorder = std::make_shared<RecordingNotifier>();
  NotificationManager manager(60s);
  manager.add_sink(recorder);
  expect(manager.notify("first", "A"), "first delivered");
  expect(!manager.notify("second", "B"), "second inside window dropped");
  expect(recorder->total() == 1, "sink saw one");
  expect(manager.dropped() == 1, "drop counted");

  NotificationManager unlimited(0s);
  unlimited.add_sink(recorder);
  unlimited.notify("x", "C");
  unlimited.notify("y", "D");
  expect(recorder->total() == 3, "no limit delivers all");
}

void test_pushover_device_list() {
  auto devices = PushoverNotifier::parse_devices(" phone, tablet,,  desk ");
  expect(devices.size() == 3, "three devices");
  expect(devices[0] == "phone" && devices[2] == "desk", "trimmed");
  expect(PushoverNotifier::parse_devices("").empty(), "empty list");
}

// ============================================================================
// Run statistics
// ============================================================================

void test_run_statistics() {
  RunStatistics stats;
  stats.record_success("a", 2048, 2.0);
  stats.record_failure("b", "disk full");
  expect(stats.total_moved() == 1, "moved");
  expect(stats.total_errors() == 1, "errors");
  expect(stats.total_bytes() == 2048, "bytes");
  expect(stats.average_speed() == 1024.0, "speed");
  expect(stats.recent().size() == 2, "history");
  expect(stats.health_summary().find("Files moved: 1") != std::string::npos, "summary mentions totals");
}

// ============================================================================
// Orchestrator
// ============================================================================

void test_orchestrator_moves_stable_file() {
  OrchestratorFixture fx;
  write_bytes(fx.source + "/recording.bin", 1000);

  Orchestrator orchestrator(fx.context(quick_config(fx.source, fx.destination)));
  orchestrator.run_once();

  expect(exists(fx.destination + "/recording.bin"), "destination has the file");
  expect(fs::file_size(fx.destination + "/recording.bin") == 1000, "1000 bytes");
  expect(!exists(fx.source + "/recording.bin"), "source gone");
  expect(orchestrator.statistics().total_moved() == 1, "moved=1");
  expect(orchestrator.statistics().total_errors() == 0, "errors=0");
  expect(fx.notifier->count("File Move Error") == 0, "no error notification");
  auto ops = fx.metrics->file_operations();
  expect(ops.size() == 1 && ops[0].success, "metric recorded");
}

// Sink whose persistence fails until told otherwise
class FlakyMetricsSink : public MetricsSink {
 public:
  void record_file_operation(const FileOperationMetric&) override { recorded++; }
  void record_system_metrics(const SystemMetric&) override {}
  bool flush() override {
    flush_calls++;
    return flush_calls > failures;
  }

  int failures = 1;
  int flush_calls = 0;
  int recorded = 0;
};

void test_orchestrator_retries_failed_metrics_flush() {
  OrchestratorFixture fx;
  write_bytes(fx.source + "/first.bin", 300);

  auto sink = std::make_shared<FlakyMetricsSink>();
  EngineContext ctx = fx.context(quick_config(fx.source, fx.destination));
  ctx.metrics = sink;
  Orchestrator orchestrator(ctx);

  orchestrator.run_once();
  expect(sink->recorded == 1, "transfer recorded");
  expect(sink->flush_calls == 1, "flush attempted after the move");

  // Nothing new to record, but the failed batch is still owed
  orchestrator.run_once();
  expect(sink->flush_calls == 2, "failed flush retried next cycle");

  orchestrator.run_once();
  expect(sink->flush_calls == 2, "no flush once persisted");
}

void test_orchestrator_collision_and_isolation() {
  OrchestratorFixture fx;
  write_file(fx.source + "/dup.bin", "new");
  write_file(fx.destination + "/dup.bin", "old");
  write_bytes(fx.source + "/fresh.bin", 500);

  Orchestrator orchestrator(fx.context(quick_config(fx.source, fx.destination)));
  orchestrator.run_once();

  expect(orchestrator.statistics().total_moved() == 1, "other file still moved");
  expect(orchestrator.statistics().total_errors() == 1, "collision counted");
  expect(fx.notifier->count("File Already Exists") == 1, "collision notified");
  expect(read_file(fx.destination + "/dup.bin") == "old", "existing file kept");
  expect(read_file(fx.source + "/dup.bin") == "new", "source kept");
  expect(exists(fx.destination + "/fresh.bin"), "fresh file moved");
}

void test_orchestrator_skips_growing_files() {
  OrchestratorFixture fx;
  std::string path = fx.source + "/live.bin";
  write_bytes(path, 100);

  std::atomic<bool> stop{false};
  std::thread writer([&]() {
    while (!stop) {
      std::this_thread::sleep_for(20ms);
      std::ofstream out(path, std::ios::binary | std::ios::app);
      out << "data";
    }
  });
  Orchestrator orchestrator(fx.context(quick_config(fx.source, fx.destination)));
  orchestrator.run_once();
  stop = true;
  writer.join();

  expect(exists(path), "file being written stays");
  expect(!exists(fx.destination + "/live.bin"), "not moved");
  expect(orchestrator.statistics().total_errors() == 0, "not an error");
}

void test_orchestrator_inactivity_notified_once() {
  OrchestratorFixture fx;
  MoverConfig config = quick_config(fx.source, fx.destination);
  config.inactivity_threshold = 150ms;
  config.stability_window = 50ms;
  config.stability_poll_interval = 10ms;
  Orchestrator orchestrator(fx.context(config));

  std::this_thread::sleep_for(200ms);
  orchestrator.run_once();
  orchestrator.run_once();
  expect(fx.notifier->count("Inactivity Alert") == 1, "exactly one alert while idle");

  write_bytes(fx.source + "/wake.bin", 10);
  orchestrator.run_once();
  expect(orchestrator.statistics().total_moved() == 1, "success resets the timer");
  expect(fx.notifier->count("Inactivity Alert") == 1, "no alert right after a success");

  std::this_thread::sleep_for(200ms);
  orchestrator.run_once();
  expect(fx.notifier->count("Inactivity Alert") == 2, "re-armed after the success");
}

void test_orchestrator_health_check() {
  OrchestratorFixture fx;
  MoverConfig config = quick_config(fx.source, fx.destination);
  config.health_check_interval = 0ms;
  Orchestrator orchestrator(fx.context(config));
  orchestrator.run_once();
  expect(fx.notifier->count("Health Check") == 1, "health summary sent");
  expect(fx.notifier->last_message("Health Check").find("Uptime") != std::string::npos, "uptime reported");
}

void test_orchestrator_disconnect_and_reconnect() {
  OrchestratorFixture fx;
  Orchestrator orchestrator(fx.context(quick_config(fx.source, fx.destination)));

  fs::remove_all(fx.source);
  orchestrator.run_once();
  expect(fx.notifier->count("Local Disconnect") == 1, "local disconnect notified");
  expect(orchestrator.disconnected(), "disconnected state");

  for (int i = 0; i < 10; ++i) orchestrator.run_once();
  expect(fx.notifier->count("Still Disconnected") == 1, "reminder every 10 attempts");

  fs::create_directories(fx.source);
  orchestrator.run_once();
  expect(fx.notifier->count("Reconnection") == 1, "reconnection notified");
  expect(!orchestrator.disconnected(), "connected again");

  fs::remove_all(fx.destination);
  orchestrator.run_once();
  expect(fx.notifier->count("Remote Disconnect") == 1, "remote disconnect notified");
}

void test_orchestrator_shutdown_sequence() {
  OrchestratorFixture fx;
  MoverConfig config = quick_config(fx.source, fx.destination);
  config.scan_interval = 10s;
  Orchestrator orchestrator(fx.context(config));

  std::thread runner([&]() { orchestrator.run(); });
  std::this_thread::sleep_for(300ms);
  auto start = std::chrono::steady_clock::now();
  orchestrator.request_shutdown();
  orchestrator.request_shutdown();
  runner.join();

  expect(seconds_since(start) < 3.0, "inter-cycle sleep interrupted");
  expect(orchestrator.state() == OrchestratorState::Stopped, "terminal state");
  expect(fx.notifier->count("File Mover Started") == 1, "startup notified");
  expect(fx.notifier->count("Shutdown Notification") == 1, "summary sent once");
  expect(orchestrator.abandoned_transfers() == 0, "nothing abandoned");
}

void test_orchestrator_shutdown_mid_transfer() {
  OrchestratorFixture fx;
  std::string src = fx.source + "/long.bin";
  write_bytes(src, 2 * 1024 * 1024);

  MoverConfig config = quick_config(fx.source, fx.destination);
  config.max_bandwidth = 256 * 1024;
  Orchestrator orchestrator(fx.context(config));

  std::thread runner([&]() { orchestrator.run(); });
  std::string temp = TransferEngine::temp_path_for(fx.destination + "/long.bin");
  for (int i = 0; i < 500 && !exists(temp); ++i) std::this_thread::sleep_for(10ms);
  expect(exists(temp), "transfer in progress");

  orchestrator.request_shutdown();
  runner.join();

  expect(orchestrator.state() == OrchestratorState::Stopped, "stopped");
  expect(fs::file_size(src) == 2 * 1024 * 1024, "source intact");
  expect(!exists(temp), "temp artifact cleaned up");
  expect(!exists(fx.destination + "/long.bin"), "nothing committed");
  expect(!exists(FileLock::marker_path_for(src)), "lock released");
  expect(orchestrator.statistics().total_errors() == 0, "cancellation is not an error");
  expect(orchestrator.abandoned_transfers() == 0, "transfer unwound within the grace period");
}

}  // namespace

int main() {
  Logger::init(LogLevel::ERROR);

  std::cout << "=== filemover test suite ===\n";

  std::cout << "\n[Checksums]\n";
  run_test("SHA-256 known vectors", test_sha256_known_vectors);
  run_test("SHA-256 file matches buffer", test_sha256_file_matches_buffer);

  std::cout << "\n[Stability detection]\n";
  run_test("filter suffix and regex", test_filter_suffix_and_regex);
  run_test("scan order and artifact skipping", test_scan_orders_by_change_time_and_skips_artifacts);
  run_test("scan keeps user .tmp and orphaned .lock", test_scan_keeps_user_tmp_and_orphaned_lock_files);
  run_test("constant file is stable", test_constant_file_is_stable);
  run_test("growing file is unstable", test_growing_file_is_unstable);
  run_test("empty file never stable", test_empty_file_never_stable);
  run_test("vanished file is unstable", test_vanished_file_is_unstable);
  run_test("candidates checked concurrently", test_detect_checks_candidates_concurrently);
  run_test("cancelled detection", test_detect_cancelled_reports_nothing);

  std::cout << "\n[Locking]\n";
  run_test("concurrent lock single winner", test_concurrent_lock_has_single_winner);

  std::cout << "\n[Transfer engine]\n";
  run_test("successful move", test_transfer_success_moves_file);
  run_test("verified move", test_transfer_with_verification);
  run_test("checksum mismatch exhausts retries", test_checksum_mismatch_exhausts_retries);
  run_test("missing source", test_missing_source_reports_io_failure);
  run_test("destination collision", test_destination_exists_is_not_overwritten);
  run_test("commit without hard links", test_commit_without_hard_links_uses_rename);
  run_test("commit without hard links keeps late destination", test_commit_without_hard_links_keeps_late_destination);
  run_test("commit rolls back a stuck temp link", test_commit_rolls_back_when_temp_survives_link);
  run_test("lock contention", test_lock_contention_is_not_retried);
  run_test("dry run", test_dry_run_touches_nothing);
  run_test("backoff bounds", test_backoff_delay_bounds);
  run_test("no backoff after final attempt", test_no_backoff_after_final_attempt);
  run_test("bandwidth throttle", test_bandwidth_throttle);
  run_test("cancellation mid-copy", test_cancellation_mid_copy_cleans_up);
  run_test("gate capacity respected", test_engine_respects_gate_capacity);

  std::cout << "\n[Admission gate]\n";
  run_test("peak within capacity", test_gate_peak_never_exceeds_capacity);
  run_test("resize keeps held permits", test_gate_resize_keeps_held_permits);
  run_test("acquire honours cancellation", test_gate_acquire_honours_cancellation);

  std::cout << "\n[Concurrency governor]\n";
  run_test("initial limit", test_governor_initial_limit);
  run_test("adjusts gate", test_governor_adjusts_gate);
  run_test("no signal stays at max", test_governor_without_signal_stays_at_max);
  run_test("background sampling", test_governor_background_sampling);

  std::cout << "\n[Task group]\n";
  run_test("isolates failures", test_task_group_isolates_failures);
  run_test("bounded wait and abandon", test_task_group_bounded_wait_and_abandon);

  std::cout << "\n[Settings]\n";
  run_test("defaults and validation", test_settings_defaults_and_validation);
  run_test("save, load and typed config", test_settings_save_load_and_config);

  std::cout << "\n[Metrics & notifications]\n";
  run_test("summary and pruning", test_metrics_summary_and_pruning);
  run_test("SQLite persistence", test_metrics_persistence);
  run_test("notification rate limit", test_notification_rate_limit);
  run_test("pushover device list", test_pushover_device_list);
  run_test("run statistics", test_run_statistics);

  std::cout << "\n[Orchestrator]\n";
  run_test("moves a stable file", test_orchestrator_moves_stable_file);
  run_test("retries failed metrics flush", test_orchestrator_retries_failed_metrics_flush);
  run_test("collision and per-file isolation", test_orchestrator_collision_and_isolation);
  run_test("skips growing files", test_orchestrator_skips_growing_files);
  run_test("inactivity notified once", test_orchestrator_inactivity_notified_once);
  run_test("health check", test_orchestrator_health_check);
  run_test("disconnect and reconnect", test_orchestrator_disconnect_and_reconnect);
  run_test("shutdown sequence", test_orchestrator_shutdown_sequence);
  run_test("shutdown mid-transfer", test_orchestrator_shutdown_mid_transfer);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  Logger::shutdown();
  return 0;
}
