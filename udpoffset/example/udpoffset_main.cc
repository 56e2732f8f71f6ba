// Copyright (c) 2025
/**
 * @file udpoffset_main.cc
 * @brief Command-line front end: reflector or offset measurement.
 *
 * Usage:
 *   udpoffset                      # reflect timestamps on UDP 55555
 *   udpoffset 192.0.2.10 -i 0.5    # measure offset against a reflector
 *
 * Samples go to stdout; banners and diagnostics go to stderr. The process
 * runs until killed (SIGINT/SIGTERM use the default disposition) or until a
 * fatal socket/clock error, which exits with status 1.
 */
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>

#include "udpoffset/offset_meter.hpp"
#include "udpoffset/offset_sample.hpp"
#include "udpoffset/realtime_clock.hpp"
#include "udpoffset/reflector.hpp"
#include "udpoffset/stats.hpp"
#include "udpoffset/wire_format.hpp"

namespace {

/**
 * @brief Thread-safe logger for diagnostics (stderr).
 *
 * Debug lines are dropped unless enabled; everything else is always shown.
 */
class Logger {
 public:
  explicit Logger(bool debug) : debug_(debug) {}

  void Log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

  void Debug(const std::string& msg) {
    if (!debug_) return;
    Log(msg);
  }

 private:
  bool debug_;
  std::mutex mutex_;
};

void PrintUsage() {
  std::fprintf(
      stderr,
      "Usage: udpoffset [REMOTE_IP] [options]\n"
      "UDP-based naive clock offset measurement tool.\n"
      "  REMOTE_IP            Stream timestamps to this reflector and print\n"
      "                       offset samples; without it, act as reflector\n"
      "Options:\n"
      "  -p, --port N         UDP port (default 55555)\n"
      "  -i, --interval SEC   Timestamp sending interval in seconds\n"
      "                       (default 1.0, 0 < SEC <= 1e9)\n"
      "  --send-only          Send timestamps without measuring replies\n"
      "  --one-way            Reflector: also print one-way arrival records\n"
      "  --debug              Enable debug logging\n"
      "  -h, --help           Show this help\n");
}

bool ParsePort(const char* text, uint16_t* out) {
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || v < 0 || v > 65535) {
    return false;
  }
  *out = static_cast<uint16_t>(v);
  return true;
}

bool ParseInterval(const char* text, double* out) {
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(text, &end);
  if (errno != 0 || end == text || *end != '\0' || !std::isfinite(v) ||
      v <= 0.0 || v > udpoffset::MeterOptions::kMaxIntervalSeconds) {
    return false;
  }
  *out = v;
  return true;
}

int RunReflector(uint16_t port, bool one_way, bool debug, Logger* logger) {
  auto opts_builder = udpoffset::ReflectorOptions::Builder()
                          .LogSink([logger](const std::string& msg) {
                            logger->Log(msg);
                          })
                          .Verbose(debug);
  if (one_way) {
    opts_builder.ArrivalSink([](const udpoffset::ArrivalRecord& r) {
      std::printf("%s\n", udpoffset::FormatArrival(r).c_str());
      std::fflush(stdout);
    });
  }

  udpoffset::Reflector reflector;
  if (!reflector.Start(port, &udpoffset::RealtimeClock::Instance(),
                       opts_builder.Build())) {
    std::fprintf(stderr, "failed to start reflector: %s\n",
                 reflector.GetStats().last_error.c_str());
    return 1;
  }

  const bool ok = reflector.Wait();
  std::ostringstream oss;
  oss << "Reflector stopped: " << reflector.GetStats();
  logger->Debug(oss.str());
  reflector.Stop();
  return ok ? 0 : 1;
}

// Called after a successful Start() and before each sample, whichever comes
// first, so the header never precedes a failed start.
void PrintSampleHeaderOnce() {
  static std::once_flag once;
  std::call_once(once, []() {
    std::printf("%s\n", udpoffset::SampleHeader().c_str());
    std::fflush(stdout);
  });
}

int RunMeter(const std::string& remote_ip, uint16_t port, double interval,
             bool measure, bool debug, Logger* logger) {
  auto opts = udpoffset::MeterOptions::Builder()
                  .IntervalSeconds(interval)
                  .Measure(measure)
                  .Verbose(debug)
                  .LogSink([logger](const std::string& msg) {
                    logger->Log(msg);
                  })
                  .SampleSink([](const udpoffset::OffsetSample& s) {
                    PrintSampleHeaderOnce();
                    std::printf("%s\n", udpoffset::FormatSample(s).c_str());
                    std::fflush(stdout);
                  })
                  .Build();

  udpoffset::OffsetMeter meter;
  if (!meter.Start(remote_ip, port, &udpoffset::RealtimeClock::Instance(),
                   opts)) {
    const udpoffset::Stats st = meter.GetStats();
    std::fprintf(stderr, "failed to start: %s\n", st.last_error.c_str());
    if (st.last_error_code == udpoffset::ErrorCode::kInvalidArgument) {
      PrintUsage();
      return 2;
    }
    return 1;
  }
  if (measure) PrintSampleHeaderOnce();

  const bool ok = meter.Wait();
  std::ostringstream oss;
  oss << "Meter stopped: " << meter.GetStats();
  logger->Debug(oss.str());
  meter.Stop();
  return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  std::string remote_ip;
  uint16_t port = udpoffset::kDefaultPort;
  double interval = udpoffset::MeterOptions::kDefaultIntervalSeconds;
  bool send_only = false;
  bool one_way = false;
  bool debug = false;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    if ((a == "-p" || a == "--port") && need(1)) {
      if (!ParsePort(argv[++i], &port)) {
        std::fprintf(stderr, "Invalid port: %s\n", argv[i]);
        PrintUsage();
        return 2;
      }
    } else if ((a == "-i" || a == "--interval") && need(1)) {
      if (!ParseInterval(argv[++i], &interval)) {
        std::fprintf(stderr, "Invalid interval: %s\n", argv[i]);
        PrintUsage();
        return 2;
      }
    } else if (a == "--send-only") {
      send_only = true;
    } else if (a == "--one-way") {
      one_way = true;
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else if (!a.empty() && a[0] != '-' && remote_ip.empty()) {
      remote_ip = a;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }

  Logger logger(debug);

  if (remote_ip.empty()) {
    if (send_only) {
      std::fprintf(stderr, "--send-only requires REMOTE_IP\n");
      return 2;
    }
    return RunReflector(port, one_way, debug, &logger);
  }

  if (one_way) {
    std::fprintf(stderr, "--one-way applies to reflector mode only\n");
    return 2;
  }
  return RunMeter(remote_ip, port, interval, !send_only, debug, &logger);
}
