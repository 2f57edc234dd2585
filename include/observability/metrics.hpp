#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

// Metric names shared by the engine, the coordinators and the admin tool.
namespace metric {
constexpr char kTransfers[] = "ledger_transfers_total";
constexpr char kTransferReplays[] = "ledger_transfer_replays_total";
constexpr char kTransferFailures[] = "ledger_transfer_failures_total";
constexpr char kAccountsCreated[] = "ledger_accounts_created_total";
constexpr char kTransferDuration[] = "ledger_transfer_duration_seconds";
constexpr char kLockWait[] = "ledger_lock_wait_seconds";
constexpr char kPoolInUse[] = "ledger_pool_connections_in_use";
}  // namespace metric

/**
 * In-process metrics: counters, gauges and histograms with Prometheus text output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  void incrementGauge(const std::string& name, double value = 1.0);
  void decrementGauge(const std::string& name, double value = 1.0);

  // Histogram: distribution of values, in seconds for the ledger's timings
  void observeHistogram(const std::string& name, double value);

  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  size_t histogramCount(const std::string& name) const;

  /**
   * Observes the time between construction and destruction into a histogram.
   */
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus text format, names sorted
  std::string exportMetrics() const;

  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;

  static std::vector<double> defaultBuckets();
};

// Process-wide collector
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // METRICS_HPP_
