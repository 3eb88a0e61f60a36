// =================================================================
// include/Arbiter/Metrics.hpp
// =================================================================
// Counters and histograms keyed by {app, model, provider, reason}.

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace Arbiter {

/**
 * @brief Label set of a metric sample
 */
struct MetricKey {
    std::string app;
    std::string model;
    std::string provider;
    std::string reason;

    bool operator<(const MetricKey& other) const {
        return std::tie(app, model, provider, reason) <
               std::tie(other.app, other.model, other.provider, other.reason);
    }
};

/**
 * @brief Metrics destination
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void increment(const std::string& name, const MetricKey& key, double value = 1.0) = 0;
    virtual void observe(const std::string& name, const MetricKey& key, double value) = 0;
};

using MetricsSinkPtr = std::shared_ptr<MetricsSink>;

/**
 * @brief Summary of a histogram series
 */
struct HistogramSummary {
    size_t count = 0;
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;
};

/**
 * @brief Process-local metrics store
 */
class InMemoryMetricsSink : public MetricsSink {
public:
    void increment(const std::string& name, const MetricKey& key, double value = 1.0) override;
    void observe(const std::string& name, const MetricKey& key, double value) override;

    /**
     * @brief Counter value for an exact key
     */
    double counter(const std::string& name, const MetricKey& key) const;

    /**
     * @brief Counter summed over every key
     */
    double total(const std::string& name) const;

    /**
     * @brief Counter summed over keys with the given reason
     */
    double totalForReason(const std::string& name, const std::string& reason) const;

    HistogramSummary histogram(const std::string& name, const MetricKey& key) const;

    /**
     * @brief Text dump, one series per line
     */
    std::string render() const;

private:
    std::map<std::string, std::map<MetricKey, double>> m_counters;
    std::map<std::string, std::map<MetricKey, HistogramSummary>> m_histograms;
    mutable std::mutex m_mutex;
};

} // namespace Arbiter
