#pragma once

#include "backend/backend.hpp"
#include "config/engine_config.hpp"
#include "device/device_info.hpp"
#include "engine/sharding_engine.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zkshard {

/**
 * Economic inputs of the bid price formula.
 */
struct EconomicParams {
    double usd_cost_per_hour = 0.0;
    double utilization_rate = 1.0;      // (0, 1]
    double profit_margin = 0.0;         // [0, 1)
    double prove_price_per_unit = 1.0;  // USD per PROVE token

    /**
     * Throws ConfigError naming the out-of-range parameter.
     */
    void validate() const;
};

/**
 * Bid price in PROVE per 1e9 cycles:
 *   usd_per_cycle = usd_cost_per_hour / (throughput * 3600 * utilization)
 *                   * (1 + profit_margin)
 *   price = usd_per_cycle * 1e9 / prove_price_per_unit
 * Throws std::invalid_argument when throughput is not positive.
 */
double estimate_bid_price(double throughput_cycles_per_second, const EconomicParams& economics);

struct CalibratorMetrics {
    double measured_throughput_cycles_per_second = 0.0;
    double recommended_bid_throughput = 0.0;
    double recommended_bid_price = 0.0;
    uint32_t runs = 0;
    uint64_t cycles_per_run = 0;
    std::chrono::duration<double> slowest_run{0};
};

/**
 * Two-row calibration report.
 */
struct CalibrationReport {
    double estimated_throughput = 0.0;
    double estimated_bid_price = 0.0;

    static CalibrationReport from_metrics(const CalibratorMetrics& metrics);

    std::string to_table() const;
    nlohmann::json to_json() const;
};

/**
 * Calibrator - measures what the pool can sustain
 *
 * Runs one synthetic request per pool slot, all at once, through
 * ShardingEngine::prove (the production path). Throughput is the sum of
 * proved cycles over the wall-clock time of the slowest run.
 */
class Calibrator {
public:
    Calibrator(const CalibrationSection& options, const EconomicParams& economics);

    /**
     * Returns nullopt (with a warning) for an empty pool. Proving errors
     * propagate as EngineError.
     */
    std::optional<CalibratorMetrics> calibrate(ShardingEngine& engine) const;

    /**
     * Build an engine over `devices` and calibrate it; nullopt when
     * `devices` is empty.
     */
    std::optional<CalibratorMetrics> calibrate(const EngineConfig& config,
                                               std::vector<DeviceInfo> devices,
                                               std::shared_ptr<ProvingBackend> backend) const;

    /**
     * sum(cycles) / slowest duration
     */
    static double effective_throughput(uint64_t cycles_per_run,
                                       const std::vector<std::chrono::duration<double>>& run_durations);

private:
    CalibrationSection options_;
    EconomicParams economics_;
};

} // namespace zkshard
