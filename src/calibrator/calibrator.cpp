#include "calibrator/calibrator.hpp"
#include "common/errors.hpp"
#include "vm/program.hpp"
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace zkshard {

// ============================================================================
// Pricing
// ============================================================================

void EconomicParams::validate() const {
    if (!(usd_cost_per_hour >= 0.0)) {
        throw ConfigError("usd_cost_per_hour must be >= 0");
    }
    if (!(utilization_rate > 0.0 && utilization_rate <= 1.0)) {
        throw ConfigError("utilization_rate must be in (0, 1]");
    }
    if (!(profit_margin >= 0.0 && profit_margin < 1.0)) {
        throw ConfigError("profit_margin must be in [0, 1)");
    }
    if (!(prove_price_per_unit > 0.0)) {
        throw ConfigError("prove_price must be > 0");
    }
}

double estimate_bid_price(double throughput_cycles_per_second, const EconomicParams& economics) {
    if (!(throughput_cycles_per_second > 0.0)) {
        throw std::invalid_argument("throughput must be positive to price a bid");
    }
    const double utilized_cycles_per_hour = throughput_cycles_per_second * 3600.0 * economics.utilization_rate;
    const double usd_per_cycle = economics.usd_cost_per_hour / utilized_cycles_per_hour
        * (1.0 + economics.profit_margin);
    return usd_per_cycle * 1e9 / economics.prove_price_per_unit;
}

// ============================================================================
// Report
// ============================================================================

CalibrationReport CalibrationReport::from_metrics(const CalibratorMetrics& metrics) {
    CalibrationReport report;
    report.estimated_throughput = metrics.recommended_bid_throughput;
    report.estimated_bid_price = metrics.recommended_bid_price;
    return report;
}

std::string CalibrationReport::to_table() const {
    std::ostringstream throughput;
    throughput << std::fixed << std::setprecision(0) << estimated_throughput << " cycles/s";
    std::ostringstream price;
    price << std::fixed << std::setprecision(6) << estimated_bid_price << " PROVE per 1B cycles";

    const std::string rule = "+----------------------+--------------------------------------+";
    std::ostringstream oss;
    oss << rule << "\n"
        << "| " << std::left << std::setw(20) << "Metric" << " | " << std::setw(36) << "Value" << " |\n"
        << rule << "\n"
        << "| " << std::setw(20) << "Estimated Throughput" << " | " << std::setw(36) << throughput.str() << " |\n"
        << "| " << std::setw(20) << "Estimated Bid Price" << " | " << std::setw(36) << price.str() << " |\n"
        << rule << "\n";
    return oss.str();
}

nlohmann::json CalibrationReport::to_json() const {
    nlohmann::json j;
    j["estimated_throughput"] = estimated_throughput;
    j["estimated_bid_price"] = estimated_bid_price;
    return j;
}

// ============================================================================
// Calibrator
// ============================================================================

Calibrator::Calibrator(const CalibrationSection& options, const EconomicParams& economics)
    : options_(options), economics_(economics) {
    economics_.validate();
}

double Calibrator::effective_throughput(uint64_t cycles_per_run,
                                        const std::vector<std::chrono::duration<double>>& run_durations) {
    if (run_durations.empty()) {
        return 0.0;
    }
    auto slowest = *std::max_element(run_durations.begin(), run_durations.end());
    if (slowest.count() <= 0.0) {
        throw std::invalid_argument("calibration runs reported no elapsed time");
    }
    const double total_cycles = static_cast<double>(cycles_per_run) * static_cast<double>(run_durations.size());
    return total_cycles / slowest.count();
}

std::optional<CalibratorMetrics> Calibrator::calibrate(ShardingEngine& engine) const {
    if (engine.pool().empty()) {
        std::cerr << "[calibrator] WARNING: no devices found, skipping calibration" << std::endl;
        return std::nullopt;
    }

    const uint32_t runs = engine.pool().total_slots();
    const uint64_t cycles = options_.cycles_per_run > 0
        ? options_.cycles_per_run
        : engine.sharding().min_cycles_per_shard;

    std::cout << "[calibrator] " << runs << " concurrent run(s) of " << cycles << " cycles" << std::endl;

    std::vector<ProofRequest> requests(runs);
    for (uint32_t i = 0; i < runs; ++i) {
        requests[i].program_binary = Program::synthetic(options_.seed + i, options_.program_length).to_binary();
        for (uint32_t b = 0; b < 32; ++b) {
            requests[i].input_bytes.push_back(static_cast<uint8_t>((options_.seed * 31 + i * 7 + b) & 0xFF));
        }
        requests[i].estimated_total_cycles = cycles;
    }

    const auto start = std::chrono::steady_clock::now();
    std::vector<std::future<std::chrono::duration<double>>> futures;
    futures.reserve(runs);
    for (uint32_t i = 0; i < runs; ++i) {
        const ProofRequest* request = &requests[i];
        futures.push_back(std::async(std::launch::async, [&engine, request, start]() {
            engine.prove(*request);
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
        }));
    }

    // Wait for every run before rethrowing the first failure
    std::vector<std::chrono::duration<double>> durations;
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            durations.push_back(f.get());
        } catch (const std::exception&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    CalibratorMetrics metrics;
    metrics.runs = runs;
    metrics.cycles_per_run = cycles;
    metrics.slowest_run = *std::max_element(durations.begin(), durations.end());
    metrics.measured_throughput_cycles_per_second = effective_throughput(cycles, durations);
    metrics.recommended_bid_throughput = metrics.measured_throughput_cycles_per_second * options_.safety_margin;
    metrics.recommended_bid_price = estimate_bid_price(metrics.measured_throughput_cycles_per_second, economics_);

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(0) << metrics.measured_throughput_cycles_per_second
            << " cycles/s (slowest run " << std::setprecision(3) << metrics.slowest_run.count() << " s)";
    std::cout << "[calibrator] measured " << summary.str() << std::endl;
    return metrics;
}

std::optional<CalibratorMetrics> Calibrator::calibrate(const EngineConfig& config,
                                                       std::vector<DeviceInfo> devices,
                                                       std::shared_ptr<ProvingBackend> backend) const {
    if (devices.empty()) {
        std::cerr << "[calibrator] WARNING: no devices found, skipping calibration" << std::endl;
        return std::nullopt;
    }
    ShardingEngine engine(config, std::move(devices), std::move(backend));
    return calibrate(engine);
}

} // namespace zkshard
