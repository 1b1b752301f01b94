#include <gtest/gtest.h>
#include "engine/sharding_engine.hpp"
#include "backend/cpu_backend.hpp"
#include "common/errors.hpp"
#include "vm/vm_state.hpp"

#include <chrono>
#include <future>

using namespace zkshard;

class ShardingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.devices.profile = DeviceProfile::Rtx4090;
        config_.devices.virtual_device_count = 2;
        config_.sharding.shards_per_device = 2;
        config_.sharding.min_cycles_per_shard = 500;
        config_.sharding.max_cycles_per_shard = 5000;
        config_.sharding.checkpoint_interval_cycles = 500;
    }

    static ProofRequest request_of(const Program& program, const Bytes& input, uint64_t cycles) {
        ProofRequest r;
        r.program_binary = program.to_binary();
        r.input_bytes = input;
        r.estimated_total_cycles = cycles;
        return r;
    }

    static Digest expected_end_state(const Program& program, const Bytes& input, uint64_t cycles) {
        VMState vm(program, input);
        vm.run_until(cycles);
        return vm.state_digest();
    }

    EngineConfig config_;
};

// Test a sharded proof covers the whole execution
TEST_F(ShardingEngineTest, ProvesEndToEnd) {
    auto engine = ShardingEngine::from_config(config_);
    EXPECT_EQ(engine->pool().total_slots(), 4u);
    EXPECT_EQ(engine->sharding().min_cycles_per_shard, 500u);

    Program program = Program::synthetic(11, 40);
    Bytes input = {10, 20, 30, 40, 50};
    FinalProof fp = engine->prove(request_of(program, input, 4000));
    EXPECT_EQ(fp.num_shards, 4u);
    EXPECT_EQ(fp.total_cycles, 4000u);

    auto proof = RangeProof::decode(fp.proof);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->start_cycle, 0u);
    EXPECT_EQ(proof->end_cycle, 4000u);
    EXPECT_EQ(proof->segments, 4u);
    EXPECT_EQ(proof->program_digest, program.hash());
    EXPECT_EQ(proof->end_state, expected_end_state(program, input, 4000));
    EXPECT_EQ(engine->pool().total_in_use(), 0u);
}

// Test concurrent requests share the pool and stay independent
TEST_F(ShardingEngineTest, ConcurrentRequests) {
    config_.orchestrator.combine_strategy = CombineStrategy::Tree;
    ShardingEngine engine(config_, virtual_devices(2, 24ULL << 30), std::make_shared<CpuBackend>());

    Program a = Program::synthetic(1, 32);
    Program b = Program::synthetic(2, 48);
    Bytes input_a = {1};
    Bytes input_b = {2, 2};

    auto fa = std::async(std::launch::async, [&]() { return engine.prove(request_of(a, input_a, 3000)); });
    auto fb = std::async(std::launch::async, [&]() { return engine.prove(request_of(b, input_b, 5000)); });
    FinalProof pa = fa.get();
    FinalProof pb = fb.get();

    auto ra = RangeProof::decode(pa.proof);
    auto rb = RangeProof::decode(pb.proof);
    ASSERT_TRUE(ra.has_value());
    ASSERT_TRUE(rb.has_value());
    EXPECT_EQ(ra->end_state, expected_end_state(a, input_a, 3000));
    EXPECT_EQ(rb->end_state, expected_end_state(b, input_b, 5000));
    EXPECT_EQ(ra->program_digest, a.hash());
    EXPECT_EQ(rb->program_digest, b.hash());
    EXPECT_LE(engine.pool().peak_in_use(0), 2u);
    EXPECT_LE(engine.pool().peak_in_use(1), 2u);
}

// Test plan() uses the resolved config
TEST_F(ShardingEngineTest, PlanMatchesConfig) {
    ShardingEngine engine(config_, virtual_devices(2, 24ULL << 30), std::make_shared<CpuBackend>());
    ShardPlan plan = engine.plan(100000);
    EXPECT_TRUE(plan.is_partition());
    EXPECT_EQ(plan.size(), 20u);  // 5000-cycle cap
    EXPECT_FALSE(plan.shards[1].checkpoint.has_value());
}

// Test construction without devices
TEST_F(ShardingEngineTest, NoDevices) {
    try {
        ShardingEngine engine(config_, {}, std::make_shared<CpuBackend>());
        FAIL() << "expected DeviceUnavailable";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DeviceUnavailable);
    }
}

// Test a bad request surfaces its terminal cause
TEST_F(ShardingEngineTest, InvalidRequestReported) {
    ShardingEngine engine(config_, virtual_devices(1, 24ULL << 30), std::make_shared<CpuBackend>());
    ProofRequest bad;
    bad.program_binary = {0xFF};
    bad.estimated_total_cycles = 100;
    try {
        engine.prove(bad);
        FAIL() << "expected InvalidRequest";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRequest);
    }
}

// Test completed and failed requests are counted
TEST_F(ShardingEngineTest, MetricsTrackRequests) {
    ShardingEngine engine(config_, virtual_devices(2, 24ULL << 30), std::make_shared<CpuBackend>());
    MetricsSnapshot empty = engine.metrics().snapshot();
    EXPECT_EQ(empty.proofs_completed, 0u);
    ASSERT_EQ(empty.devices.size(), 2u);
    EXPECT_DOUBLE_EQ(empty.devices[0].utilization, 0.0);

    Program program = Program::synthetic(5, 32);
    engine.prove(request_of(program, {1, 2}, 4000));
    engine.prove(request_of(program, {3}, 2000));

    ProofRequest late = request_of(program, {4}, 2000);
    late.deadline = ProofRequest::Clock::now() - std::chrono::milliseconds(1);
    EXPECT_THROW(engine.prove(late), EngineError);

    MetricsSnapshot m = engine.metrics().snapshot();
    EXPECT_EQ(m.proofs_completed, 2u);
    EXPECT_EQ(m.proofs_failed, 1u);
    EXPECT_EQ(m.deadline_misses, 1u);
    EXPECT_EQ(m.shards_processed, 4u + 4u);  // 1000- and 500-cycle shards
    EXPECT_EQ(m.cycles_proved, 6000u);
    EXPECT_GT(m.fastest_latency.count(), 0.0);
    EXPECT_LE(m.fastest_latency, m.average_latency);
    EXPECT_LE(m.average_latency, m.slowest_latency);

    uint64_t succeeded = 0;
    for (const auto& d : m.devices) {
        succeeded += d.shards_succeeded;
        EXPECT_EQ(d.shards_failed, 0u);
        EXPECT_GE(d.utilization, 0.0);
        EXPECT_LE(d.utilization, 1.0);
    }
    EXPECT_EQ(succeeded, 8u);

    nlohmann::json j = m.to_json();
    EXPECT_EQ(j.at("proofs_completed").get<uint64_t>(), 2u);
    EXPECT_EQ(j.at("devices").size(), 2u);
}
