#include "prover.hpp"
#include "common/debug_control.hpp"

#include <iostream>
#include <chrono>
#include <cctype>
#include <utility>

namespace zkshard {
namespace prover_server {

namespace {

double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

std::string strip_hex_prefix(const std::string& s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        return s.substr(2);
    }
    return s;
}

bool is_hex(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_decimal(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// BiddingParams
// ============================================================================

void BiddingParams::validate() const {
    if (rpc_url.rfind("http://", 0) != 0 && rpc_url.rfind("https://", 0) != 0) {
        throw ConfigError("--rpc-url must be an http:// or https:// URL");
    }
    std::string key = strip_hex_prefix(private_key);
    if (key.size() != 64 || !is_hex(key)) {
        throw ConfigError("--private-key must be 32 bytes of hex");
    }
    if (!(throughput > 0.0)) {
        throw ConfigError("--throughput must be > 0");
    }
    if (!is_decimal(bid)) {
        throw ConfigError("--bid must be a non-negative integer amount");
    }
    if (prover_address.size() != 42 || strip_hex_prefix(prover_address).size() != 40 ||
        !is_hex(strip_hex_prefix(prover_address))) {
        throw ConfigError("--prover must be a 0x-prefixed 20-byte address");
    }
}

nlohmann::json BiddingParams::to_public_json() const {
    nlohmann::json j;
    j["rpc_url"] = rpc_url;
    j["throughput"] = throughput;
    j["bid"] = bid;
    j["prover"] = prover_address;
    return j;
}

// ============================================================================
// NodeProver
// ============================================================================

NodeProver::NodeProver(ShardingEngine& engine, BiddingParams bidding)
    : engine_(engine), bidding_(std::move(bidding)) {
    bidding_.validate();
}

nlohmann::json NodeProver::status_json() const {
    nlohmann::json j;
    j["bidding"] = bidding_.to_public_json();
    j["pool"] = {
        {"devices", engine_.pool().device_ids().size()},
        {"total_slots", engine_.pool().total_slots()},
        {"slots_in_use", engine_.pool().total_in_use()},
    };
    j["metrics"] = engine_.metrics().snapshot().to_json();
    return j;
}

NodeResponse NodeProver::handle(const NodeRequest& request) {
    if (request.kind == RequestKind::Status) {
        std::string dumped = status_json().dump();
        return NodeResponse::ok(request.job_id, Bytes(dumped.begin(), dumped.end()));
    }
    return prove(request);
}

NodeResponse NodeProver::prove(const NodeRequest& request) {
    auto start = std::chrono::high_resolution_clock::now();

    ProofRequest proof_request;
    proof_request.program_binary = request.program_binary;
    proof_request.input_bytes = request.input;
    proof_request.estimated_total_cycles = request.estimated_total_cycles;
    if (request.deadline_ms > 0) {
        proof_request.deadline = ProofRequest::Clock::now() + std::chrono::milliseconds(request.deadline_ms);
    }

    ZKSHARD_DEBUG_COUT("[prover] job_id=" << request.job_id
                       << " program=" << request.program_binary.size() << "B"
                       << " input=" << request.input.size() << "B"
                       << " cycles=" << request.estimated_total_cycles << std::endl);

    try {
        FinalProof proof = engine_.prove(proof_request);
        ZKSHARD_PROFILE_COUT("[prover] job_id=" << request.job_id << " proved "
                             << proof.total_cycles << " cycles in " << proof.num_shards
                             << " shard(s), " << elapsed_ms(start) << " ms" << std::endl);
        return NodeResponse::ok(request.job_id, std::move(proof.proof));
    } catch (const EngineError& e) {
        return NodeResponse::failure(status_for(e.kind()), request.job_id, e.what());
    } catch (const std::exception& e) {
        return NodeResponse::error(request.job_id, std::string("Exception: ") + e.what());
    }
}

} // namespace prover_server
} // namespace zkshard
