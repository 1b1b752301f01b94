#pragma once

/**
 * Prover Logic
 *
 * Turns wire requests into ShardingEngine calls and maps the outcome back
 * to a wire response. Also holds the bidding parameters handed to the
 * external bidding client through the status request.
 */

#include <string>
#include <nlohmann/json.hpp>

#include "protocol.hpp"
#include "engine/sharding_engine.hpp"

namespace zkshard {
namespace prover_server {

/**
 * Parameters of `zkshard_node prove`. They are validated here and passed
 * on unchanged; the node itself never signs or bids.
 */
struct BiddingParams {
    std::string rpc_url;
    std::string private_key;     // hex, optional 0x prefix, 32 bytes
    double throughput = 0.0;     // cycles per second offered
    std::string bid;             // decimal amount in base units
    std::string prover_address;  // 0x + 20 bytes hex

    /**
     * Throws ConfigError naming the offending parameter.
     */
    void validate() const;

    /**
     * Everything except the signing key.
     */
    nlohmann::json to_public_json() const;
};

class NodeProver {
public:
    NodeProver(ShardingEngine& engine, BiddingParams bidding);

    /**
     * Never throws; every failure becomes a non-Ok response.
     */
    NodeResponse handle(const NodeRequest& request);

    /**
     * Bidding parameters (without key) plus pool size
     */
    nlohmann::json status_json() const;

private:
    NodeResponse prove(const NodeRequest& request);

    ShardingEngine& engine_;
    BiddingParams bidding_;
};

} // namespace prover_server
} // namespace zkshard
