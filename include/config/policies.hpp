#pragma once

#include <string>

namespace zkshard {

/**
 * What the orchestrator does about ProofRequest::deadline.
 */
enum class DeadlinePolicy {
    Ignore,
    AbortWhenExceeded,   // abort once the deadline has passed
    AbortWhenProjected   // also abort when projected completion passes it
};

/**
 * Order in which partial proofs are folded by the recursion combiner.
 */
enum class CombineStrategy {
    Sequential,  // left fold over shard order
    Tree         // balanced tree over adjacent pairs
};

// Both parsers throw ConfigError on unknown names
DeadlinePolicy deadline_policy_from_string(const std::string& s);
const char* to_string(DeadlinePolicy policy);

CombineStrategy combine_strategy_from_string(const std::string& s);
const char* to_string(CombineStrategy strategy);

} // namespace zkshard
