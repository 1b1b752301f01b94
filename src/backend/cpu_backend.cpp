#include "backend/cpu_backend.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "hash/sponge.hpp"
#include "parallel/thread_coordination.h"
#include "vm/vm_state.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace zkshard {

CpuBackend::CpuBackend(int num_threads)
    : num_threads_(parallel::get_optimal_thread_count(num_threads)) {}

void CpuBackend::note_team_size(int team) {
    int seen = peak_team_size_.load();
    while (team > seen && !peak_team_size_.compare_exchange_weak(seen, team)) {
    }
}

Digest CpuBackend::commit_window(const Digest& commitment, const std::vector<uint64_t>& rows,
                                 int num_threads, int* team_size) {
    const size_t num_blocks = (rows.size() + BLOCK_ROWS - 1) / BLOCK_ROWS;
    std::vector<Digest> block_digests(num_blocks);
    int team = 1;

    #pragma omp parallel for schedule(static) num_threads(std::max(1, num_threads))
    for (long long b = 0; b < static_cast<long long>(num_blocks); ++b) {
#ifdef _OPENMP
        if (b == 0) {
            team = omp_get_num_threads();
        }
#endif
        size_t begin = static_cast<size_t>(b) * BLOCK_ROWS;
        size_t end = std::min(begin + BLOCK_ROWS, rows.size());
        std::vector<uint64_t> block(rows.begin() + begin, rows.begin() + end);
        block_digests[b] = Sponge::hash_varlen(block);
    }
    if (team_size) {
        *team_size = team;
    }

    Digest acc = commitment;
    for (const auto& d : block_digests) {
        acc = Sponge::hash_pair(acc, d);
    }
    return acc;
}

RangeResult CpuBackend::prove_cycle_range(
    DeviceId device,
    const Program& program,
    const Bytes& input,
    const std::optional<ExecutionContext>& start,
    uint64_t cycle_end,
    bool capture_end,
    const CancelToken& cancel
) {
    auto t0 = std::chrono::high_resolution_clock::now();

    if (start && start->program_digest != program.hash()) {
        throw BackendError("start checkpoint was taken for program " + start->program_digest.to_hex()
            + ", not " + program.hash().to_hex());
    }

    VMState vm = start ? VMState::resume(program, input, start->snapshot) : VMState(program, input);
    const uint64_t start_cycle = vm.cycle();
    if (cycle_end <= start_cycle) {
        throw BackendError("empty cycle range [" + std::to_string(start_cycle) + ", "
            + std::to_string(cycle_end) + ")");
    }

    RangeProof proof;
    proof.program_digest = program.hash();
    proof.start_cycle = start_cycle;
    proof.end_cycle = cycle_end;
    proof.start_state = vm.state_digest();
    proof.segments = 1;

    Digest commitment = Sponge::hash_pair(proof.program_digest, proof.start_state);
    std::vector<uint64_t> rows;
    int team = 1;
    rows.reserve(static_cast<size_t>(std::min<uint64_t>(WINDOW_ROWS, cycle_end - start_cycle)));

    while (vm.cycle() < cycle_end) {
        rows.push_back(vm.trace_row_word());
        vm.step_cycle();

        if (rows.size() == WINDOW_ROWS) {
            commitment = commit_window(commitment, rows, num_threads_, &team);
            note_team_size(team);
            rows.clear();
        }
        if ((vm.cycle() - start_cycle) % CANCEL_CHECK_CYCLES == 0 && cancel.is_cancelled()) {
            throw BackendError("proving cancelled at cycle " + std::to_string(vm.cycle()));
        }
    }
    if (!rows.empty()) {
        commitment = commit_window(commitment, rows, num_threads_, &team);
        note_team_size(team);
    }

    proof.end_state = vm.state_digest();
    proof.commitment = commitment;

    RangeResult result;
    result.proof = proof.encode();
    if (capture_end && vm.at_boundary()) {
        result.end_checkpoint = CheckpointManager::seal(vm.snapshot(), program.hash());
    }

    ZKSHARD_PROFILE_COUT("[cpu-backend] device " << device << " proved [" << start_cycle << ", "
        << cycle_end << ") in " << (std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - t0).count()) << " ms" << std::endl);
    return result;
}

Bytes CpuBackend::combine(const Bytes& a_bytes, const Bytes& b_bytes) {
    auto a = RangeProof::decode(a_bytes);
    auto b = RangeProof::decode(b_bytes);
    if (!a || !b) {
        throw BackendError(std::string("malformed range proof (") + (!a ? "left" : "right") + ")");
    }
    if (a->program_digest != b->program_digest) {
        throw BackendError("cannot combine proofs of programs " + a->program_digest.to_hex()
            + " and " + b->program_digest.to_hex());
    }
    if (a->end_cycle != b->start_cycle) {
        throw BackendError("ranges not contiguous: left ends at " + std::to_string(a->end_cycle)
            + ", right starts at " + std::to_string(b->start_cycle));
    }
    if (a->end_state != b->start_state) {
        throw BackendError("boundary state mismatch at cycle " + std::to_string(a->end_cycle));
    }

    RangeProof combined;
    combined.program_digest = a->program_digest;
    combined.start_cycle = a->start_cycle;
    combined.end_cycle = b->end_cycle;
    combined.start_state = a->start_state;
    combined.end_state = b->end_state;
    combined.commitment = Sponge::hash_pair(a->commitment, b->commitment);
    combined.segments = a->segments + b->segments;
    return combined.encode();
}

} // namespace zkshard
