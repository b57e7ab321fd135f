// JSON-driven replay of trade sequences against pool snapshots.
//
// Each (pool, sequence) pair is an independent task: a pool starts from its
// configured reserves and every action either quotes against the current
// state or commits a swap and advances it. Tasks share nothing but the input
// documents, so they run on a plain worker pool.
#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <mutex>
#include <string>

#include "pool_state.hpp"

namespace cpswap {
namespace sim {

namespace json = boost::json;

struct PoolConfig {
    std::string name;
    PoolState state;  // oriented token0 -> token1
};

struct RunOptions {
    size_t threads = 1;
    size_t snapshot_every = 1;  // 0 = final state only
    bool trace = false;

    // CPP_THREADS, SNAPSHOT_EVERY, TRACE
    static RunOptions from_env();
};

// {"name", "reserves": [r0, r1], "fee": [num, den]}; amounts are decimal strings.
PoolConfig parse_pool_config(const json::object& obj);

// Snapshot of a token0-oriented state.
json::object report_state(const PoolState& state);

// Replays one sequence. Action failures are recorded in the reported state
// and do not stop the sequence.
json::object run_sequence(
    const PoolConfig& pool,
    const json::object& sequence,
    const RunOptions& options,
    std::mutex& io_mu
);

// Cross product of pools x sequences, run on options.threads workers.
// A malformed pool or sequence entry fails only its own tasks.
json::object run_all(
    const json::array& pools,
    const json::array& sequences,
    const RunOptions& options
);

// Reads both files, writes output_file. Returns a process exit code.
int run_harness(
    const std::string& pools_file,
    const std::string& sequences_file,
    const std::string& output_file
);

} // namespace sim
} // namespace cpswap
