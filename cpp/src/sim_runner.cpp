#include "sim_runner.hpp"
#include "quote_engine.hpp"

#include <boost/json/src.hpp>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <thread>
#include <vector>

namespace cpswap {
namespace sim {

namespace {

std::string get_string(const json::object& obj, const char* key) {
    return std::string(obj.at(key).as_string().c_str());
}

// "name" of a pool or sequence entry, empty when the entry is malformed.
std::string name_of(const json::value& v) {
    const json::object* obj = v.if_object();
    if (!obj) return std::string();
    const json::value* name = obj->if_contains("name");
    return (name && name->is_string()) ? std::string(name->as_string().c_str()) : std::string();
}

std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open " + path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Applies one action to a token0-oriented state. Swaps replace state;
// quotes leave it alone. Returns the fields to merge into the snapshot.
json::object apply_action(PoolState& state, const json::object& act) {
    const std::string type = get_string(act, "type");
    const std::int64_t i = act.if_contains("i") ? act.at("i").as_int64() : 0;
    if (i != 0 && i != 1) {
        throw std::invalid_argument("coin index out of range");
    }
    const PoolState view = (i == 0) ? state : state.reversed();

    json::object out;
    if (type == "quote_in") {
        out["quote"] = quote_forward(view, parse_amount(get_string(act, "dx"))).str();
    } else if (type == "quote_out") {
        out["quote"] = quote_reverse(view, parse_amount(get_string(act, "dy"))).str();
    } else if (type == "exchange") {
        uint256 min_dy = act.if_contains("min_dy") ? parse_amount(get_string(act, "min_dy")) : uint256(0);
        SwapResult r = swap_exact_in(view, parse_amount(get_string(act, "dx")), min_dy);
        state = (i == 0) ? r.next_state : r.next_state.reversed();
        out["dx"] = r.amount_in.str();
        out["dy"] = r.amount_out.str();
    } else if (type == "exchange_out") {
        uint256 max_dx = act.if_contains("max_dx") ? parse_amount(get_string(act, "max_dx"))
                                                   : ConstantProductMath::max_uint256();
        SwapResult r = swap_exact_out(view, parse_amount(get_string(act, "dy")), max_dx);
        state = (i == 0) ? r.next_state : r.next_state.reversed();
        out["dx"] = r.amount_in.str();
        out["dy"] = r.amount_out.str();
    } else {
        throw std::invalid_argument("unknown action type: " + type);
    }
    return out;
}

} // namespace

RunOptions RunOptions::from_env() {
    RunOptions o;
    o.threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    if (const char* thr = std::getenv("CPP_THREADS")) {
        try {
            o.threads = std::max<size_t>(1, std::stoul(thr));
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid CPP_THREADS=" << thr << std::endl;
        }
    }
    if (const char* se = std::getenv("SNAPSHOT_EVERY")) {
        try {
            long v = std::stol(se);
            o.snapshot_every = (v <= 0) ? 0 : static_cast<size_t>(v);
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid SNAPSHOT_EVERY=" << se << std::endl;
        }
    }
    if (const char* tr = std::getenv("TRACE")) {
        o.trace = std::string(tr) == "1";
    }
    return o;
}

PoolConfig parse_pool_config(const json::object& obj) {
    const auto& reserves = obj.at("reserves").as_array();
    const auto& fee = obj.at("fee").as_array();
    if (reserves.size() != 2 || fee.size() != 2) {
        throw invalid_pool_config("reserves and fee must each have two entries");
    }
    return PoolConfig{
        get_string(obj, "name"),
        parse_pool_state(
            std::string(reserves[0].as_string().c_str()),
            std::string(reserves[1].as_string().c_str()),
            std::string(fee[0].as_string().c_str()),
            std::string(fee[1].as_string().c_str()))
    };
}

json::object report_state(const PoolState& state) {
    json::object obj;
    obj["reserves"] = json::array{state.reserve_in().str(), state.reserve_out().str()};
    obj["fee"] = json::array{state.fee_numerator().str(), state.fee_denominator().str()};
    obj["k"] = state.invariant_k().str();
    return obj;
}

json::object run_sequence(
    const PoolConfig& pool,
    const json::object& sequence,
    const RunOptions& options,
    std::mutex& io_mu
) {
    PoolState state = pool.state;
    const auto& actions = sequence.at("actions").as_array();

    json::array states;
    if (options.snapshot_every != 0) {
        states.push_back(report_state(state));
    }

    json::object last_state;
    size_t action_idx = 0;
    for (const auto& a : actions) {
        json::object outcome;
        bool success = true;
        std::string error;
        std::string code;
        try {
            outcome = apply_action(state, a.as_object());
        } catch (const quote_error& e) {
            success = false; error = e.what(); code = to_string(e.code());
        } catch (const std::exception& e) {
            // malformed action
            success = false; error = e.what();
        }

        json::object st = report_state(state);
        for (const auto& kv : outcome) st[kv.key()] = kv.value();
        st["action_success"] = success;
        if (!success) {
            st["error"] = error;
            if (!code.empty()) st["error_code"] = code;
        }

        if (options.trace) {
            std::lock_guard<std::mutex> lk(io_mu);
            std::cout << "TRACE " << pool.name << " action=" << action_idx
                      << " ok=" << success
                      << " reserves=" << state.reserve_in() << "," << state.reserve_out();
            if (!success) std::cout << " error=" << error;
            std::cout << "\n";
        }

        if (options.snapshot_every != 0 && ((action_idx + 1) % options.snapshot_every) == 0) {
            states.push_back(st);
        }
        last_state = std::move(st);
        ++action_idx;
    }

    json::object res;
    res["success"] = true;
    if (options.snapshot_every == 0) {
        res["final_state"] = actions.empty() ? report_state(state) : last_state;
    } else {
        // interval mode: make sure the final action is reported
        if (options.snapshot_every > 1 && !actions.empty() && (actions.size() % options.snapshot_every) != 0) {
            states.push_back(last_state);
        }
        res["states"] = states;
    }
    return res;
}

json::object run_all(
    const json::array& pools,
    const json::array& sequences,
    const RunOptions& options
) {
    struct Task { size_t pi; size_t si; };
    std::vector<Task> tasks;
    tasks.reserve(pools.size() * sequences.size());
    for (size_t pi = 0; pi < pools.size(); ++pi)
        for (size_t si = 0; si < sequences.size(); ++si) tasks.push_back({pi, si});

    std::vector<json::object> results(tasks.size());
    std::atomic<size_t> next{0};
    std::mutex io_mu;

    auto worker = [&]() {
        for (;;) {
            size_t idx = next.fetch_add(1);
            if (idx >= tasks.size()) break;
            const json::value& pool_val = pools[tasks[idx].pi];
            const json::value& seq_val = sequences[tasks[idx].si];

            json::object tr;
            std::string pool_name = name_of(pool_val);
            std::string seq_name = name_of(seq_val);
            try {
                PoolConfig cfg = parse_pool_config(pool_val.as_object());
                {
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cout << "Processing " << cfg.name << " / " << seq_name << "..." << std::endl;
                }
                tr["result"] = run_sequence(cfg, seq_val.as_object(), options, io_mu);
            } catch (const std::exception& e) {
                // Per-task failure should not bring down the whole harness
                json::object res;
                res["success"] = false;
                res["error"] = e.what();
                if (const auto* qe = dynamic_cast<const quote_error*>(&e)) {
                    res["error_code"] = to_string(qe->code());
                }
                tr["result"] = res;
            }
            tr["pool_config"] = pool_name;
            tr["sequence"] = seq_name;
            results[idx] = std::move(tr);
        }
    };

    size_t threads = std::max<size_t>(1, std::min(options.threads, tasks.size()));
    std::vector<std::thread> ws;
    ws.reserve(threads);
    for (size_t t = 0; t < threads; ++t) ws.emplace_back(worker);
    for (auto& th : ws) th.join();

    json::array out;
    for (auto& r : results) out.push_back(std::move(r));
    json::object O;
    O["results"] = std::move(out);
    O["metadata"] = json::object{
        {"pools", pools.size()},
        {"sequences", sequences.size()},
        {"total_tests", tasks.size()}
    };
    return O;
}

int run_harness(
    const std::string& pools_file,
    const std::string& sequences_file,
    const std::string& output_file
) {
    try {
        json::array pools = json::parse(read_file(pools_file)).as_object().at("pools").as_array();
        json::array seqs = json::parse(read_file(sequences_file)).as_object().at("sequences").as_array();
        if (seqs.empty()) throw std::runtime_error("No sequences found");

        json::object O = run_all(pools, seqs, RunOptions::from_env());
        O["metadata"].as_object()["pool_configs_file"] = pools_file;
        O["metadata"].as_object()["action_sequences_file"] = sequences_file;

        std::ofstream of(output_file);
        if (!of) throw std::runtime_error("Cannot open " + output_file);
        of << json::serialize(O) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace sim
} // namespace cpswap
