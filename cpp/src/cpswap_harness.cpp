// Replays JSON trade sequences against constant-product pool snapshots.
#include "sim_runner.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <pools.json> <sequences.json> <output.json>" << std::endl;
        return 1;
    }
    std::string pools = argv[1]; std::string seq = argv[2]; std::string out = argv[3];
    return cpswap::sim::run_harness(pools, seq, out);
}
