// ==========================
// random_dag: random graph + longest-path report
// ==========================
// Parses: -v <V> -e <E> -s <seed> [--cyclic] [-a <algorithm>]
// Edges point from a lower to a higher id unless --cyclic is given, so the
// default graph is always a DAG.
// ==========================

#include "graph/Graph.hpp"            // Graph API
#include "algo/GraphAlgorithm.hpp"    // strategy factory
#include <getopt.h>                   // getopt_long for command-line parsing
#include <algorithm>                  // std::count
#include <cstdint>                    // std::uint32_t seed
#include <cstdlib>                    // std::atoll, std::exit
#include <iostream>                   // I/O
#include <random>                     // PRNG
#include <set>                        // deduplicate edges
#include <string>                     // std::string
#include <utility>                    // std::swap, std::pair

static constexpr const char* kDefaultAlgorithm = "LONGEST";

static void usage(const char* prog) {                         // print usage and exit
    std::cerr << "Usage: " << prog
              << " -v <vertices> -e <edges> -s <seed> [--cyclic] [-a <algorithm>]\n";
    std::exit(1);
}

// Build a graph with exactly E distinct edges (no self-loops)
static Graph make_random_graph(long long V, long long E, std::uint32_t seed, bool cyclic) {
    Graph g;
    for (Graph::Id id = 0; id < V; ++id) g.addVertex(id);

    std::mt19937 rng(seed);                                   // PRNG
    std::uniform_int_distribution<long long> pick(0, V - 1);  // uniform vertex picker
    std::set<std::pair<long long, long long>> used;           // avoid duplicates
    long long added = 0;

    while (added < E) {
        long long u = pick(rng), v = pick(rng);               // random endpoints
        if (u == v) continue;                                 // skip self-loops
        if (!cyclic && u > v) std::swap(u, v);                // low -> high keeps it acyclic
        if (!used.insert({u, v}).second) continue;            // already present
        g.addEdge(u, v);
        ++added;
    }
    return g;
}

int main(int argc, char* argv[]) {
    long long V = -1, E = -1, SEED = -1; bool cyclic = false; int li = 0;
    std::string algo = kDefaultAlgorithm;
    option lo[] = {{"cyclic", no_argument, nullptr, 'C'}, {nullptr, 0, nullptr, 0}};

    for (int opt; (opt = getopt_long(argc, argv, "v:e:s:a:", lo, &li)) != -1; ) {
        if (opt == 'v') V = std::atoll(optarg);               // vertices
        else if (opt == 'e') E = std::atoll(optarg);          // edges
        else if (opt == 's') SEED = std::atoll(optarg);       // seed
        else if (opt == 'a') algo = optarg;                   // strategy name
        else if (opt == 'C') cyclic = true;                   // any direction
        else usage(argv[0]);
    }

    if (V <= 0 || E < 0 || SEED < 0) usage(argv[0]);          // basic validation
    const long long pairs = cyclic ? V * (V - 1) : V * (V - 1) / 2;
    if (E > pairs) {
        std::cerr << "Too many edges: at most " << pairs << " for " << V << " vertices\n";
        return 1;
    }

    auto strategy = AlgorithmFactory::create(algo);
    if (!strategy) {
        std::cerr << "Unknown algorithm: " << algo << "\n";
        return 1;
    }

    Graph g = make_random_graph(V, E, static_cast<std::uint32_t>(SEED), cyclic);
    const auto in = g.inDegree();
    std::cout << "[random_dag] generated " << g.label() << ", "
              << std::count(in.begin(), in.end(), std::size_t{0}) << " source vertices\n";

    std::cout << strategy->run(g) << "\n";
    return 0;
}
