// ==========================
// longest_path: longest path from one or all vertices
// ==========================
// Parses: [-g "<edge list>"] [-s <start id>] [-a <algorithm>] [--iterative]
// Without -g the built-in sample DAG is used. Without -s every vertex is
// reported through the selected strategy.
// ==========================

#include "graph/Graph.hpp"             // Graph API
#include "graph/EdgeList.hpp"          // parseEdgeList for -g
#include "algo/PathEngine.hpp"         // single-vertex computation for -s
#include "algo/GraphAlgorithm.hpp"     // strategies for the all-vertices report
#include <getopt.h>                    // getopt_long for command-line parsing
#include <cstddef>                     // std::size_t
#include <cstdlib>                     // std::exit
#include <iostream>                    // I/O
#include <stdexcept>                   // std::invalid_argument
#include <string>                      // std::string

static constexpr const char* kDefaultAlgorithm = "LONGEST";   // all-vertices report
static constexpr int kExitUsage = 1;                           // bad input
static constexpr int kExitCycle = 2;                           // graph is not a DAG

static void usage(const char* prog) {                          // print usage and exit
    std::cerr << "Usage: " << prog
              << " [-g \"u-v u-v ...\"] [-s <start id>] [-a LONGEST|LONGEST_ITERATIVE|ACYCLIC]"
                 " [--iterative]\n";
    std::exit(kExitUsage);
}

// The sample DAG: 1->2, 1->3, 1->4, 2->5, 3->7, 4->3, 4->7, 4->3 (duplicate), 5->6, 6->7
static Graph make_sample_dag() {
    Graph g;
    for (Graph::Id id = 1; id <= 7; ++id) g.addVertex(id);
    g.addEdge(1, 2); g.addEdge(1, 3); g.addEdge(1, 4);
    g.addEdge(2, 5);
    g.addEdge(3, 7);
    g.addEdge(4, 3); g.addEdge(4, 7); g.addEdge(4, 3);
    g.addEdge(5, 6);
    g.addEdge(6, 7);
    return g;
}

int main(int argc, char* argv[]) {
    std::string edges, start, algo = kDefaultAlgorithm;
    bool haveEdges = false, haveStart = false, iterative = false;
    int li = 0;
    option lo[] = {{"iterative", no_argument, nullptr, 'I'}, {nullptr, 0, nullptr, 0}};

    for (int opt; (opt = getopt_long(argc, argv, "g:s:a:", lo, &li)) != -1; ) {
        if (opt == 'g') { edges = optarg; haveEdges = true; }
        else if (opt == 's') { start = optarg; haveStart = true; }
        else if (opt == 'a') algo = optarg;
        else if (opt == 'I') iterative = true;
        else usage(argv[0]);
    }

    Graph g;
    try {
        g = haveEdges ? parseEdgeList(edges) : make_sample_dag();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    }

    std::cout << "--- For a DAG Graph ---\n";
    std::cout << g.label() << "\n";

    if (!haveStart) {                                          // report every vertex
        if (iterative && algo == kDefaultAlgorithm) algo = "LONGEST_ITERATIVE";
        auto strategy = AlgorithmFactory::create(algo);
        if (!strategy) {
            std::cerr << "Unknown algorithm: " << algo << "\n";
            return kExitUsage;
        }
        std::cout << strategy->run(g) << "\n";
        return 0;
    }

    Graph::Id id = 0;
    try {
        std::size_t used = 0;
        id = std::stoll(start, &used);
        if (used != start.size()) throw std::invalid_argument(start);
    } catch (const std::exception&) {                          // invalid_argument or out_of_range
        std::cerr << "Error: Invalid vertex ID. Please provide a valid number.\n";
        return kExitUsage;
    }

    PathEngine::Options opts;
    if (iterative) opts.traversal = PathEngine::Traversal::Iterative;
    PathEngine engine(opts);                                   // fresh cache for this graph

    try {
        std::size_t len = engine.longestPath(g.find(id));      // unknown id -> null start
        std::cout << "Longest path from vertex " << id << ": " << len << "\n";
    } catch (const CycleDetected& e) {
        std::cerr << "\nError processing the graph: " << e.what() << "\n";
        return kExitCycle;
    } catch (const std::invalid_argument& e) {
        std::cerr << "\nError during calculation: " << e.what() << "\n";
        return kExitUsage;
    }
    return 0;
}
