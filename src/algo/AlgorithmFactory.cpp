// ===============================================
// AlgorithmFactory.cpp
// Implements the report strategies (Strategy pattern) on top of PathEngine:
//   * Longest path from every vertex (recursive or iterative DFS)
//   * Acyclicity check over the whole graph
// Exposes AlgorithmFactory::create(name) to instantiate a strategy.
// ===============================================

#include "algo/GraphAlgorithm.hpp"    // Include the interface and factory declaration.
#include "algo/PathEngine.hpp"        // The traversal engine every strategy drives.
#include <cctype>                     // std::tolower for case-insensitive names
#include <memory>                     // std::make_unique for factory
#include <sstream>                    // std::ostringstream to build responses
#include <string>                     // std::string

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
static std::string to_lower(std::string s) {                       // Copy input string.
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); // Lowercase each byte.
    return s;                                                      // Return transformed string.
}

// =====================================================
// 1) Longest path from each vertex, in insertion order
// =====================================================
// One engine is shared across the whole report, so later vertices reuse the
// results of earlier ones. The first cycle stops the report.
struct AlgoLongestPaths final : IGraphAlgorithm {
    explicit AlgoLongestPaths(PathEngine::Traversal t) : traversal(t) {}

    std::string run(const Graph& g) override {
        if (g.n() == 0) return "Graph has no vertices.";

        PathEngine::Options opts;
        opts.traversal = traversal;
        PathEngine engine(opts);                                   // fresh cache for this graph

        std::ostringstream oss;
        bool first = true;
        try {
            for (const Vertex* v : g.vertices()) {
                std::size_t len = engine.longestPath(v);
                if (!first) oss << "\n";
                oss << "Longest path from vertex " << v->id() << ": " << len;
                first = false;
            }
        } catch (const CycleDetected& e) {
            if (!first) oss << "\n";
            oss << "Error processing the graph: " << e.what() << "\n"
                << "Further calculations on this graph are stopped due to detected cycle.";
        }
        return oss.str();
    }

    PathEngine::Traversal traversal;
};

// ================================================
// 2) Acyclicity check (every vertex as a start)
// ================================================
struct AlgoAcyclic final : IGraphAlgorithm {
    std::string run(const Graph& g) override {
        PathEngine engine;                                         // settled vertices are skipped on later starts
        try {
            for (const Vertex* v : g.vertices()) engine.longestPath(v);
        } catch (const CycleDetected& e) {
            std::ostringstream oss;
            oss << "DAG check: cycle detected involving vertex " << e.vertex() << ".";
            return oss.str();
        }
        return "DAG check: acyclic.";
    }
};

// =====================================================
// Factory definition (matches header declaration)
// =====================================================
std::unique_ptr<IGraphAlgorithm>                                   // Return unique_ptr to created strategy.
AlgorithmFactory::create(const std::string& name) {                // Define factory method declared in header.
    const auto n = to_lower(name);                                  // Normalize the name to lowercase.
    if (n == "longest")
        return std::make_unique<AlgoLongestPaths>(PathEngine::Traversal::Recursive);
    if (n == "longest_iterative")
        return std::make_unique<AlgoLongestPaths>(PathEngine::Traversal::Iterative);
    if (n == "acyclic")  return std::make_unique<AlgoAcyclic>();    // Create DAG-check strategy.
    return nullptr;                                                 // Unknown name → caller handles error.
}
