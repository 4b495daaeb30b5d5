#pragma once                              // ensure this header is included only once per translation unit
#include "graph/Vertex.hpp"               // Vertex and Edge, the only model the engine needs
#include <cstddef>                        // std::size_t path lengths
#include <mutex>                          // one lock serializes callers sharing an engine
#include <optional>                       // cached() lookup result
#include <stdexcept>                      // std::runtime_error base, std::invalid_argument
#include <unordered_map>                  // memoization cache
#include <unordered_set>                  // active-path set

/**
 * @brief Raised when traversal re-enters a vertex that is still on the active path.
 *        what() reads "Cycle detected involving vertex: <id>".
 */
class CycleDetected : public std::runtime_error {
public:
    explicit CycleDetected(Vertex::Id vertex);

    // Id of the vertex at which the cycle was re-entered
    Vertex::Id vertex() const noexcept { return m_vertex; }

private:
    Vertex::Id m_vertex;
};

/**
 * @brief Longest directed path (edge count) from a start vertex, computed by
 *        DFS with per-vertex memoization and active-path cycle detection.
 *
 * The cache belongs to the engine: use one engine per graph session, or call
 * clearCache() before reusing it on an unrelated graph whose ids may collide.
 * Public operations are serialized by an internal mutex.
 */
class PathEngine {
public:
    // How the DFS is driven; both produce identical results
    enum class Traversal {
        Recursive,   // call-stack recursion
        Iterative    // explicit frame stack, safe for very deep graphs
    };

    struct Options {
        Traversal traversal = Traversal::Recursive;
    };

    explicit PathEngine(Options opts) : m_opts(opts) {}

    PathEngine() : PathEngine(Options{}) {}

    /**
     * @brief Length of the longest path starting at `start`.
     * @throws std::invalid_argument if start is null (checked before traversal)
     * @throws CycleDetected if a cycle is reachable from start
     */
    std::size_t longestPath(const Vertex* start);

    // Drop every memoized result
    void clearCache();

    std::size_t cacheSize() const;

    std::optional<std::size_t> cached(Vertex::Id id) const;

    // Vertices expanded (not answered from cache) since construction
    std::size_t expansions() const;

    Traversal traversal() const noexcept { return m_opts.traversal; }

private:
    using ActivePath = std::unordered_set<Vertex::Id>;

    std::size_t walk(const Vertex& v, ActivePath& active);
    std::size_t walkIterative(const Vertex& start);

    Options m_opts;
    mutable std::mutex m_mutex;                          // guards everything below
    std::unordered_map<Vertex::Id, std::size_t> m_cache; // settled vertices only
    std::size_t m_expansions = 0;
};
