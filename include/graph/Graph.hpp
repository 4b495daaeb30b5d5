#pragma once                              // ensure this header is included only once per translation unit

#include "graph/Vertex.hpp"      // Vertex and Edge

#include <vector>        // used for insertion-ordered vertex storage
#include <memory>        // std::unique_ptr keeps vertex addresses stable
#include <unordered_map> // id -> vertex index
#include <cstddef>       // defines std::size_t type
#include <stdexcept>     // defines exceptions like out_of_range, invalid_argument
#include <string>        // used for std::string in label()

// ==========================
// Directed graph builder
// ==========================
// This class supports:
// - Vertices keyed by arbitrary integer ids (insertion order is kept)
// - Unweighted directed edges attached to their source vertex
// - Guards against self-loops and optional multi-edge suppression
// The graph owns its vertices; edges only reference them, so a Graph may be
// moved but not copied.
// ==========================

class Graph {
public:
    // Options to control behavior for self-loops and multi-edges
    struct Options {
        bool allowSelfLoops  = false; // if false, edges u->u are forbidden
        bool allowMultiEdges = true;  // if false, a parallel edge is silently ignored
    };

    // Type alias for readability
    using Id = Vertex::Id;

    // ---- Constructors ----

    explicit Graph(Options opts) : m_opts(opts), m_edgesLogical(0) {}

    Graph() : Graph(Options{}) {}

    Graph(Graph&&) = default;
    Graph& operator=(Graph&&) = default;
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    // ---- Public API ----

    // Return the number of vertices
    std::size_t n() const noexcept { return m_vertices.size(); }

    // Return the number of logical edges
    std::size_t m() const noexcept { return m_edgesLogical; }

    // Add vertex `id`, or return the existing one
    Vertex& addVertex(Id id);

    // Add edge u->v; both vertices must exist. Returns false when a
    // duplicate was ignored because multi-edges are disabled.
    bool addEdge(Id u, Id v);

    // Return true if vertex `id` exists
    bool hasVertex(Id id) const noexcept { return m_index.count(id) != 0; }

    // Return true if arc u->v exists
    bool hasArc(Id u, Id v) const {
        return vertex(u).hasEdgeTo(vertex(v).id());
    }

    // Look up a vertex; nullptr when absent
    const Vertex* find(Id id) const noexcept {
        auto it = m_index.find(id);
        return it == m_index.end() ? nullptr : m_vertices[it->second].get();
    }

    // Look up a vertex; throws out_of_range when absent
    const Vertex& vertex(Id id) const {
        return *m_vertices[indexOf(id)];
    }

    // All vertices in insertion order
    std::vector<const Vertex*> vertices() const;

    // Compute in-degree of each vertex, in insertion order
    std::vector<std::size_t> inDegree() const;

    // Return a human-readable summary of the graph (implemented in Graph.cpp)
    std::string label() const;

private:
    Options m_opts;                                  // options (loops, multi-edges)
    std::vector<std::unique_ptr<Vertex>> m_vertices; // owned vertices, insertion order
    std::unordered_map<Id, std::size_t> m_index;     // id -> position in m_vertices
    std::size_t m_edgesLogical;                      // number of logical edges

    // Helper: resolve id to storage position
    std::size_t indexOf(Id id) const {
        auto it = m_index.find(id);
        if (it == m_index.end())
            throw std::out_of_range("vertex " + std::to_string(id) + " not in graph");
        return it->second;
    }
}; // end class Graph
