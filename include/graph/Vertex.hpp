#pragma once                              // ensure this header is included only once per translation unit

#include <vector>        // used for the outgoing edge list
#include <cstddef>       // defines std::size_t type
#include <algorithm>     // used for std::any_of
#include <string>        // used for std::string in label()

// ==========================
// Vertex / Edge data model
// ==========================
// - A Vertex is identified by its id only: two instances with the same id
//   are the same vertex for caching and cycle detection.
// - A Vertex owns its ordered outgoing edges.
// - An Edge references its endpoints, it never owns them. The target may be
//   null; traversal skips such edges.
// ==========================

class Vertex;

// Directed, unweighted connection between two vertices
struct Edge {
    const Vertex* from = nullptr;   // source vertex (informational)
    const Vertex* to   = nullptr;   // target vertex (followed by traversal)
};

class Vertex {
public:
    using Id = long long;           // vertex identifier type

    explicit Vertex(Id id) : m_id(id) {}

    // Edges store `this` as their source, so a copy would point at the original
    Vertex(const Vertex&) = delete;
    Vertex& operator=(const Vertex&) = delete;

    // Return the identifier
    Id id() const noexcept { return m_id; }

    // Access outgoing edges in attachment order
    const std::vector<Edge>& edges() const noexcept { return m_edges; }

    // Return the number of outgoing edges
    std::size_t outDegree() const noexcept { return m_edges.size(); }

    // Attach edge this->to (to may be null)
    void addEdge(const Vertex* to) {
        m_edges.push_back(Edge{this, to});
    }

    // Return true if an edge this->to with the given target id exists
    bool hasEdgeTo(Id to) const {
        return std::any_of(m_edges.begin(), m_edges.end(),
                           [to](const Edge& e){ return e.to && e.to->id() == to; });
    }

    // Identity comparison
    bool operator==(const Vertex& other) const noexcept { return m_id == other.m_id; }
    bool operator!=(const Vertex& other) const noexcept { return m_id != other.m_id; }

    // Human-readable id, e.g. "7"
    std::string label() const { return std::to_string(m_id); }

private:
    Id m_id;                        // unique, stable identifier
    std::vector<Edge> m_edges;      // outgoing edges
}; // end class Vertex
