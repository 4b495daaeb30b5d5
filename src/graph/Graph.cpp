// ==========================
// Graph.cpp
// ==========================
// This file implements the out-of-line methods of the Graph class.
// Specifically: addVertex(), addEdge(), vertices(), inDegree() and label().
// All other methods are inline in Graph.hpp.
// ==========================

#include "graph/Graph.hpp"   // include the Graph class declaration
#include <sstream>           // used for building strings in label()

// --------------------------
// addVertex
// --------------------------
// Purpose:
//   Register vertex `id`. Adding an id twice returns the first instance, so
//   every edge to that id shares one Vertex object.
Vertex& Graph::addVertex(Id id) {
    auto it = m_index.find(id);                      // already known?
    if (it != m_index.end()) return *m_vertices[it->second];

    m_index.emplace(id, m_vertices.size());          // remember its position
    m_vertices.push_back(std::make_unique<Vertex>(id));
    return *m_vertices.back();
}

// --------------------------
// addEdge
// --------------------------
// Purpose:
//   Attach the directed edge u->v to vertex u.
// Arguments:
//   u = source vertex id, v = target vertex id (both must exist)
// Returns:
//   true if the edge was stored, false if a duplicate was ignored.
bool Graph::addEdge(Id u, Id v) {
    Vertex& from = *m_vertices[indexOf(u)];         // validate u
    const Vertex& to = *m_vertices[indexOf(v)];     // validate v

    if (!m_opts.allowSelfLoops && u == v) {
        throw std::invalid_argument("self-loops are disabled in this graph");
    }

    if (!m_opts.allowMultiEdges && from.hasEdgeTo(v)) return false;

    from.addEdge(&to);                              // edge is owned by its source
    ++m_edgesLogical;
    return true;
}

std::vector<const Vertex*> Graph::vertices() const {
    std::vector<const Vertex*> out;
    out.reserve(m_vertices.size());
    for (const auto& v : m_vertices) out.push_back(v.get());
    return out;
}

std::vector<std::size_t> Graph::inDegree() const {
    std::vector<std::size_t> d(n(), 0);
    for (const auto& v : m_vertices)
        for (const auto& e : v->edges())
            if (e.to) ++d[m_index.at(e.to->id())];
    return d;
}

// --------------------------
// label
// --------------------------
// Format:
//   "DirectedGraph(VV,EE)" where VV = number of vertices, EE = number of edges.
std::string Graph::label() const {
    std::ostringstream oss;                          // create a string stream
    oss << "DirectedGraph(" << n() << "V," << m() << "E)"; // add vertex and edge counts
    return oss.str();                                // return composed string
}
