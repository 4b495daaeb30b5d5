#include "algo/PathEngine.hpp"            // include our header so the compiler sees the class
#include <algorithm>                      // std::max
#include <string>                         // std::to_string for the cycle message
#include <vector>                         // explicit DFS frame stack

CycleDetected::CycleDetected(Vertex::Id vertex)
    : std::runtime_error("Cycle detected involving vertex: " + std::to_string(vertex)),
      m_vertex(vertex) {}

// -----------------------------
// Entry point: validate, then run the selected traversal under the lock
// -----------------------------
std::size_t PathEngine::longestPath(const Vertex* start) {
    if (start == nullptr) {                                       // rejected before any traversal
        throw std::invalid_argument("start vertex cannot be null");
    }

    std::lock_guard<std::mutex> lock(m_mutex);                    // one caller at a time per cache
    if (m_opts.traversal == Traversal::Iterative) {
        return walkIterative(*start);
    }
    ActivePath active;                                            // scoped to this top-level call
    return walk(*start, active);
}

// -----------------------------
// Recursive DFS
// State per vertex: Unvisited -> Active (in `active`) -> Settled (in m_cache).
// -----------------------------
std::size_t PathEngine::walk(const Vertex& v, ActivePath& active) {
    if (active.count(v.id())) {                                   // re-entered while still active
        throw CycleDetected(v.id());
    }

    auto hit = m_cache.find(v.id());                              // settled earlier
    if (hit != m_cache.end()) return hit->second;

    active.insert(v.id());                                        // Unvisited -> Active
    ++m_expansions;

    std::size_t best = 0;                                         // 0 for a sink
    for (const auto& e : v.edges()) {                             // attachment order
        if (e.to == nullptr) continue;                            // dangling edge
        best = std::max(best, walk(*e.to, active) + 1);           // every edge counts 1
    }

    active.erase(v.id());                                         // backtrack: other branches may reach v legally
    m_cache.emplace(v.id(), best);                                // Active -> Settled, written once
    return best;
}

// -----------------------------
// Iterative DFS with an explicit frame stack.
// Same bookkeeping as walk(); a frame is popped once all its edges are done.
// -----------------------------
std::size_t PathEngine::walkIterative(const Vertex& start) {
    struct Frame {
        const Vertex* vertex;   // vertex being expanded
        std::size_t next;       // index of the next edge to follow
        std::size_t best;       // longest path found so far from vertex
    };

    ActivePath active;
    std::vector<Frame> st;

    // Either answer `v` immediately (cache hit) or push a frame for it
    auto enter = [&](const Vertex& v, std::size_t& out) -> bool {
        if (active.count(v.id())) throw CycleDetected(v.id());
        auto hit = m_cache.find(v.id());
        if (hit != m_cache.end()) {
            out = hit->second;
            return true;
        }
        active.insert(v.id());
        ++m_expansions;
        st.push_back(Frame{&v, 0, 0});
        return false;
    };

    std::size_t result = 0;
    if (enter(start, result)) return result;                      // start already settled

    while (!st.empty()) {
        Frame& top = st.back();
        const auto& edges = top.vertex->edges();

        if (top.next < edges.size()) {                            // follow the next edge
            const Vertex* to = edges[top.next++].to;
            if (to == nullptr) continue;
            std::size_t sub = 0;
            // `top` is only touched when nothing was pushed
            if (enter(*to, sub)) top.best = std::max(top.best, sub + 1);
            continue;
        }

        Frame done = top;                                         // all edges explored
        st.pop_back();
        active.erase(done.vertex->id());
        m_cache.emplace(done.vertex->id(), done.best);

        if (st.empty()) {
            result = done.best;
        } else {
            st.back().best = std::max(st.back().best, done.best + 1);
        }
    }
    return result;
}

void PathEngine::clearCache() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
}

std::size_t PathEngine::cacheSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

std::optional<std::size_t> PathEngine::cached(Vertex::Id id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cache.find(id);
    if (it == m_cache.end()) return std::nullopt;
    return it->second;
}

std::size_t PathEngine::expansions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expansions;
}
