#include "graph/EdgeList.hpp"   // include our header so the compiler sees the declaration
#include <cctype>               // std::isdigit for token validation
#include <sstream>              // std::istringstream to tokenize the input
#include <stdexcept>            // std::invalid_argument

// -----------------------------
// Helper: parse one non-negative id, rejecting signs and trailing garbage
// -----------------------------
static bool parse_id(const std::string& s, Graph::Id& out) {
    if (s.empty()) return false;                                  // "-5" splits into "" and "5"
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    try {
        out = std::stoll(s);                                      // digits only, may still overflow
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

Graph parseEdgeList(const std::string& text, Graph::Options opts) {
    Graph g(opts);
    std::istringstream iss(text);                                 // tokenize input
    std::string tok;

    while (iss >> tok) {                                          // for each "u-v" or "u"
        auto dash = tok.find('-');
        Graph::Id u = 0, v = 0;

        if (dash == std::string::npos) {                          // isolated vertex
            if (!parse_id(tok, u)) throw std::invalid_argument("Bad token: " + tok);
            g.addVertex(u);
            continue;
        }

        if (!parse_id(tok.substr(0, dash), u) || !parse_id(tok.substr(dash + 1), v))
            throw std::invalid_argument("Bad token: " + tok);

        g.addVertex(u);
        g.addVertex(v);
        g.addEdge(u, v);                                          // may throw on a disabled self-loop
    }
    return g;
}
