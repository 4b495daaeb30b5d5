#pragma once
#include "graph/Graph.hpp"      // Graph builder
#include <string>

/**
 * @brief Build a Graph from a whitespace-separated edge list.
 *
 * Tokens:
 *   u-v   add vertices u and v (if new) and the edge u->v
 *   u     declare an isolated vertex u
 * Ids are non-negative decimal integers.
 *
 * @throws std::invalid_argument on a malformed token ("Bad token: <tok>")
 *         or a self-loop while opts.allowSelfLoops is false.
 */
Graph parseEdgeList(const std::string& text, Graph::Options opts = Graph::Options{});
