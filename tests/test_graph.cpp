// ==========================
// tests/test_graph.cpp
// ==========================
// This file defines unit tests for Vertex, Graph and parseEdgeList.
// It uses the doctest framework so that we can run many small tests
// and see detailed reports.
// ==========================

// Enable doctest main entry point (so this file produces a `main()`)
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"         // doctest framework header

// Include project headers
#include "graph/Vertex.hpp"    // Vertex and Edge
#include "graph/Graph.hpp"     // Graph class declaration
#include "graph/EdgeList.hpp"  // edge-list reader

// Include for exception classes
#include <stdexcept>         // std::invalid_argument, std::out_of_range
#include <string>            // std::string
#include <utility>           // std::move

// ---------------------------
// Test 1: edges keep attachment order and point back at their source
// ---------------------------
TEST_CASE("Vertex edges keep attachment order") {
    Vertex a(1), b(2), c(3);
    a.addEdge(&c);                        // first edge 1->3
    a.addEdge(&b);                        // second edge 1->2
    REQUIRE(a.edges().size() == 2);
    CHECK(a.edges()[0].to == &c);
    CHECK(a.edges()[1].to == &b);
    CHECK(a.edges()[0].from == &a);       // source is informational only
    CHECK(a.hasEdgeTo(2));
    CHECK_FALSE(a.hasEdgeTo(1));
    CHECK(a.label() == "1");
}

// ---------------------------
// Test 2: vertex equality is by id only
// ---------------------------
TEST_CASE("Vertex equality is defined by id") {
    Vertex a(4), b(4), c(5);
    b.addEdge(&c);                        // different edges, same identity
    CHECK(a == b);
    CHECK(a != c);
}

// ---------------------------
// Test 3: addVertex returns the existing instance for a known id
// ---------------------------
TEST_CASE("Graph::addVertex is idempotent per id") {
    Graph g;
    Vertex& first = g.addVertex(10);
    Vertex& again = g.addVertex(10);
    CHECK(&first == &again);
    CHECK(g.n() == 1);
    CHECK(g.hasVertex(10));
    CHECK_FALSE(g.hasVertex(11));
}

// ---------------------------
// Test 4: addEdge links the shared vertex objects
// ---------------------------
TEST_CASE("Graph::addEdge shares target vertices") {
    Graph g;
    g.addVertex(1); g.addVertex(2); g.addVertex(3);
    CHECK(g.addEdge(1, 3));
    CHECK(g.addEdge(2, 3));
    CHECK(g.m() == 2);
    CHECK(g.vertex(1).edges()[0].to == g.find(3)); // same object from both sources
    CHECK(g.vertex(2).edges()[0].to == g.find(3));
    CHECK(g.hasArc(1, 3));
    CHECK_FALSE(g.hasArc(3, 1));          // directed
}

// ---------------------------
// Test 5: unknown ids
// ---------------------------
TEST_CASE("Unknown ids: vertex() and addEdge() throw, find() returns null") {
    Graph g;
    g.addVertex(0);
    CHECK_THROWS_AS((void)g.vertex(2), std::out_of_range);
    CHECK_THROWS_AS(g.addEdge(0, 2), std::out_of_range);
    CHECK(g.find(2) == nullptr);
    CHECK(g.m() == 0);
}

// ---------------------------
// Test 6: options (self-loops, multi-edges)
// ---------------------------
TEST_CASE("Graph options: self-loops disabled by default, duplicates kept") {
    Graph g;
    g.addVertex(0); g.addVertex(1);
    CHECK_THROWS_AS(g.addEdge(1, 1), std::invalid_argument); // self-loop throws
    CHECK(g.addEdge(0, 1));
    CHECK(g.addEdge(0, 1));               // duplicate is harmless and stored
    CHECK(g.vertex(0).outDegree() == 2);
    CHECK(g.m() == 2);
}

TEST_CASE("Graph options: multi-edges disabled ignores duplicates") {
    Graph::Options opt;                   // options struct
    opt.allowSelfLoops = true;            // enable self-loops
    opt.allowMultiEdges = false;          // disable parallel edges
    Graph g(opt);
    g.addVertex(0); g.addVertex(1);
    CHECK(g.addEdge(0, 1));
    CHECK_FALSE(g.addEdge(0, 1));         // duplicate should be ignored
    CHECK(g.vertex(0).outDegree() == 1);  // only one stored
    CHECK(g.addEdge(1, 1));               // self-loop now OK
    CHECK(g.m() == 2);
}

// ---------------------------
// Test 7: insertion order, in-degree, label
// ---------------------------
TEST_CASE("Graph::vertices keeps insertion order") {
    Graph g = parseEdgeList("7-3 3-9 1");
    auto vs = g.vertices();
    REQUIRE(vs.size() == 4);
    CHECK(vs[0]->id() == 7);
    CHECK(vs[1]->id() == 3);
    CHECK(vs[2]->id() == 9);
    CHECK(vs[3]->id() == 1);
}

TEST_CASE("Graph::inDegree counts incoming edges per vertex") {
    Graph g = parseEdgeList("1-2 1-3 2-3 4");
    auto in = g.inDegree();
    REQUIRE(in.size() == 4);
    CHECK(in[0] == 0);                    // vertex 1
    CHECK(in[1] == 1);                    // vertex 2
    CHECK(in[2] == 2);                    // vertex 3
    CHECK(in[3] == 0);                    // isolated vertex 4
}

TEST_CASE("Graph::label() mentions type and counts") {
    Graph g = parseEdgeList("1-2 1-3 1-4 2-5 3-7 4-3 4-7 4-3 5-6 6-7");
    CHECK(g.label() == "DirectedGraph(7V,10E)");
    Graph empty;
    CHECK(empty.label() == "DirectedGraph(0V,0E)");
}

TEST_CASE("Moving a Graph keeps vertex addresses valid") {
    Graph g = parseEdgeList("1-2");
    const Vertex* two = g.find(2);
    Graph moved = std::move(g);
    CHECK(moved.find(2) == two);
    CHECK(moved.vertex(1).edges()[0].to == two);
}

// ---------------------------
// Test 8: parseEdgeList errors
// ---------------------------
TEST_CASE("parseEdgeList rejects malformed tokens") {
    CHECK_THROWS_AS(parseEdgeList("1-"), std::invalid_argument);
    CHECK_THROWS_AS(parseEdgeList("-2"), std::invalid_argument);   // negative id
    CHECK_THROWS_AS(parseEdgeList("a-b"), std::invalid_argument);
    CHECK_THROWS_AS(parseEdgeList("1-2x"), std::invalid_argument);
    CHECK_THROWS_AS(parseEdgeList("1-2-3"), std::invalid_argument);
    CHECK_THROWS_AS(parseEdgeList("99999999999999999999"), std::invalid_argument);
}

TEST_CASE("parseEdgeList error message names the token") {
    try {
        parseEdgeList("1-2 3-x");
        FAIL("expected invalid_argument");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()) == "Bad token: 3-x");
    }
}

TEST_CASE("parseEdgeList self-loop follows options") {
    CHECK_THROWS_AS(parseEdgeList("1-1"), std::invalid_argument);
    Graph::Options opt;
    opt.allowSelfLoops = true;
    Graph g = parseEdgeList("1-1", opt);
    CHECK(g.hasArc(1, 1));
}

TEST_CASE("parseEdgeList accepts empty input and extra whitespace") {
    CHECK(parseEdgeList("").n() == 0);
    Graph g = parseEdgeList("  1-2 \n\t 2-3  ");
    CHECK(g.n() == 3);
    CHECK(g.m() == 2);
}
