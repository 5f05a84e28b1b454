#ifndef DIGRAPH_INCLUDE_DIGRAPH_H_
#define DIGRAPH_INCLUDE_DIGRAPH_H_

#include <string>
#include <vector>
#include <set>
#include <map>
#include <unordered_map>
#include <utility>

namespace bninf {

typedef std::string                VertexName;
typedef std::vector<VertexName>    VertexNameList;
typedef std::set<VertexName>       VertexNameSet;
typedef double                     EdgeWeight;

struct Vertex {
    explicit Vertex(const VertexName &kName) : name(kName) {};
    VertexName name;
    VertexNameSet neighbors; // children this vertex points to
    bool operator<(const Vertex &other) const;
    bool operator==(const Vertex &other) const;
};

struct Edge {
    Edge(const VertexName &kParent, const VertexName &kChild, const EdgeWeight kWeight = 1) :
        p(kParent), c(kChild), weight(kWeight) {};
    VertexName p;
    VertexName c;
    EdgeWeight weight;
    bool operator<(const Edge &other) const;
    bool operator==(const Edge &other) const;
};

// Directed graph with named vertices. A child is a neighbor of its parent,
// not vice versa. Vertices and edges keep their insertion order.
class DirectedGraph {
    public:
        typedef std::vector<Vertex> VertexList;
        typedef std::vector<Edge>   EdgeList;

        DirectedGraph();

        // references stay valid until the next insertion
        const Vertex& AddVertex(const VertexName&);
        const Edge& AddEdge(const VertexName &kParent, const VertexName &kChild, const EdgeWeight kWeight = 1);

        const VertexList& GetVertices() const;
        const EdgeList& GetEdges() const;
        const Vertex& GetVertex(const VertexName&) const;
        const Edge& GetEdge(const VertexName&, const VertexName&) const;
        size_t GetIndex(const VertexName&) const;

        bool HasVertex(const VertexName&) const;
        bool HasEdge(const VertexName&, const VertexName&) const;

        VertexNameList GetParents(const VertexName&) const;
        const VertexNameSet& GetChildren(const VertexName&) const;

        size_t Size() const;
        size_t NrEdges() const;

    private:
        typedef std::pair<VertexName,VertexName> EdgeKey;

        VertexList vertices_;
        EdgeList edges_;
        std::unordered_map<VertexName, size_t> vertex_index_;
        std::map<EdgeKey, size_t> edge_index_;
};

}

#endif
