#include "digraph.h"
#include "exceptions.h"

namespace bninf {

bool Vertex::operator<(const Vertex &other) const {
    return name < other.name;
}

bool Vertex::operator==(const Vertex &other) const {
    return name == other.name;
}

bool Edge::operator<(const Edge &other) const {
    return std::make_pair(p,c) < std::make_pair(other.p,other.c);
}

bool Edge::operator==(const Edge &other) const {
    return p == other.p && c == other.c;
}

DirectedGraph::DirectedGraph(){
}

const Vertex& DirectedGraph::AddVertex(const VertexName &kName){
    auto it = vertex_index_.find(kName);
    if(it != vertex_index_.end())
        return vertices_[it->second];

    vertex_index_[kName] = vertices_.size();
    vertices_.push_back(Vertex(kName));
    return vertices_.back();
}

const Edge& DirectedGraph::AddEdge(const VertexName &kParent, const VertexName &kChild, const EdgeWeight kWeight){
    const EdgeKey kKey(kParent, kChild);
    auto it = edge_index_.find(kKey);
    if(it != edge_index_.end())
        return edges_[it->second];

    AddVertex(kParent);
    AddVertex(kChild);
    vertices_[vertex_index_[kParent]].neighbors.insert(kChild);

    edge_index_[kKey] = edges_.size();
    edges_.push_back(Edge(kParent, kChild, kWeight));
    return edges_.back();
}

const DirectedGraph::VertexList& DirectedGraph::GetVertices() const {
    return vertices_;
}

const DirectedGraph::EdgeList& DirectedGraph::GetEdges() const {
    return edges_;
}

size_t DirectedGraph::GetIndex(const VertexName &kName) const {
    auto it = vertex_index_.find(kName);
    if(it == vertex_index_.end())
        throw NotFoundException("Unknown vertex: %s", kName.c_str());
    return it->second;
}

const Vertex& DirectedGraph::GetVertex(const VertexName &kName) const {
    return vertices_[GetIndex(kName)];
}

const Edge& DirectedGraph::GetEdge(const VertexName &kParent, const VertexName &kChild) const {
    auto it = edge_index_.find(EdgeKey(kParent, kChild));
    if(it == edge_index_.end())
        throw NotFoundException("Unknown edge: %s -> %s", kParent.c_str(), kChild.c_str());
    return edges_[it->second];
}

bool DirectedGraph::HasVertex(const VertexName &kName) const {
    return vertex_index_.find(kName) != vertex_index_.end();
}

bool DirectedGraph::HasEdge(const VertexName &kParent, const VertexName &kChild) const {
    return edge_index_.find(EdgeKey(kParent, kChild)) != edge_index_.end();
}

VertexNameList DirectedGraph::GetParents(const VertexName &kName) const {
    if(!HasVertex(kName))
        throw NotFoundException("Unknown vertex: %s", kName.c_str());

    // no reverse index, scan every vertex for kName as a neighbor
    VertexNameList parents;
    for(auto it = vertices_.begin(); it != vertices_.end(); it++)
        if(it->neighbors.find(kName) != it->neighbors.end())
            parents.push_back(it->name);

    return parents;
}

const VertexNameSet& DirectedGraph::GetChildren(const VertexName &kName) const {
    return GetVertex(kName).neighbors;
}

size_t DirectedGraph::Size() const {
    return vertices_.size();
}

size_t DirectedGraph::NrEdges() const {
    return edges_.size();
}

}
