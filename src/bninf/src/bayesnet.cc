#include "bayesnet.h"
#include "exceptions.h"
#include "io.h"
#include <algorithm>
#include <cmath>

namespace bninf {

BayesianNetwork::BayesianNetwork(){
}

BayesianNetwork::BayesianNetwork(const Options &kOptions){
    SetOptions(kOptions);
}

void BayesianNetwork::SetOptions(const Options &kOptions){
    options_ = kOptions;
    SetLogfile(options_.logfile);
}

const Options& BayesianNetwork::GetOptions() const {
    return options_;
}

// ================================ structure ================================

void BayesianNetwork::AddNode(const VertexName &kName){
    graph_.AddVertex(kName);
}

void BayesianNetwork::AddChild(const VertexName &kParent, const VertexName &kChild){
    graph_.AddEdge(kParent, kChild);
}

VertexNameList BayesianNetwork::GetParents(const VertexName &kName) const {
    return graph_.GetParents(kName);
}

const DirectedGraph& BayesianNetwork::GetGraph() const {
    return graph_;
}

VertexNameList BayesianNetwork::GetVertexNames() const {
    const DirectedGraph::VertexList &kVertices = graph_.GetVertices();

    VertexNameList names;
    names.reserve(kVertices.size());
    for(auto it = kVertices.begin(); it != kVertices.end(); it++)
        names.push_back(it->name);

    return names;
}

// vertices are labeled by their position in the graph, which makes the label
// of a vertex equal to its axis in the joint of the full network
Label BayesianNetwork::GetLabel(const VertexName &kName) const {
    return graph_.GetIndex(kName);
}

// ============================ probability tables ===========================

void BayesianNetwork::AddProbabilityTable(const VertexName &kName, const Tensor &kTable, const StateList &kStates, const VertexNameList &kParents){
    const VertexNameList kStructuralParents = graph_.GetParents(kName);

    if(kTable.Rank() == 0 || kTable.GetShape()[0] != kStates.size())
        throw ShapeMismatchException("Incorrect states for %s: %lu states given", kName.c_str(), kStates.size());

    if(kTable.Rank() != kStructuralParents.size() + 1)
        throw ShapeMismatchException("Incorrect dimensions for conditional/marginal probability of %s: rank %lu, but %lu parents", kName.c_str(), kTable.Rank(), kStructuralParents.size());

    if(kTable.Rank() != kParents.size() + 1)
        throw ShapeMismatchException("Incorrect dependency list for %s: rank %lu, but %lu dependencies", kName.c_str(), kTable.Rank(), kParents.size());

    if(options_.validate_parents)
        ValidateParents(kName, kTable, kParents);

    ProbabilityTable &table = tables_[kName];
    table.probability = kTable;
    table.states = kStates;
    table.parents = kParents;
    table.defined = true;
}

void BayesianNetwork::ValidateParents(const VertexName &kName, const Tensor &kTable, const VertexNameList &kParents) const {
    VertexNameList structural = graph_.GetParents(kName);
    VertexNameList declared = kParents;
    std::sort(structural.begin(), structural.end());
    std::sort(declared.begin(), declared.end());
    if(structural != declared)
        throw ShapeMismatchException("Dependency list of %s does not match its parents in the graph", kName.c_str());

    for(unsigned int i = 0; i < kParents.size(); i++){
        if(!HasProbabilityTable(kParents[i]))
            continue;

        const size_t kStates = GetDefinedTable(kParents[i]).states.size();
        if(kTable.GetShape()[i+1] != kStates)
            throw ShapeMismatchException("Axis %u of %s has dimension %lu, but parent %s has %lu states", i+1, kName.c_str(), kTable.GetShape()[i+1], kParents[i].c_str(), kStates);
    }
}

bool BayesianNetwork::HasProbabilityTable(const VertexName &kName) const {
    auto it = tables_.find(kName);
    return it != tables_.end() && it->second.defined;
}

const ProbabilityTable& BayesianNetwork::GetDefinedTable(const VertexName &kName) const {
    graph_.GetIndex(kName);

    auto it = tables_.find(kName);
    if(it == tables_.end() || !it->second.defined)
        throw MissingTableException("Node %s has no probability table", kName.c_str());

    return it->second;
}

const ProbabilityTable& BayesianNetwork::GetProbabilityTable(const VertexName &kName) const {
    return GetDefinedTable(kName);
}

size_t BayesianNetwork::GetStateIndex(const VertexName &kName, const State &kState) const {
    const StateList &kStates = GetDefinedTable(kName).states;
    auto it = std::find(kStates.begin(), kStates.end(), kState);
    if(it == kStates.end())
        throw InvalidStateException("Invalid state %s for node %s", kState.c_str(), kName.c_str());

    return std::distance(kStates.begin(), it);
}

StateSpace::StateSpaceSize BayesianNetwork::GetStateSpaceSize(const VertexNameList &kSubset) const {
    Shape shape;
    for(auto it = kSubset.begin(); it != kSubset.end(); it++)
        shape.push_back(GetDefinedTable(*it).states.size());

    return StateSpace::GetSize(shape);
}

// ================================ inference ================================

Tensor BayesianNetwork::ComputeJoint(const VertexNameList &kVertices) const {
    ContractionInputs inputs;
    LabelList output;
    for(auto it = kVertices.begin(); it != kVertices.end(); it++){
        const ProbabilityTable &kTable = GetDefinedTable(*it);

        LabelList labels(1, GetLabel(*it));
        for(auto pit = kTable.parents.begin(); pit != kTable.parents.end(); pit++)
            labels.push_back(GetLabel(*pit));

        inputs.push_back(ContractionInput(&kTable.probability, labels));
        output.push_back(GetLabel(*it));
    }

    const StateSpace::StateSpaceSize kSize = StateSpace::GetSize(GetLabelDimensions(inputs));
    StateSpace::Check(kSize, options_.max_state_space);
    Log(MSG, "contracting %lu tables over %s cells\n", inputs.size(), StateSpace::ToString(kSize).c_str());
    if(options_.verbose)
        Print(MSG, "contracting %lu tables over %s cells\n", inputs.size(), StateSpace::ToString(kSize).c_str());

    Tensor joint = Contract(inputs, output);
    try {
        joint.Normalize();
    } catch (TensorException &exception) {
        throw InferenceException("Joint probability cannot be normalized: %s", exception.what());
    }

    return joint;
}

AxisFixing BayesianNetwork::CreateEvidenceFixing(const Evidence &kEvidence) const {
    // a repeated variable is fixed by its last assignment
    AxisFixing fixing;
    const EvidenceList &kEvidenceList = kEvidence.GetEvidenceList();
    for(auto it = kEvidenceList.begin(); it != kEvidenceList.end(); it++)
        fixing[GetLabel(it->variable)] = GetStateIndex(it->variable, it->value);

    return fixing;
}

// kJoint must range over every vertex of the network, in graph order
Tensor BayesianNetwork::Condition(const Tensor &kJoint, const Evidence &kEvidence) const {
    Tensor sliced = kJoint.Fix(CreateEvidenceFixing(kEvidence));

    const probability_t kMass = sliced.Sum();
    Debug("evidence %s has mass %g\n", kEvidence.GetQueryString().c_str(), kMass);
    if(!(kMass > 0))
        throw ImpossibleEvidenceException("Evidence %s has zero probability", kEvidence.GetQueryString().c_str());

    sliced.Normalize();
    return sliced;
}

Tensor BayesianNetwork::ComputeJoint(const VertexNameList &kSubset, const Evidence &kEvidence) const {
    if(kEvidence.Empty())
        return ComputeJoint(kSubset);

    // evidence always conditions the joint of the whole network
    return Condition(ComputeJoint(GetVertexNames()), kEvidence);
}

Tensor BayesianNetwork::JointProbability() const {
    return ComputeJoint(GetVertexNames(), evidence_);
}

Tensor BayesianNetwork::JointProbability(const VertexNameList &kSubset) const {
    return ComputeJoint(kSubset, evidence_);
}

Tensor BayesianNetwork::ComputeMarginal(const VertexName &kName, bool total, const Evidence &kEvidence) const {
    const ProbabilityTable &kTable = GetDefinedTable(kName);

    if(kTable.parents.empty() && kEvidence.Empty())
        return kTable.probability;

    if(!kEvidence.Empty()){
        total = true;

        // an observed variable is certain to be in its observed state
        const EvidenceList &kEvidenceList = kEvidence.GetEvidenceList();
        for(auto it = kEvidenceList.rbegin(); it != kEvidenceList.rend(); it++){
            if(it->variable == kName){
                Tensor marginal(Shape(1, kTable.states.size()));
                marginal[GetStateIndex(kName, it->value)] = 1;
                return marginal;
            }
        }
    }

    VertexNameList subset;
    if(total)
        subset = GetVertexNames();
    else {
        subset.push_back(kName);
        subset.insert(subset.end(), kTable.parents.begin(), kTable.parents.end());
    }

    Tensor joint = ComputeJoint(subset, kEvidence);

    // observed axes were sliced away from the conditioned joint
    LabelList labels;
    for(auto it = subset.begin(); it != subset.end(); it++)
        if(!kEvidence.HasEvidence(*it))
            labels.push_back(GetLabel(*it));

    ContractionInputs inputs;
    inputs.push_back(ContractionInput(&joint, labels));
    Tensor marginal = Contract(inputs, LabelList(1, GetLabel(kName)));

    const probability_t kSum = marginal.Sum();
    if(std::fabs(kSum - 1) > options_.tolerance)
        throw InferenceException("Marginal of %s sums to %.12g", kName.c_str(), kSum);

    return marginal;
}

Tensor BayesianNetwork::MarginalProbability(const VertexName &kName, bool total) const {
    return ComputeMarginal(kName, total, evidence_);
}

Inference BayesianNetwork::GetInference(const VertexName &kName) const {
    const EvidenceVariable *kObserved = evidence_.Find(kName);
    if(kObserved != NULL)
        return Inference(kObserved->value);

    return Inference(ComputeMarginal(kName, true, evidence_));
}

Posteriors BayesianNetwork::GetPosteriors() const {
    Posteriors posteriors;
    const VertexNameList kNames = GetVertexNames();
    for(auto it = kNames.begin(); it != kNames.end(); it++)
        if(!evidence_.HasEvidence(*it))
            posteriors.push_back(Posterior(*it, ComputeMarginal(*it, true, evidence_)));

    return posteriors;
}

// ================================= evidence ================================

int BayesianNetwork::SetEvidence(const EvidenceList &kEvidenceList){
    for(auto it = kEvidenceList.begin(); it != kEvidenceList.end(); it++){
        if(!graph_.HasVertex(it->variable)){
            Log(ERR, "Invalid node specified: %s\n", it->variable.c_str());
            if(options_.verbose)
                Print(ERR, "Invalid node specified: %s\n", it->variable.c_str());
            return 1;
        }

        GetStateIndex(it->variable, it->value);
    }

    evidence_.Set(kEvidenceList);

    Log(MSG, "evidence set: %s\n", evidence_.GetQueryString().c_str());
    if(options_.verbose)
        Print(MSG, "evidence set: %s\n", evidence_.GetQueryString().c_str());
    return 0;
}

void BayesianNetwork::UnsetEvidence(){
    evidence_.Clear();
    Log(MSG, "evidence cleared\n");
    if(options_.verbose)
        Print(MSG, "evidence cleared\n");
}

const Evidence& BayesianNetwork::GetEvidence() const {
    return evidence_;
}

bool BayesianNetwork::HasEvidence(const VertexName &kName) const {
    return evidence_.HasEvidence(kName);
}

probability_t BayesianNetwork::ComputeEvidenceProbability(const Evidence &kEvidence) const {
    if(kEvidence.Empty())
        return 1;

    // a variable observed in two different states cannot happen
    const EvidenceList &kEvidenceList = kEvidence.GetEvidenceList();
    for(auto it = kEvidenceList.begin(); it != kEvidenceList.end(); it++){
        const EvidenceVariable *kFirst = kEvidence.Find(it->variable);
        if(kFirst->value != it->value)
            return 0;
    }

    return ComputeJoint(GetVertexNames()).Fix(CreateEvidenceFixing(kEvidence)).Sum();
}

probability_t BayesianNetwork::EvidenceProbability() const {
    return ComputeEvidenceProbability(evidence_);
}

// ================================== queries ================================

void BayesianNetwork::ValidateAssignment(const EvidenceVariable &kAssignment) const {
    if(!graph_.HasVertex(kAssignment.variable))
        throw QueryException("Unknown variable: %s", kAssignment.variable.c_str());

    const StateList &kStates = GetDefinedTable(kAssignment.variable).states;
    if(std::find(kStates.begin(), kStates.end(), kAssignment.value) == kStates.end())
        throw QueryException("Unknown assignment: %s = %s", kAssignment.variable.c_str(), kAssignment.value.c_str());
}

EvidenceList BayesianNetwork::ParseEvidence(const std::string &kText) const {
    EvidenceList evidence_list = Evidence::ParseAssignments(kText);
    for(auto it = evidence_list.begin(); it != evidence_list.end(); it++)
        ValidateAssignment(*it);

    return evidence_list;
}

probability_t BayesianNetwork::QueryProbability(const std::string &kText) const {
    Evidence query;
    query.Parse(kText);
    if(!query.HaveQueryVariable() && query.Empty())
        throw QueryException("Empty query");

    const EvidenceList &kConditions = query.GetEvidenceList();
    for(auto it = kConditions.begin(); it != kConditions.end(); it++)
        ValidateAssignment(*it);

    if(!query.HaveQueryVariable())
        return ComputeEvidenceProbability(query);

    const EvidenceVariable &kQuery = query.GetQueryVariable();
    ValidateAssignment(kQuery);

    const Tensor kMarginal = ComputeMarginal(kQuery.variable, true, Evidence(kConditions));
    return kMarginal[GetStateIndex(kQuery.variable, kQuery.value)];
}

}
