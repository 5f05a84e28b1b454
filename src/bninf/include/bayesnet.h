#ifndef BNINF_INCLUDE_BAYESNET_H_
#define BNINF_INCLUDE_BAYESNET_H_

#include <digraph/digraph.h>
#include <unordered_map>
#include <utility>
#include <vector>
#include <string>
#include "contraction.h"
#include "statespace.h"
#include "inference.h"
#include "evidence.h"
#include "options.h"
#include "tensor.h"
#include "types.h"

namespace bninf {

// Probabilistic attributes of a vertex. The first axis of probability ranges
// over states, the remaining axes over the parents in the listed order.
struct ProbabilityTable {
    ProbabilityTable() : defined(false) {};
    Tensor probability;
    StateList states;
    VertexNameList parents;
    bool defined;
};

typedef std::pair<VertexName, Tensor>   Posterior;
typedef std::vector<Posterior>          Posteriors;

// Discrete Bayesian network answering exact inference queries. Every query
// contracts the probability tables into a joint distribution from scratch;
// only the evidence list persists between queries. Not thread safe.
class BayesianNetwork {
    public:
        BayesianNetwork();
        explicit BayesianNetwork(const Options&);

        void SetOptions(const Options&);
        const Options& GetOptions() const;

        // structure
        void AddNode(const VertexName&);
        void AddChild(const VertexName &kParent, const VertexName &kChild);
        VertexNameList GetParents(const VertexName&) const;
        const DirectedGraph& GetGraph() const;

        // Attach the (conditional) probability table of a vertex. kParents must
        // name the parents in the order of the table's trailing axes; this order
        // is trusted and only checked when Options::validate_parents is set.
        void AddProbabilityTable(const VertexName&, const Tensor&, const StateList&, const VertexNameList &kParents = VertexNameList());
        bool HasProbabilityTable(const VertexName&) const;
        const ProbabilityTable& GetProbabilityTable(const VertexName&) const;
        size_t GetStateIndex(const VertexName&, const State&) const;

        // probabilities
        Tensor JointProbability() const;
        Tensor JointProbability(const VertexNameList &kSubset) const;
        Tensor MarginalProbability(const VertexName&, bool total = true) const;

        // evidence, returns non zero when a variable does not exist
        int SetEvidence(const EvidenceList&);
        void UnsetEvidence();
        const Evidence& GetEvidence() const;
        bool HasEvidence(const VertexName&) const;

        Inference GetInference(const VertexName&) const;

        Posteriors GetPosteriors() const;
        probability_t EvidenceProbability() const;
        probability_t QueryProbability(const std::string&) const;
        EvidenceList ParseEvidence(const std::string&) const;
        StateSpace::StateSpaceSize GetStateSpaceSize(const VertexNameList&) const;

    private:
        VertexNameList GetVertexNames() const;
        Label GetLabel(const VertexName&) const;
        const ProbabilityTable& GetDefinedTable(const VertexName&) const;
        void ValidateParents(const VertexName&, const Tensor&, const VertexNameList&) const;
        void ValidateAssignment(const EvidenceVariable&) const;

        Tensor ComputeJoint(const VertexNameList&) const;
        AxisFixing CreateEvidenceFixing(const Evidence&) const;
        Tensor Condition(const Tensor&, const Evidence&) const;
        Tensor ComputeJoint(const VertexNameList&, const Evidence&) const;
        Tensor ComputeMarginal(const VertexName&, bool total, const Evidence&) const;
        probability_t ComputeEvidenceProbability(const Evidence&) const;

        DirectedGraph graph_;
        std::unordered_map<VertexName, ProbabilityTable> tables_;
        Evidence evidence_;
        Options options_;
};

}

#endif
