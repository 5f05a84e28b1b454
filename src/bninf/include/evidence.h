#ifndef BNINF_INCLUDE_EVIDENCE_H_
#define BNINF_INCLUDE_EVIDENCE_H_

#include <string>
#include <vector>
#include "types.h"

namespace bninf {

struct EvidenceVariable {
    EvidenceVariable(const VertexName &kVariable, const State &kValue) : variable(kVariable), value(kValue) {};
    EvidenceVariable(){};
    VertexName variable;
    State value;
    bool operator==(const EvidenceVariable &other) const;
};

typedef std::vector<EvidenceVariable> EvidenceList;

// Ordered list of observed assignments. A repeated variable is kept as is,
// Find() returns its first assignment. Optionally one assignment is marked as
// the query variable, as in "a=x | b=y, c=z".
class Evidence {
    public:
        Evidence();
        explicit Evidence(const EvidenceList&);

        void Clear();
        void Set(const EvidenceList&);
        void Add(const EvidenceVariable&);

        size_t Size() const;
        bool Empty() const;
        bool HasEvidence(const VertexName&) const;
        const EvidenceVariable* Find(const VertexName&) const;
        const EvidenceList& GetEvidenceList() const;

        void Parse(std::string);
        const bool HaveQueryVariable() const;
        const EvidenceVariable& GetQueryVariable() const;
        void UnsetQueryVariable();

        std::string GetQueryString() const;
        static std::string GetAssignmentString(const EvidenceVariable&);
        static EvidenceList ParseAssignments(std::string);

    private:
        static EvidenceVariable ParseAssignment(std::string);

        EvidenceList evidence_list_;
        EvidenceVariable query_variable_;
        bool have_query_variable_;
};

}

#endif
