#include "evidence.h"
#include "exceptions.h"
#include "trim.h"
#include <algorithm>

namespace bninf {

bool EvidenceVariable::operator==(const EvidenceVariable &other) const {
    return variable == other.variable && value == other.value;
}

Evidence::Evidence() : have_query_variable_(false) {
}

Evidence::Evidence(const EvidenceList &kEvidenceList) : evidence_list_(kEvidenceList), have_query_variable_(false) {
}

void Evidence::Clear(){
    evidence_list_.clear();
    UnsetQueryVariable();
}

void Evidence::Set(const EvidenceList &kEvidenceList){
    evidence_list_ = kEvidenceList;
}

void Evidence::Add(const EvidenceVariable &kEvidenceVariable){
    evidence_list_.push_back(kEvidenceVariable);
}

size_t Evidence::Size() const {
    return evidence_list_.size();
}

bool Evidence::Empty() const {
    return evidence_list_.empty();
}

const EvidenceVariable* Evidence::Find(const VertexName &kVariable) const {
    auto lambda = [&kVariable](const EvidenceVariable &kEvidenceVariable) {
        return kEvidenceVariable.variable == kVariable;
    };
    auto it = std::find_if(evidence_list_.begin(), evidence_list_.end(), lambda);
    return it == evidence_list_.end() ? NULL : &(*it);
}

bool Evidence::HasEvidence(const VertexName &kVariable) const {
    return Find(kVariable) != NULL;
}

const EvidenceList& Evidence::GetEvidenceList() const {
    return evidence_list_;
}

const bool Evidence::HaveQueryVariable() const {
    return have_query_variable_;
}

const EvidenceVariable& Evidence::GetQueryVariable() const {
    if(!have_query_variable_)
        throw QueryException("No query variable set");
    return query_variable_;
}

void Evidence::UnsetQueryVariable(){
    query_variable_ = EvidenceVariable();
    have_query_variable_ = false;
}

std::string Evidence::GetAssignmentString(const EvidenceVariable &kEvidenceVariable){
    return stringf("%s=%s", kEvidenceVariable.variable.c_str(), kEvidenceVariable.value.c_str());
}

std::string Evidence::GetQueryString() const {
    std::string query;
    if(HaveQueryVariable()){
        query.append(GetAssignmentString(query_variable_));
        if(!evidence_list_.empty())
            query.append(" | ");
    }

    for(unsigned int i = 0; i < evidence_list_.size(); i++){
        if(i > 0)
            query.append(", ");
        query.append(GetAssignmentString(evidence_list_[i]));
    }

    return query;
}

EvidenceVariable Evidence::ParseAssignment(std::string assignment){
    size_t eq_pos = assignment.find_first_of("=");
    if(std::string::npos == eq_pos || std::count(assignment.begin(), assignment.end(), '=') > 1)
        throw QueryException("Syntax error: expecting assignment, but got '%s'", assignment.c_str());

    std::string variable_name = assignment.substr(0,eq_pos);
    std::string value_name = assignment.substr(eq_pos+1);
    Trim(variable_name);
    Trim(value_name);

    if(variable_name.length() == 0)
        throw QueryException("Missing variable at assignment '%s'", assignment.c_str());

    if(value_name.length() == 0)
        throw QueryException("Missing value at assignment '%s'", assignment.c_str());

    return EvidenceVariable(variable_name, value_name);
}

EvidenceList Evidence::ParseAssignments(std::string query_string){
    EvidenceList list;

    Trim(query_string);
    if(query_string.empty())
        return list;

    while(true){
        size_t cm_pos = query_string.find_first_of(",");
        std::string assignment = query_string.substr(0, cm_pos);

        EvidenceVariable evidence_variable = ParseAssignment(assignment);
        auto lambda = [&evidence_variable](const EvidenceVariable &kOther) {
            return kOther.variable == evidence_variable.variable;
        };
        if(std::find_if(list.begin(), list.end(), lambda) != list.end())
            throw QueryException("Conflicting evidence at assignment %s, variable %s already has a value", assignment.c_str(), evidence_variable.variable.c_str());
        list.push_back(evidence_variable);

        if(cm_pos != std::string::npos)
            query_string = query_string.substr(cm_pos+1);
        else break;
    }

    return list;
}

void Evidence::Parse(std::string query_string){
    Clear();

    // check empty string
    Trim(query_string);
    if(query_string.empty())
        return;

    // check string format
    const unsigned int kConditional = std::count(query_string.begin(), query_string.end(), '|');
    if(kConditional > 1)
        throw QueryException("Syntax error: only one '|' symbol is allowed");

    // make query_string a comma delimited string
    if(kConditional){
        size_t pos = query_string.find_first_of("|");
        if(query_string.find_first_of(",") < pos)
            throw QueryException("Syntax error: you can only query one variable at a time");
        query_string.replace(pos,1,",");
    }

    EvidenceList list = ParseAssignments(query_string);
    if(list.size() == 1 || kConditional){
        query_variable_ = list.front();
        have_query_variable_ = true;
        list.erase(list.begin());
    }
    evidence_list_ = list;
}

}
