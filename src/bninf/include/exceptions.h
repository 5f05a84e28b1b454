#ifndef BNINF_INCLUDE_EXCEPTIONS_H_
#define BNINF_INCLUDE_EXCEPTIONS_H_

#include <exception/exception.h>
#include <digraph/exceptions.h>

namespace bninf {

create_exception(BninfException);
create_derived_exception(TensorException, BninfException);
create_derived_exception(ContractionException, TensorException);
create_derived_exception(ProbabilityTableException, BninfException);
create_derived_exception(ShapeMismatchException, ProbabilityTableException);
create_derived_exception(EvidenceException, BninfException);
create_derived_exception(InvalidStateException, EvidenceException);
create_derived_exception(ImpossibleEvidenceException, EvidenceException);
create_derived_exception(InferenceException, BninfException);
create_derived_exception(MissingTableException, InferenceException);
create_derived_exception(StateSpaceException, InferenceException);
create_derived_exception(QueryException, BninfException);

}

#endif
