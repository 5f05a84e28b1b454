#ifndef DIGRAPH_INCLUDE_EXCEPTIONS_H_
#define DIGRAPH_INCLUDE_EXCEPTIONS_H_

#include <exception/exception.h>

namespace bninf {

create_exception(GraphException);
create_derived_exception(NotFoundException, GraphException);

}

#endif
