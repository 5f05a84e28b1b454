#ifndef BNINF_INCLUDE_TRIM_H_
#define BNINF_INCLUDE_TRIM_H_

#include <string>

namespace bninf {

// trim white space from both ends (in place)
void Trim(std::string&);

}

#endif
