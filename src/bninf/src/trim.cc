#include "trim.h"
#include <algorithm>
#include <cctype>

namespace bninf {

inline bool IsNotSpace(const char c){
    return !std::isspace(static_cast<unsigned char>(c));
}

// trim from start (in place)
inline void LeftTrim(std::string &s){
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), IsNotSpace));
}

// trim from end (in place)
inline void RightTrim(std::string &s){
    s.erase(std::find_if(s.rbegin(), s.rend(), IsNotSpace).base(), s.end());
}

void Trim(std::string &s){
    LeftTrim(s);
    RightTrim(s);
}

}
