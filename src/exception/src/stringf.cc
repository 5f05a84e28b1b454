#include "stringf.h"
#include <stdio.h>
#include <vector>

std::string vstringf(const char *format, va_list args){
    va_list copy;
    va_copy(copy, args);
    const int kLength = vsnprintf(NULL, 0, format, copy);
    va_end(copy);

    if(kLength <= 0)
        return std::string();

    std::vector<char> buffer(kLength+1);
    vsnprintf(&(buffer[0]), buffer.size(), format, args);
    return std::string(&(buffer[0]), kLength);
}

std::string stringf(const char *format, ...){
    va_list args;
    va_start(args, format);
    std::string str = vstringf(format, args);
    va_end(args);
    return str;
}
