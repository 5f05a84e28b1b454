#ifndef EXCEPTION_INCLUDE_STRINGF_H_
#define EXCEPTION_INCLUDE_STRINGF_H_

#include <string>
#include <stdarg.h>

std::string vstringf(const char *format, va_list args);
std::string stringf(const char *format, ...);

#endif
