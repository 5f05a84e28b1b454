#ifndef BNINF_INCLUDE_IO_H_
#define BNINF_INCLUDE_IO_H_

#include <string>

namespace bninf {

enum PrintType { MSG = 1, ERR = 2, DBG = 3};

// Log() appends to this file, process wide; an empty name disables file logging
void SetLogfile(const std::string&);

void Log_(const char*, const char*, const int, const PrintType, const char*, ...);
void Debug_(const char*, const char*, const int, const char*, ...);
void Print_(const PrintType, const char*, ...);

}

#define Log(...)   bninf::Log_(__FILE__, __FUNCTION__, __LINE__, __VA_ARGS__)
#define Print(...) bninf::Print_( __VA_ARGS__)

#ifdef DEBUG
#define Debug(...) bninf::Debug_(__FILE__, __FUNCTION__, __LINE__, __VA_ARGS__)
#else
#define Debug(...)
#endif

#endif
