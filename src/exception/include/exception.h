#ifndef EXCEPTION_INCLUDE_EXCEPTION_H_
#define EXCEPTION_INCLUDE_EXCEPTION_H_

#include <exception>
#include <string>
#include <stdarg.h>
#include "stringf.h"

// Declares an exception class whose constructor takes a printf style format,
// e.g. throw FooException("unknown variable: %s", name.c_str());
#define create_exception(name) \
    class name : public std::exception { \
        public: \
            name(){} \
            explicit name(const char *format, ...){ \
                va_list args; \
                va_start(args, format); \
                message_ = vstringf(format, args); \
                va_end(args); \
            } \
            virtual const char* what() const noexcept { \
                return message_.c_str(); \
            } \
        protected: \
            std::string message_; \
    }

#define create_derived_exception(name, base) \
    class name : public base { \
        public: \
            name(){} \
            explicit name(const char *format, ...){ \
                va_list args; \
                va_start(args, format); \
                message_ = vstringf(format, args); \
                va_end(args); \
            } \
    }

#endif
