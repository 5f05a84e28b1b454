#include <stdio.h>
#include <time.h>
#include <stdarg.h>
#include "io.h"

namespace bninf {

static std::string logfile_;

static void Timestamp(char *timestamp, const size_t kSize){
    time_t timer;
    struct tm* tm_info;

    time(&timer);
    tm_info = localtime(&timer);
    strftime(timestamp, kSize, "%b %d %H:%M:%S", tm_info);
}

void SetLogfile(const std::string &kFilename){
    logfile_ = kFilename;
}

static void VPrint(const PrintType kPrintType, const char *format, va_list args){
    if(kPrintType == MSG){
        fprintf(stdout, "  ");
        vfprintf(stdout, format, args);
    } else if(kPrintType == ERR){
        fprintf(stdout, "\033[31m  ");
        vfprintf(stdout, format, args);
        fprintf(stdout, "\033[0m");
    } else {
        fprintf(stdout, "\033[33m  ");
        vfprintf(stdout, format, args);
        fprintf(stdout, "\033[0m");
    }
    fflush(stdout);
}

void Print_(const PrintType kPrintType, const char *format, ...){
    va_list args;
    va_start (args, format);
    VPrint(kPrintType, format, args);
    va_end(args);
}

void Debug_(const char *kFilename, const char *kFunction, const int kLine, const char *format, ...){
    va_list args;
    va_start (args, format);

    char timestamp[25];
    Timestamp(timestamp, sizeof(timestamp));

    Print_(DBG,"%s:%s:%s:%d: ", timestamp, kFilename, kFunction, kLine);
    VPrint(DBG, format, args);

    va_end(args);
}

void Log_(const char *kFilename, const char *kFunction, const int kLine, const PrintType kPrintType, const char *format, ...){
    if(logfile_.empty())
        return;

    va_list args;
    va_start (args, format);

    FILE *file = fopen(logfile_.c_str(), "a");
    if(file){
        char timestamp[25];
        Timestamp(timestamp, sizeof(timestamp));

        fprintf(file,"%s:", timestamp);
        if(kPrintType == ERR)
            fprintf(file, "ERR:%s:%s:%d: ", kFilename, kFunction, kLine);
        else if(kPrintType == DBG)
            fprintf(file, "DBG:%s:%s:%d: ", kFilename, kFunction, kLine);
        else fprintf(file, " ");

        vfprintf(file, format, args);

        fclose(file);
    }
    #ifdef DEBUG
    else fprintf(stderr, "Could not open log file %s\n", logfile_.c_str());
    #endif
    va_end(args);
}

}
