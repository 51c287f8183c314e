#ifndef LOG_H
#define LOG_H

#include <iostream>
#include <sstream>

// Diagnostics on stderr. Debug lines are printed only when Verbose is set.
class Log {
public:
    static bool Verbose;

    template <typename... Args>
    static void debug(const Args&... args) {
        if (Verbose) write("debug", args...);
    }

    template <typename... Args>
    static void warn(const Args&... args) {
        write("warn", args...);
    }

    template <typename... Args>
    static void error(const Args&... args) {
        write("error", args...);
    }

private:
    template <typename... Args>
    static void write(const char* level, const Args&... args) {
        std::ostringstream line;
        (line << ... << args);
        std::cerr << "[" << level << "] " << line.str() << "\n";
    }
};

#endif // LOG_H
