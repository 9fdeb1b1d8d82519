#pragma once

#include <mutex>
#include <string>

// Thread-safe console output for the user: progress and results on stdout,
// warnings and failures on stderr.
// NOTE: This is NOT used for internal logs.
class Console {
public:
    void println(const std::string& s);
    void print(const std::string& s);
    void warn(const std::string& s);

private:
    std::mutex mu_;
};
