#pragma once
#include <stdexcept>
#include <string>

namespace csvsa {

// Every failure the pipeline reports is one of these. main() maps them to exit codes.
class error : public std::runtime_error {
public:
    explicit error(const std::string& message) : std::runtime_error(message) {}
};

// Unreadable input, malformed table, bad encoding.
class input_error : public error {
public:
    explicit input_error(const std::string& message) : error("input error: " + message) {}
};

// Out-of-range sample spec, unknown or ambiguous column, bad delimiter.
class specification_error : public error {
public:
    explicit specification_error(const std::string& message)
        : error("specification error: " + message) {}
};

class synthesis_error : public error {
public:
    explicit synthesis_error(const std::string& message) : error("synthesis error: " + message) {}
};

// Destination unwritable or content not representable in the output encoding.
class output_error : public error {
public:
    explicit output_error(const std::string& message) : error("output error: " + message) {}
};

}
