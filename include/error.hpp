#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

// The output sink rejected a write. Renders are not retried.
class OutputError : public std::runtime_error {
public:
    explicit OutputError(const std::string& message)
        : std::runtime_error(message) {}
};

// Stream state check after a write to the output sink
#define OUTPUT_CHECK(stream, what)                                      \
    do                                                                  \
    {                                                                   \
        if (!(stream))                                                  \
        {                                                               \
            std::stringstream ss;                                       \
            ss << "Failed to write " << what << " to output stream"     \
               << " at " << __FILE__ << ":" << __LINE__;                \
            throw OutputError(ss.str());                                \
        }                                                               \
    } while (0)
