#pragma once

#include <stackup/result.hpp>
#include <string>
#include <vector>

namespace stackup {

// Interactive side of the engine. A UI layer implements this; tests use a
// scripted fake. Returning StackupError::Cancelled aborts the operation.
class Prompter {
public:
    virtual ~Prompter() = default;

    // Choose one of options. With require_match the answer must be one of them.
    virtual Result<std::string> select(const std::string& prompt,
                                       const std::vector<std::string>& options,
                                       bool require_match) = 0;

    // Let the user edit a line of text, starting from initial
    virtual Result<std::string> edit_text(const std::string& prompt,
                                          const std::string& initial) = 0;
};

// Opens a file path or URL (browser, viewer, ...)
class Opener {
public:
    virtual ~Opener() = default;
    virtual Status open(const std::string& location) = 0;
};

} // namespace stackup
