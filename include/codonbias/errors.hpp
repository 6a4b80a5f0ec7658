#pragma once

#include <stdexcept>
#include <string>

namespace codonbias {

// Invalid model parameters: unknown genetic code, bad k-mer size,
// unrecognized mean selector, missing tRNA gene source, ...
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// External data (tRNA gene tables, coefficient files) could not be read
class RetrievalError : public std::runtime_error {
public:
    explicit RetrievalError(const std::string& msg)
        : std::runtime_error(msg) {}
};

} // namespace codonbias
