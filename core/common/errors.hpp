#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fraudscope {

// ─── Error taxonomy ────────────────────────────────────────────
// Every fatal engine error derives from FraudscopeError, so callers can
// catch the whole family at the analyze() boundary.

class FraudscopeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed input line during dataset construction.
class ParseError : public FraudscopeError {
public:
    ParseError(size_t line_number, std::string line, std::string reason);

    size_t lineNumber() const { return line_number_; }
    const std::string& line() const { return line_; }
    const std::string& reason() const { return reason_; }

private:
    size_t line_number_;
    std::string line_;
    std::string reason_;
};

/// An input source could not be opened or read.
class DataSourceError : public FraudscopeError {
public:
    using FraudscopeError::FraudscopeError;
};

/// Unknown strategy tag, invalid parameter, or a parameter the input
/// cannot satisfy (e.g. a wavelet level deeper than the series allows).
class ConfigurationError : public FraudscopeError {
public:
    using FraudscopeError::FraudscopeError;
};

/// Long-running detection stopped by its cancellation token or time budget.
class AnalysisCancelled : public FraudscopeError {
public:
    using FraudscopeError::FraudscopeError;
};

} // namespace fraudscope
