#include "common/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace fraudscope {

ParseError::ParseError(size_t line_number, std::string line, std::string reason)
    : FraudscopeError(fmt::format("line {}: {} ('{}')", line_number, reason, line)),
      line_number_(line_number),
      line_(std::move(line)),
      reason_(std::move(reason)) {}

} // namespace fraudscope
