#pragma once

#include <stdexcept>
#include <string>

namespace tierflow::core {

// Negative capacity, or accumulation past the range of Cap.
struct InvalidCapacity : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Source equals sink, or an endpoint is not a node of the graph.
struct InvalidEndpoints : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace tierflow::core
