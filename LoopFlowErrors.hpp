// LoopFlow error taxonomy
//
// Every failure in the engine surfaces as one of these exceptions:
// - ConfigurationError: bad strategy arguments, raised at construction
// - StructuralError: graph shape problems found by addNode/validateGraph or
//   while reading a flow description
// - ConsistencyError: ids the engine cannot resolve while executing
#pragma once
#include <stdexcept>
#include <string>

namespace LoopFlow {

struct ConfigurationError : std::invalid_argument {
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

struct StructuralError : std::runtime_error {
    explicit StructuralError(const std::string& what) : std::runtime_error(what) {}
};

struct ConsistencyError : std::runtime_error {
    explicit ConsistencyError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace LoopFlow
