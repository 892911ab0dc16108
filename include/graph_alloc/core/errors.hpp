#pragma once

#include <stdexcept>
#include <string>

namespace graph_alloc {

// Unknown node, malformed topology
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The seed allocation violates the structural invariants; raised before a run starts
class InvalidSeed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Every worker of the pool is dead; fatal to the run
class EvaluatorUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A worker process could not be spawned or did not complete the handshake
class WorkerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace graph_alloc
