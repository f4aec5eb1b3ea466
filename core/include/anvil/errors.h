#pragma once

/**
 * @file errors.h
 * @brief Exception taxonomy for graph edits and evaluation
 *
 * Edit-time failures derive from GraphStructureError and are thrown before
 * the graph is touched. Evaluation-time failures derive from EvalError and are
 * caught by the Evaluator, which turns them into an EvalFailure naming the
 * node. CacheConsistencyError signals an engine bug and is never caught.
 */

#include <stdexcept>
#include <string>

namespace anvil {

/// Base class of every exception thrown by anvil
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// Edit-time errors
// -----------------------------------------------------------------------------

/// A graph mutation was rejected; the graph is unchanged
class GraphStructureError : public Error {
public:
    using Error::Error;
};

/// The requested edge would close a cycle
class CycleError : public GraphStructureError {
public:
    using GraphStructureError::GraphStructureError;
};

/// Source and destination slot types are not compatible
class TypeMismatchError : public GraphStructureError {
public:
    using GraphStructureError::GraphStructureError;
};

/// The destination slot already has an incoming edge
class SlotOccupiedError : public GraphStructureError {
public:
    using GraphStructureError::GraphStructureError;
};

/// A node handle or slot name does not exist in the graph
class DanglingReferenceError : public GraphStructureError {
public:
    using GraphStructureError::GraphStructureError;
};

// -----------------------------------------------------------------------------
// Evaluation-time errors
// -----------------------------------------------------------------------------

/// An operator failed while producing its outputs
class EvalError : public Error {
public:
    using Error::Error;
};

/// Malformed or degenerate mesh data
class GeometryError : public EvalError {
public:
    using EvalError::EvalError;
};

/// Why a scripted operator failed
enum class ScriptErrorKind {
    Compile,          ///< Source did not parse or did not define a node
    Runtime,          ///< Script raised an exception
    Timeout,          ///< Time budget exceeded
    OutOfMemory,      ///< Runtime memory limit exceeded
    MalformedOutput,  ///< Returned value does not match the declared outputs
    Broken            ///< Script failed to load and has not been fixed since
};

/// Name used in logs and failure reports
const char* scriptErrorKindName(ScriptErrorKind kind);

/// A scripted operator failed inside the execution boundary
class ScriptError : public EvalError {
public:
    ScriptError(ScriptErrorKind kind, const std::string& message, std::string stack = {})
        : EvalError(message), m_kind(kind), m_stack(std::move(stack)) {}

    ScriptErrorKind kind() const { return m_kind; }

    /// Script-side stack trace, empty when none was available
    const std::string& stack() const { return m_stack; }

private:
    ScriptErrorKind m_kind;
    std::string m_stack;
};

// -----------------------------------------------------------------------------
// Fatal and I/O errors
// -----------------------------------------------------------------------------

/// Internal invariant violation; indicates an engine bug
class CacheConsistencyError : public Error {
public:
    using Error::Error;
};

/// A persisted graph or configuration document could not be read
class GraphFormatError : public Error {
public:
    using Error::Error;
};

} // namespace anvil
