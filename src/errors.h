#ifndef MIRAGE_ERRORS_H
#define MIRAGE_ERRORS_H

#include <stdexcept>
#include <string>

namespace Mirage {

class MirageError : public std::runtime_error {
public:
    explicit MirageError(const std::string& what) : std::runtime_error(what) {}
};

// Dimension mismatch between a stored/cached agent and the requesting environment,
// or an invalid engine configuration value.
class ConfigurationError : public MirageError {
public:
    explicit ConfigurationError(const std::string& what) : MirageError(what) {}
};

// step() outside the ACTIVE phase.
class InvalidStateError : public MirageError {
public:
    explicit InvalidStateError(const std::string& what) : MirageError(what) {}
};

// Action index outside [0, action_dim). Environment state is left untouched.
class OutOfRangeActionError : public MirageError {
public:
    OutOfRangeActionError(int action, int action_dim)
        : MirageError("action index " + std::to_string(action) + " outside [0, " + std::to_string(action_dim) + ")"),
          action_(action), action_dim_(action_dim) {}
    int action() const { return action_; }
    int action_dim() const { return action_dim_; }

private:
    int action_;
    int action_dim_;
};

} // namespace Mirage

#endif
