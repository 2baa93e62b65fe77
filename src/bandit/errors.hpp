#pragma once

#include <stdexcept>
#include <string>

namespace drugsim {

// Base error for the simulator.
class SimulationError: public std::runtime_error {
public:
    explicit SimulationError(const std::string& msg)
            :std::runtime_error(msg)
    {
    }
};

// Invalid priors, distributions, horizons or policy tunables.
// Raised while building a model or a policy, never in the middle of a run.
class ConfigurationError: public SimulationError {
public:
    explicit ConfigurationError(const std::string& msg)
            :SimulationError(msg)
    {
    }
};

// A model operation called in a state that does not allow it.
class UsageError: public SimulationError {
public:
    explicit UsageError(const std::string& msg)
            :SimulationError(msg)
    {
    }
};

} //namespace
