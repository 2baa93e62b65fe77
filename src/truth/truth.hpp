#pragma once

#include "../bandit/macro_util.h"
#include "../bandit/bandit_util.hpp"

namespace drugsim {

enum TruthType {
    FIXVALUE,
    UNIFORM,
    NORMAL
};

// Ground-truth distribution of one alternative.
// Parameters are validated by the constructors; draw() never fails.
class Truth {
public:
    virtual ~Truth() {}

    virtual double draw(RandomEngine& rng) = 0;

    virtual double getMean() = 0;

    virtual std::string printInfo() = 0;

    virtual TruthType getType() = 0;
};

typedef std::shared_ptr<Truth> TruthPtr;

inline void checkTruthParameter(const std::string& what, double value, bool nonNegative)
{
    if (!std::isfinite(value)) {
        throw ConfigurationError("truth "+what+" must be finite");
    }
    if (nonNegative && value<0.0) {
        throw ConfigurationError("truth "+what+" must be non-negative, got "+dtos(value));
    }
}

} //namespace
