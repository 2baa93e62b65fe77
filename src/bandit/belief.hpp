#pragma once

#include "bandit_util.hpp"

namespace drugsim {

// Normal belief about the unknown mean effect of one alternative.
// beta is the precision (1/variance) and n the number of observations.
struct BeliefState {
    double mu;
    double beta;
    uint n;

    BeliefState(double mu = 0.0, double beta = 1.0, uint n = 0)
            :mu(mu), beta(beta), n(n)
    {
    }

    static BeliefState fromPrior(double priorMean, double priorStd)
    {
        return BeliefState(priorMean, 1.0/(priorStd*priorStd), 0);
    }

    // conjugate normal-normal update with observation precision betaW
    BeliefState update(double observation, double betaW) const
    {
        const double betaNew = beta+betaW;
        return BeliefState((beta*mu+betaW*observation)/betaNew, betaNew, n+1);
    }

    double stdDev() const
    {
        return 1.0/std::sqrt(beta);
    }

    bool operator==(const BeliefState& other) const
    {
        return mu==other.mu && beta==other.beta && n==other.n;
    }

    bool operator!=(const BeliefState& other) const
    {
        return !(*this==other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const BeliefState& b)
{
    return os << "(" << b.mu << ", " << b.beta << ", " << b.n << ")";
}

} //namespace
