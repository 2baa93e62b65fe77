#pragma once

#include "bandit_util.hpp"

namespace drugsim {

// Noisy outcome of trying an alternative: N(groundTruth, sigmaW)
class ObservationModel {
public:
    static double sample(double groundTruth, double sigmaW, RandomEngine& rng)
    {
        return std::normal_distribution<double>(groundTruth, sigmaW)(rng);
    }
};

} //namespace
