#pragma once

#include "truth.hpp"

namespace drugsim {

class NormalTruth: public Truth {
    const double mean;
    const double stdDev;

public:
    NormalTruth(double mean, double stdDev)
            :mean(mean), stdDev(stdDev)
    {
        checkTruthParameter("mean", mean, false);
        checkTruthParameter("std", stdDev, true);
    }

    double getMean() override
    {
        return mean;
    }

    double draw(RandomEngine& rng) override
    {
        // std::normal_distribution requires a positive std
        if (stdDev==0.0) {
            return mean;
        }
        return std::normal_distribution<double>(mean, stdDev)(rng);
    }

    std::string printInfo() override
    {
        return "normal\t"+dtos(mean)+"\t"+dtos(stdDev);
    }

    TruthType getType() override
    {
        return TruthType::NORMAL;
    }
};

} //namespace
