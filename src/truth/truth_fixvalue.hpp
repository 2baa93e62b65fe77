#pragma once

#include "truth.hpp"

namespace drugsim {

class FixValueTruth: public Truth {
    const double value;

public:
    explicit FixValueTruth(double fix)
            :value(fix)
    {
        checkTruthParameter("value", value, false);
    }

    double getMean() override
    {
        return value;
    }

    double draw(RandomEngine&) override
    {
        return value;
    }

    std::string printInfo() override
    {
        return "fixed\t"+dtos(value);
    }

    TruthType getType() override
    {
        return TruthType::FIXVALUE;
    }
};

} //namespace
