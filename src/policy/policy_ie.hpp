#pragma once

#include "policy.hpp"

namespace drugsim {

// Interval estimation: mu + theta * posterior std
class IEPolicy: public Policy {
public:
    IEPolicy(SimulationModel& model, double theta)
            :Policy(model, theta)
    {
    }

    std::vector<double> scores(const std::vector<BeliefState>& beliefs, uint) const override
    {
        std::vector<double> s(beliefs.size(), 0.0);
        for (uint i = 0; i<beliefs.size(); ++i) {
            s[i] = beliefs[i].mu+theta/std::sqrt(beliefs[i].beta);
        }
        return s;
    }

    std::string name() override
    {
        return "IE";
    }

    std::string info() override
    {
        std::string str = "IE with theta=";
        str += dtos(theta);
        return str;
    }

    PolicyType getType() override
    {
        return PolicyType::INTERVAL_ESTIMATION;
    }
};

} //namespace
