#pragma once

#include "policy.hpp"

namespace drugsim {

// mu + theta * sqrt(ln(t) / n); untried alternatives score +inf
class UCBPolicy: public Policy {
public:
    UCBPolicy(SimulationModel& model, double theta)
            :Policy(model, theta)
    {
    }

    std::vector<double> scores(const std::vector<BeliefState>& beliefs, uint t) const override
    {
        std::vector<double> s(beliefs.size(), 0.0);
        for (uint i = 0; i<beliefs.size(); ++i) {
            const BeliefState& b = beliefs[i];
            if (b.n==0) {
                s[i] = infinity;
            }
            else {
                s[i] = b.mu+theta*std::sqrt(std::log(static_cast<double>(t))/b.n);
            }
        }
        return s;
    }

    std::string name() override
    {
        return "UCB";
    }

    std::string info() override
    {
        std::string str = "UCB with theta=";
        str += dtos(theta);
        return str;
    }

    PolicyType getType() override
    {
        return PolicyType::UCB;
    }
};

} //namespace
