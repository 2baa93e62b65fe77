#pragma once

#include "belief.hpp"

namespace drugsim {

// Snapshot of every belief after one trial of one replication.
struct TrialRecord {
    uint replication;
    uint trial;
    uint chosen;
    double observation;
    std::vector<BeliefState> beliefs;

    TrialRecord()
            :replication(0), trial(0), chosen(0), observation(0.0)
    {
    }

    TrialRecord(uint replication, uint trial, uint chosen, double observation,
            const std::vector<BeliefState>& beliefs)
            :replication(replication), trial(trial), chosen(chosen), observation(observation),
             beliefs(beliefs)
    {
    }

    bool wasChosen(uint i) const
    {
        return i==chosen;
    }

    double stdDev(uint i) const
    {
        return beliefs.at(i).stdDev();
    }
};

typedef std::vector<TrialRecord> Results;

// "chosen this trial" flags recovered from the counts alone: compare n with the
// previous record of the same replication (or with zero on its first record)
inline std::vector<bool> chosenFlags(const Results& results, uint idx)
{
    const TrialRecord& current = results.at(idx);
    const TrialRecord* previous = nullptr;
    if (idx>0 && results[idx-1].replication==current.replication) {
        previous = &results[idx-1];
    }
    std::vector<bool> flags(current.beliefs.size(), false);
    for (uint i = 0; i<current.beliefs.size(); ++i) {
        uint before = previous ? previous->beliefs[i].n : 0;
        flags[i] = current.beliefs[i].n!=before;
    }
    return flags;
}

inline std::ostream& operator<<(std::ostream& os, const TrialRecord& rec)
{
    os << rec.replication << "\t" << rec.trial << "\t" << rec.chosen << "\t" << rec.observation;
    for (const auto& b : rec.beliefs) {
        os << "\t" << b.mu << "\t" << b.stdDev() << "\t" << b.n;
    }
    return os;
}

} //namespace
