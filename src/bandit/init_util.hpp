#pragma once

#include "macro_util.h"
#include "bandit_util.hpp"
#include "model.hpp"
#include "roundwiselog.hpp"
#include "../truth/truth.hpp"
#include "../truth/truth_fixvalue.hpp"
#include "../truth/truth_uniform.hpp"
#include "../truth/truth_normal.hpp"
#include "../policy/policy.hpp"
#include "../policy/policy_ucb.hpp"
#include "../policy/policy_ie.hpp"

namespace drugsim {

// truth_type and its parameters -> distribution
inline TruthPtr makeTruth(const std::string& type, const std::vector<double>& params)
{
    if (type=="fixed" && params.size()==1) {
        return TruthPtr(new FixValueTruth(params[0]));
    }
    if (type=="uniform" && params.size()==2) {
        return TruthPtr(new UniformTruth(params[0], params[1]));
    }
    if (type=="normal" && params.size()==2) {
        return TruthPtr(new NormalTruth(params[0], params[1]));
    }
    throw ConfigurationError("unknown truth type '"+type+"' with "+itos(params.size())+" parameters");
}

// One alternative per line: label prior_mean prior_std truth_type p1 [p2]
inline std::vector<Alternative> parseAlternatives(const std::vector<std::string>& lines,
        const std::string& source = "<input>")
{
    std::vector<Alternative> alternatives;
    for (uint ln = 0; ln<lines.size(); ++ln) {
        std::vector<std::string> tokens = tokenize(lines[ln]);
        if (tokens.empty() || tokens[0][0]=='#') // do not read the comments in the file
            continue;
        const std::string where = source+":"+itos(ln+1)+": ";
        if (tokens.size()<5) {
            throw ConfigurationError(where+"expected 'label prior_mean prior_std truth_type params...'");
        }
        double priorMean, priorStd;
        if (!parseDouble(tokens[1], priorMean) || !parseDouble(tokens[2], priorStd)) {
            throw ConfigurationError(where+"prior mean and std must be numbers");
        }
        std::vector<double> params;
        for (uint i = 4; i<tokens.size(); ++i) {
            double p;
            if (!parseDouble(tokens[i], p)) {
                throw ConfigurationError(where+"truth parameter '"+tokens[i]+"' is not a number");
            }
            params.push_back(p);
        }
        try {
            alternatives.emplace_back(tokens[0], priorMean, priorStd, makeTruth(tokens[3], params));
        }
        catch (const ConfigurationError& e) {
            throw ConfigurationError(where+e.what());
        }
    }
    return alternatives;
}

inline std::vector<Alternative> initAlternatives(const std::string& filename)
{
    std::cout << "# Initializing drug parameters from " << filename << std::endl;
    std::vector<Alternative> alternatives = parseAlternatives(readlines(filename), filename);
    std::cout << "# Finish initialization of parameters " << alternatives.size() << " drugs." << std::endl;
    return alternatives;
}

inline PolicyPtr initPolicy(const std::string& policyName, SimulationModel& model, double theta)
{
    if (policyName=="ucb") {
        return PolicyPtr(new UCBPolicy(model, theta));
    }
    if (policyName=="ie") {
        return PolicyPtr(new IEPolicy(model, theta));
    }
    throw ConfigurationError("unknown policy '"+policyName+"', expected ucb or ie");
}

// comma-separated theta values, e.g. "0,0.5,1"
inline std::vector<double> parseThetaList(const std::string& str)
{
    std::vector<double> thetas;
    for (const auto& token : split(str, ',')) {
        std::vector<std::string> parts = tokenize(token);
        double theta;
        if (parts.size()!=1 || !parseDouble(parts[0], theta)) {
            throw ConfigurationError("bad theta value '"+token+"' in grid '"+str+"'");
        }
        thetas.push_back(theta);
    }
    return thetas;
}

// run one policy and print the round-wise summary
inline Results startSimulation(const int simulationTimes, SimulationModel& model, Policy& policy,
        std::ostream& os, bool verbose)
{
    std::cout << "# Model: " << model.info() << std::endl;
    std::cout << "# Policy: " << policy.info() << std::endl;
    Results results = policy.run(simulationTimes);

    if (verbose) {
        os << "#replication trial chosen W";
        for (const auto& label : model.getLabels()) {
            os << " mu(" << label << ") std(" << label << ") n(" << label << ")";
        }
        os << std::endl;
        for (const auto& rec : results) {
            os << rec << std::endl;
        }
    }

    RoundwiseLog log(model.numAlternatives(), model.horizon());
    log.addResults(results);
    RoundwiseLogWriter::logWrite(log, model.getLabels(), policy.name(), os);
    return results;
}

} // name space
