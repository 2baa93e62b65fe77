#include "cmdline.h"
#include "bandit/init_util.hpp"
#include "bandit/grid_search.hpp"

using namespace std;
using namespace drugsim;

int main(int argc, char* argv[])
{
    cmdline::parser cmd;
    cmd.add<int>("times", 'n', "number of replications", false, 1);
    cmd.add<int>("rounds", 'T', "number of trials in a replication", false, 20);
    cmd.add<string>("file", 'f', "filename for drug parameters", false, "./drugdata/drugParams.txt");
    cmd.add<string>("policy", 'p', "policy: < ucb | ie >", false, "ucb", cmdline::oneof<string>("ucb", "ie"));
    cmd.add<double>("theta", 't', "policy tunable", false, 1.0);
    cmd.add<double>("sigmaW", 'w', "standard deviation of the observation noise", false, 0.05);
    cmd.add<int>("seed", 's', "random number seed", false, -1);
    // e.g. -g 0,0.5,1,2 sweeps theta instead of a single run
    cmd.add<string>("grid", 'g', "comma-separated theta values to search", false, "");
    cmd.add("verbose", 'v', "print every trial record");
    cmd.parse_check(argc, argv);
    const int n = cmd.get<int>("times");
    const int T = cmd.get<int>("rounds");
    const string parasFile = cmd.get<string>("file");
    const string policyName = cmd.get<string>("policy");
    const double theta = cmd.get<double>("theta");
    const double sigmaW = cmd.get<double>("sigmaW");
    const string grid = cmd.get<string>("grid");
    const bool verbose = cmd.exist("verbose");
    int rngSeed = cmd.get<int>("seed");
    if (rngSeed==-1) {
        rngSeed = static_cast<int>(std::time(0));
    }
    cout << "rngSeed=" << rngSeed << endl;

    try {
        vector<Alternative> alternatives = initAlternatives(parasFile);

        if (!grid.empty()) {
            GridSearch search(alternatives, sigmaW, T, n, policyName, static_cast<uint>(rngSeed));
            GridSearch::write(search.run(parseThetaList(grid)), policyName, cout);
            return 0;
        }

        RandomEngine rng(static_cast<uint>(rngSeed));
        SimulationModel model(alternatives, sigmaW, T, rng);
        PolicyPtr policy = initPolicy(policyName, model, theta);
        cout << "Initpolicy finished..." << endl;
        startSimulation(n, model, *policy, cout, verbose);
    }
    catch (const ConfigurationError& e) {
        cerr << "configuration error: " << e.what() << endl;
        return 1;
    }
    catch (const SimulationError& e) {
        LOG_var(e.what());
        return 2;
    }

    return 0;
}
