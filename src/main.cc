#include <exception>
#include <iostream>
#include <string>

#include "parkpool/config.hpp"
#include "parkpool/log.hpp"
#include "parkpool/simulation.hpp"

using namespace std;
using namespace parkpool;

static void usage(const char* prog) {
    cerr << "usage: " << prog << " [config.json] [--verbose]\n";
}

int main(int argc, char** argv) {
    string path = "parking_config.json";
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--verbose" || a == "-v") {
            setLogLevel(LogLevel::Debug);
        } else if (a == "--help" || a == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!a.empty() && a[0] == '-') {
            usage(argv[0]);
            return 1;
        } else {
            path = a;
        }
    }

    try {
        logDebug("Loading config from " + path);
        SimulationConfig cfg = loadConfig(path);
        SimulationReport r = runSimulation(cfg);

        cout << "------ SUMMARY ------\n";
        cout << "Parked: " << r.parked << " | Turned away: " << r.turnedAway
             << " | Declined: " << r.declined << " | Exited: " << r.exited << "\n";
        cout << "Collected: INR " << r.collected << "\n";
        cout << "free/occupied/paid/total: " << r.occupancy.free << "/"
             << r.occupancy.occupied << "/" << r.occupancy.paid << "/"
             << r.occupancy.total << "\n";
        cout << "---------------------\n";
    } catch (const std::exception& e) {
        logFatal(e.what());
        return 1;
    }
    return 0;
}
