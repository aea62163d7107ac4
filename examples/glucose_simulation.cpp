#include "minimod/minimod.hpp"
#include <iomanip>
#include <iostream>
#include <string>

#ifndef MINIMOD_DATA_DIR
#define MINIMOD_DATA_DIR "data"
#endif

using namespace minimod;

int
main(int argc, char **argv) {
    std::cout << "--- Glucose Minimal Model: Discrete vs Continuous Simulation ---" << '\n';

    std::string const path = argc > 1 ? argv[1] : std::string(MINIMOD_DATA_DIR) + "/glucose_insulin.csv";
    double const dt = argc > 2 ? std::stod(argv[2]) : 2.0;

    try {
        // --- 1. Load measurements and build the configuration ---
        SignalTable const table = SignalTable::read_csv(path);
        glucose::GlucoseData const data = glucose::GlucoseData::from_table(table);
        glucose::ModelParameters const params;
        SystemConfig const config = glucose::make_config(params, data, dt);

        std::cout << "Data: " << table.size() << " rows over [" << config.t0() << ", " << config.t_end() << "]"
                  << ", Gb = " << data.glucose_baseline << ", Ib = " << data.insulin_baseline << '\n';
        std::cout << "Parameters: G0 = " << params.G0 << ", k1 = " << params.k1 << ", k2 = " << params.k2
                  << ", k3 = " << params.k3 << ", dt = " << dt << '\n';

        // --- 2. Run both simulators on the same grid ---
        Trajectory const discrete = DiscreteSimulator(glucose::update).run(config);
        SimulationResult const continuous = ContinuousSimulator(glucose::slope).run(config, discrete.times());
        if (!continuous.diagnostics.success) {
            std::cerr << "Continuous simulation failed: " << continuous.diagnostics.message << '\n';
            return 1;
        }

        // --- 3. Compare ---
        std::cout << "\nTime\tG (discrete)\tG (continuous)\tX (continuous)" << '\n';
        std::cout << std::fixed << std::setprecision(4);
        for (size_t i = 0; i < discrete.size(); i += 5) {
            std::cout << discrete.time(i) << "\t" << discrete.state(i).get(glucose::kGlucose) << "\t"
                      << continuous.trajectory.state(i).get(glucose::kGlucose) << "\t"
                      << continuous.trajectory.state(i).get(glucose::kInsulinEffect) << '\n';
        }
        std::cout << std::defaultfloat;

        std::cout << "\nMax relative difference in G: "
                  << max_relative_difference(discrete, continuous.trajectory, glucose::kGlucose) << '\n';
        std::cout << "Max absolute difference in G: "
                  << max_absolute_difference(discrete, continuous.trajectory, glucose::kGlucose) << '\n';
        std::cout << "Slope evaluations: " << continuous.diagnostics.num_evaluations << '\n';
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
