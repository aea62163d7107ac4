#include "minimod/minimod.hpp"
#include <cmath>
#include <iostream>
#include <string>

#ifndef MINIMOD_DATA_DIR
#define MINIMOD_DATA_DIR "data"
#endif

using namespace minimod;

namespace {

void
print_parameters(const ParameterVector &p) {
    glucose::ModelParameters const m = glucose::ModelParameters::from_vector(p);
    std::cout << "G0 = " << m.G0 << ", k1 = " << m.k1 << ", k2 = " << m.k2 << ", k3 = " << m.k3;
}

} // namespace

int
main(int argc, char **argv) {
    std::cout << "--- Glucose Minimal Model: Parameter Fit ---" << '\n';

    std::string const path = argc > 1 ? argv[1] : std::string(MINIMOD_DATA_DIR) + "/glucose_insulin.csv";

    try {
        glucose::GlucoseData const data = glucose::GlucoseData::from_table(SignalTable::read_csv(path));
        ObjectiveFunction const objective = glucose::make_objective(data);

        // Rate constants cannot be negative; G0 is left free above zero.
        FitOptions options;
        options.lower_bounds = { 0.0, 0.0, 0.0, 0.0 };
        options.compute_covariance = true;
        options.verbose = true;

        ParameterVector const initial_guess = glucose::ModelParameters().to_vector();
        std::cout << "Initial guess: ";
        print_parameters(initial_guess);
        std::cout << "\nInitial residual norm: " << std::sqrt(objective(initial_guess).squared_norm()) << '\n';

        Fitter fitter(options);
        FitResult const result = fitter.fit(objective, initial_guess);

        std::cout << "\nState: " << to_string(result.state) << '\n';
        std::cout << "Message: " << result.diagnostics.message << '\n';
        std::cout << "Iterations: " << result.diagnostics.num_iterations
                  << ", objective evaluations: " << result.diagnostics.num_evaluations << '\n';
        std::cout << "Best fit: ";
        print_parameters(result.parameters);
        std::cout << "\nResidual norm: " << result.diagnostics.residual_norm << '\n';

        if (result.has_covariance) {
            // Scale by the residual variance to get standard errors
            double const dof = static_cast<double>(result.residuals.size()) - static_cast<double>(initial_guess.size());
            double const sigma2 = result.residuals.squared_norm() / dof;
            std::cout << "Standard errors:";
            for (Eigen::Index i = 0; i < result.covariance.rows(); ++i) {
                std::cout << " " << std::sqrt(sigma2 * result.covariance(i, i));
            }
            std::cout << '\n';
        }

        if (!result.diagnostics.success) {
            std::cout << "\nFit did not converge; the parameters above are best effort." << '\n';
            return 2;
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
