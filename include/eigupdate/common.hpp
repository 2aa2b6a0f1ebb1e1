#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace eigupdate {

// Constants
constexpr double DEFAULT_ACCURACY = 1e-12;           // relative precision floor (acc)
constexpr double DEFAULT_STABILITY_FACTOR = 10.0;    // Gt multiplier for deflation guards
constexpr double EPS = std::numeric_limits<double>::epsilon();

// Failure of a rank-one update. Carries the stage that failed so callers can
// tell a bad argument from a numerical breakdown.
class UpdateError : public std::runtime_error {
public:
    enum class Stage { PRECONDITION, DEFLATION, SECULAR_SOLVE, EIGENVECTOR_UPDATE };

    UpdateError(Stage stage, const std::string& reason)
        : std::runtime_error(std::string(stage_name(stage)) + ": " + reason),
          stage_(stage), reason_(reason) {}

    Stage stage() const { return stage_; }
    const std::string& reason() const { return reason_; }

    static const char* stage_name(Stage stage) {
        switch (stage) {
            case Stage::PRECONDITION: return "precondition";
            case Stage::DEFLATION: return "deflation";
            case Stage::SECULAR_SOLVE: return "secular solve";
            case Stage::EIGENVECTOR_UPDATE: return "eigenvector update";
        }
        return "unknown";
    }

private:
    Stage stage_;
    std::string reason_;
};

}  // namespace eigupdate
