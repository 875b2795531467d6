// HoleLayoutTest.cpp
//
// Hole-tab offset as a continuous function of label length.

#include "HoleLayout.hpp"
#include "TestSupport.hpp"
#include <cmath>

using namespace keyforge;
using keyforge::test::require;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

void test_worked_examples() {
    test::section("worked examples");
    require(near(HoleLayout::border_factor(2), 2.0), "border factor is 2.0 for two characters");
    require(near(HoleLayout::border_factor(0), 1.8), "border factor is 1.8 for an empty name");
    require(near(HoleLayout::border_factor(20), 3.8), "border factor is 3.8 for twenty characters");
    require(near(HoleLayout::hole_offset(2, 15.0, 2.0), 12.55), "\"AB\" at width 15, border 2 -> 12.55");
    require(near(HoleLayout::hole_offset(0, 15.0, 2.0), 3.6), "empty name reduces to border * 1.8");
    require(near(HoleLayout::hole_offset(8, 15.0, 2.0), 8 * 15.0 * 0.57 / 2.0 + 2.0 * 2.6),
            "eight characters");
}

void test_continuity() {
    test::section("continuity");
    bool increasing = true;
    bool bounded_steps = true;
    double previous = HoleLayout::hole_offset(0, 15.0, 2.0);
    // Each extra character adds width * 0.57 / 2 plus border * 0.1
    const double step = 15.0 * 0.57 / 2.0 + 2.0 * 0.1;
    for (std::size_t n = 1; n <= 20; ++n) {
        const double current = HoleLayout::hole_offset(n, 15.0, 2.0);
        increasing = increasing && current > previous;
        bounded_steps = bounded_steps && near(current - previous, step, 1e-9);
        previous = current;
    }
    require(increasing, "offset strictly increases with length");
    require(bounded_steps, "offset grows by a constant step with no size-class jumps");
}

void test_scaling() {
    test::section("parameter scaling");
    require(HoleLayout::hole_offset(5, 20.0, 2.0) > HoleLayout::hole_offset(5, 15.0, 2.0),
            "wider text moves the hole further out");
    require(HoleLayout::hole_offset(5, 15.0, 3.0) > HoleLayout::hole_offset(5, 15.0, 2.0),
            "thicker border moves the hole further out");
}

} // namespace

int main() {
    test_worked_examples();
    test_continuity();
    test_scaling();
    return test::summary("HoleLayoutTest");
}
