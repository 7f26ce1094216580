#include "contract.hpp"
#include "deviation.hpp"
#include <iostream>

using namespace cnevo;

int test_measure_deviation() {
    Box base{{"v", {0.0, 10.0}}, {"w", {0.0, 1.0}}};

    DeltaMeasure rel0, str0;
    measure_deviation(base, Box{{"v", {0.0, 12.0}}, {"w", {0.0, 1.0}}}, rel0, str0);

    DeltaMeasure rel1, str1;
    measure_deviation(base, Box{{"v", {2.0, 10.0}}, {"w", {0.0, 1.0}}}, rel1, str1);

    DeltaMeasure rel2, str2;
    measure_deviation(base, Box{{"v", {-1.0, 8.0}}}, rel2, str2);

    DeltaMeasure rel3, str3;
    measure_deviation(base, base, rel3, str3);

    bool result = true
        && rel0.count == 1 && rel0.magnitude == 2.0 && str0.is_zero()
        && str1.count == 1 && str1.magnitude == 2.0 && rel1.is_zero()
        && rel2.count == 1 && rel2.magnitude == 1.0
        && str2.count == 1 && str2.magnitude == 2.0
        && rel3.is_zero() && str3.is_zero();

    std::cout << "test_measure_deviation " << result << std::endl;
    return result;
}

int test_deviation_record() {
    Contract baseline{
        Region{Box{{"v", {0.0, 10.0}}}},
        Region{Box{{"v", {0.0, 10.0}}}}};
    ComponentState state("Producer", baseline);

    DeviationRecord r0 = deviation_record(state, 0);

    state.evolve(baseline.assumption, Region{Box{{"v", {0.0, 12.0}}}});
    DeviationRecord r1 = deviation_record(state, 1);

    state.evolve(Region{Box{{"v", {0.0, 10.0}}}, Box{{"v", {0.0, 15.0}}}},
            Region{Box{{"v", {0.0, 12.0}}}});
    DeviationRecord r2 = deviation_record(state, 2);

    bool result = true
        && r0.is_zero()
        && r0.total_magnitude() == 0.0
        && r1.g_rel.count == 1
        && r1.g_rel.magnitude == 2.0
        && r1.g_str.is_zero() && r1.a_rel.is_zero() && r1.a_str.is_zero()
        && r1.total_magnitude() == 2.0
        && r1.iteration == 1
        && r1.component == "Producer"
        && r2.a_rel.count == 1
        && r2.a_rel.magnitude == 5.0
        && r2.num_assumption_boxes == 2
        && r2.num_guarantee_boxes == 1
        && state.num_evolutions() == 2
        && state.baseline() == baseline;

    std::cout << "test_deviation_record " << result << std::endl;
    return result;
}

int test_component_state_infeasible() {
    Contract baseline{Region{Box()}, Region{Box{{"v", {0.0, 1.0}}}}};
    ComponentState state("C", baseline);
    state.declare_infeasible();

    bool result = state.is_infeasible();
    try {
        state.evolve(Region{Box()}, Region{Box()});
        result = false;
    } catch (const std::runtime_error&) {}

    std::cout << "test_component_state_infeasible " << result << std::endl;
    return result;
}

int main_deviation() {
    int result = 1
        && test_measure_deviation()
        && test_deviation_record()
        && test_component_state_infeasible()
        ;
    return !result;
}
