#include "steelcheck/interaction.hpp"
#include "steelcheck/errors.hpp"

namespace steelcheck {

namespace {

void check_methods(const VerificationResult& a, const VerificationResult& b) {
    if (a.method != b.method) {
        throw CheckException(CheckError::unsupported("design_method",
            design_method_to_string(a.method) + "/" + design_method_to_string(b.method),
            "interaction requires component checks with the same design method"));
    }
}

InteractionResult combine(const CompressionResult& compression, double Mrx_Mcx, double Mry_Mcy,
                          const DesignConfig& config) {
    InteractionResult result;
    result.check = "interaction";
    result.method = compression.method;
    result.Pr_Pc = compression.ratio;
    result.Mrx_Mcx = Mrx_Mcx;
    result.Mry_Mcy = Mry_Mcy;
    result.equation = select_interaction_equation(result.Pr_Pc);
    result.value = interaction_value(result.equation, result.Pr_Pc, Mrx_Mcx + Mry_Mcy);

    result.demand = result.value;
    result.nominal = 1.0;
    result.capacity = 1.0;
    result.details["Pr/Pc"] = result.Pr_Pc;
    result.details["Mrx/Mcx"] = result.Mrx_Mcx;
    result.details["Mry/Mcy"] = result.Mry_Mcy;
    apply_ratio(result, result.value, config);
    return result;
}

} // namespace

std::string interaction_equation_to_string(InteractionEquation equation) {
    return equation == InteractionEquation::H1_1a ? "H1-1a" : "H1-1b";
}

InteractionEquation select_interaction_equation(double Pr_Pc) {
    return Pr_Pc >= kInteractionAxialThreshold ? InteractionEquation::H1_1a
                                               : InteractionEquation::H1_1b;
}

double interaction_value(InteractionEquation equation, double Pr_Pc, double Mr_Mc) {
    if (equation == InteractionEquation::H1_1a) {
        return Pr_Pc + 8.0 / 9.0 * Mr_Mc;
    }
    return Pr_Pc / 2.0 + Mr_Mc;
}

InteractionResult verify_interaction(const CompressionResult& compression,
                                     const FlexureResult& flexure,
                                     const DesignConfig& config) {
    check_methods(compression, flexure);
    return combine(compression, flexure.ratio, 0.0, config);
}

InteractionResult verify_interaction(const CompressionResult& compression,
                                     const FlexureResult& flexure,
                                     const FlexureResult& minor_flexure,
                                     const DesignConfig& config) {
    check_methods(compression, flexure);
    check_methods(compression, minor_flexure);
    return combine(compression, flexure.ratio, minor_flexure.ratio, config);
}

} // namespace steelcheck
