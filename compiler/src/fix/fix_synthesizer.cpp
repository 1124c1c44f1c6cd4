//! # Fix Synthesizer Implementation

#include "fix/fix_synthesizer.hpp"

#include "convert/conversion_query.hpp"
#include "diag/reporter.hpp"
#include "log/log.hpp"

namespace tyfix::fix {

FixSynthesizer::FixSynthesizer(traits::TraitOracle& oracle) : oracle_(oracle) {}

auto FixSynthesizer::candidates(const types::TypePtr& expected, const types::TypePtr& actual,
                                const syntax::ExprHandle& expr) -> std::vector<Candidate> {
    std::vector<Candidate> out;

    if (expr.is_expression()) {
        out = convert::ConversionQuery(oracle_).candidates(expected, actual, expr);
    }

    bool writable = !types::contains_unknown_or_anon(actual);

    if (auto site = expr.enclosing_return(); site && writable) {
        bool already = site->declared_type && types::types_equal(site->declared_type, actual);
        if (!already) {
            out.push_back(Candidate::change_return_type(site->function_name, actual));
        }
    }

    if (auto binding = expr.let_binding(); binding && writable) {
        out.push_back(Candidate::change_let_type(*binding, actual));
    }

    TYFIX_LOG_DEBUG("fix", "`" << expr.text() << "`: " << out.size() << " candidate(s)");
    return out;
}

auto FixSynthesizer::synthesize(const types::TypePtr& expected, const types::TypePtr& actual,
                                const syntax::ExprHandle& expr) -> SynthesisResult {
    SynthesisResult result;
    result.candidates = candidates(expected, actual, expr);
    result.explanation = diag::Reporter::expected_found(expected, actual);
    return result;
}

} // namespace tyfix::fix
