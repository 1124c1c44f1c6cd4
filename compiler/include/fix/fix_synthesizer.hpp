//! # Fix Synthesizer
//!
//! Orchestrates one mismatch: conversion candidates for expressions, then
//! the signature fixes that depend on where the expression sits, then the
//! explanation text. Nothing is chosen; every candidate is surfaced in order.
//!
//! ## Usage
//!
//! ```cpp
//! fix::FixSynthesizer synth(oracle);
//! auto result = synth.synthesize(expected, actual, expr);
//! for (const auto& c : result.candidates) {
//!     std::cout << fix::describe(c) << "\n";
//! }
//! ```

#ifndef TYFIX_FIX_FIX_SYNTHESIZER_HPP
#define TYFIX_FIX_FIX_SYNTHESIZER_HPP

#include "fix/candidate.hpp"
#include "syntax/expr_handle.hpp"
#include "traits/oracle.hpp"

#include <string>
#include <vector>

namespace tyfix::fix {

struct SynthesisResult {
    std::string explanation;
    std::vector<Candidate> candidates;
};

class FixSynthesizer {
public:
    explicit FixSynthesizer(traits::TraitOracle& oracle);

    [[nodiscard]] auto synthesize(const types::TypePtr& expected, const types::TypePtr& actual,
                                  const syntax::ExprHandle& expr) -> SynthesisResult;

    /// Candidate list only, without the explanation.
    [[nodiscard]] auto candidates(const types::TypePtr& expected, const types::TypePtr& actual,
                                  const syntax::ExprHandle& expr) -> std::vector<Candidate>;

private:
    traits::TraitOracle& oracle_;
};

} // namespace tyfix::fix

#endif // TYFIX_FIX_FIX_SYNTHESIZER_HPP
