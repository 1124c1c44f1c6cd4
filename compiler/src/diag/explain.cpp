//! # Error Explanations
//!
//! The explanation database plus the "did you mean?" matching used when a
//! code is not found.

#include "diag/explain.hpp"

#include <algorithm>
#include <cctype>

namespace tyfix::diag {

const std::unordered_map<std::string, std::string>& get_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"E0004", R"EX(
Match must be exhaustive [E0004]

A `match` expression does not cover every possible value of the scrutinee.

Example:

    enum Direction { North, South }

    match dir {
        Direction::North => {}
    }   // `Direction::South` not covered

How to fix:

1. Add arms for the missing patterns
2. Or add a wildcard arm `_ => {}` at the end
)EX"},

        {"E0054", R"EX(
Cast to bool [E0054]

Integers cannot be cast to `bool` with `as`.

Example:

    let x = 5;
    let b = x as bool;   // error

How to fix:

Compare with zero instead:

    let b = x != 0;
)EX"},

        {"E0057", R"EX(
Wrong number of closure arguments [E0057]

A closure was called with a different number of arguments than it declares.

Example:

    let f = |x| x * 2;
    f();        // expected 1 argument
    f(1, 2);    // expected 1 argument

How to fix:

Pass exactly the arguments the closure takes.
)EX"},

        {"E0060", R"EX(
Too few arguments for a variadic function [E0060]

A variadic foreign function was called with fewer than its fixed parameters.

Example:

    extern "C" { fn printf(fmt: *const u8, ...) -> i32; }

    unsafe { printf(); }   // at least 1 parameter required

How to fix:

Supply every fixed parameter; the variadic tail may be empty.
)EX"},

        {"E0061", R"EX(
Wrong number of function arguments [E0061]

A function was called with a different number of arguments than it declares.

Example:

    fn add(a: i32, b: i32) -> i32 { a + b }

    add(1);   // this function takes 2 parameters but 1 parameter was supplied

How to fix:

Pass exactly the arguments in the function signature.
)EX"},

        {"E0069", R"EX(
Missing return value [E0069]

`return;` was used in a function whose return type is not `()`.

Example:

    fn answer() -> u8 {
        return;   // a `u8` is expected
    }

How to fix:

1. Return a value: `return 42;`
2. Or change the return type to `()` if no value is meant
)EX"},

        {"E0133", R"EX(
Unsafe operation outside an unsafe block [E0133]

Calling an `unsafe fn`, dereferencing a raw pointer or accessing a mutable
static requires an `unsafe` block or function.

Example:

    unsafe fn danger() {}

    danger();   // call to unsafe function

How to fix:

1. Wrap the operation: `unsafe { danger(); }`
2. Or mark the enclosing function `unsafe`
)EX"},

        {"E0308", R"EX(
Mismatched types [E0308]

An expression has a different type than the context requires, and no
implicit coercion bridges the two.

Example:

    let n: u64 = 5i32;             // expected `u64`, found `i32`
    let s: String = "hello";       // expected `String`, found `&str`
    let r: &mut i32 = &x;          // expected `&mut i32`, found `&i32`

How to fix:

1. Numeric types: add a cast (`5i32 as u64`)
2. Use a conversion trait: `From`, `TryFrom`, `FromStr`, `ToOwned`,
   `ToString`, `Borrow`, `AsRef`
3. Add or remove references and dereferences (`&*x`, `&mut x`)
4. Change the declared type of the binding or the function's return type
)EX"},

        {"E0451", R"EX(
Private field in struct literal [E0451]

A struct literal names a field that is not visible from this module.

Example:

    mod shapes {
        pub struct Point { pub x: i32, y: i32 }
    }

    let p = shapes::Point { x: 0, y: 0 };   // field `y` is private

How to fix:

1. Make the field `pub`
2. Or construct the value through a public constructor function
)EX"},

        {"E0594", R"EX(
Assignment to an immutable place [E0594]

A value was assigned through a binding or reference that is not mutable.

Example:

    let x = 1;
    x = 2;   // cannot assign twice to immutable variable

    let r = &v;
    *r = 3;  // cannot assign through a `&` reference

How to fix:

1. Declare the binding `let mut x`
2. Borrow mutably: `&mut v`
)EX"},

        {"E0603", R"EX(
Private item [E0603]

A path refers to an item that is private to another module.

Example:

    mod config {
        const LIMIT: u32 = 10;
    }

    let n = config::LIMIT;   // constant `LIMIT` is private

How to fix:

Mark the item `pub` (or `pub(crate)`) if it is meant to be used outside.
)EX"},

        {"E0614", R"EX(
Dereference of a non-pointer type [E0614]

The `*` operator was applied to a type that neither is a reference or raw
pointer nor implements `Deref`.

Example:

    let x = 5u32;
    let y = *x;   // type `u32` cannot be dereferenced

How to fix:

Remove the `*`, or dereference a reference to the value instead.
)EX"},

        {"E0616", R"EX(
Private field access [E0616]

A field expression reads a field that is not visible from this module.

Example:

    mod shapes {
        pub struct Point { x: i32 }
        impl Point { pub fn new() -> Point { Point { x: 0 } } }
    }

    let p = shapes::Point::new();
    let x = p.x;   // field `x` of struct `Point` is private

How to fix:

1. Make the field `pub`
2. Or add a public getter method
)EX"},

        {"E0624", R"EX(
Private method [E0624]

A method that is private to its module was called from outside.

Example:

    mod shapes {
        pub struct Point;
        impl Point { fn secret(&self) {} }
    }

    shapes::Point.secret();   // method `secret` is private

How to fix:

Mark the method `pub` if callers outside the module need it.
)EX"},
    };
    return db;
}

auto explanation_for(ErrorCode error) -> const std::string* {
    const auto& db = get_explanations();
    auto it = db.find(code(error));
    return it != db.end() ? &it->second : nullptr;
}

// ============================================================================
// "Did you mean?" matching
// ============================================================================

size_t levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    // Two rows are enough
    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));

            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

std::vector<std::string> find_similar_candidates(const std::string& input,
                                                 const std::vector<std::string>& candidates,
                                                 size_t max_results, size_t max_distance) {
    if (input.empty() || candidates.empty()) {
        return {};
    }

    std::vector<std::pair<std::string, size_t>> scored;
    scored.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist <= max_distance) {
            scored.emplace_back(candidate, dist);
        }
    }

    // Closest first, ties by name so the order is stable
    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second < b.second : a.first < b.first;
    });

    std::vector<std::string> result;
    result.reserve(std::min(max_results, scored.size()));
    for (size_t i = 0; i < max_results && i < scored.size(); ++i) {
        result.push_back(scored[i].first);
    }

    return result;
}

} // namespace tyfix::diag
