/**
 * @file test_errors.cpp
 * @brief Tests for structured errors, exception categories and warnings
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "connex/errors.hpp"
#include "connex/warnings.hpp"

using namespace connex;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ErrorCode: to_string conversion", "[errors]") {
    CHECK(error_code_to_string(ErrorCode::OK) == "OK");
    CHECK(error_code_to_string(ErrorCode::ZERO_INERTIA) == "ZERO_INERTIA");
    CHECK(error_code_to_string(ErrorCode::EMPTY_TENSION_ROWS) == "EMPTY_TENSION_ROWS");
    CHECK(error_code_to_string(ErrorCode::ICR_OUT_OF_PLANE) == "ICR_OUT_OF_PLANE");
    CHECK(error_code_to_string(ErrorCode::SOLVER_NO_BRACKET) == "SOLVER_NO_BRACKET");
}

TEST_CASE("ErrorCode: categories by range", "[errors]") {
    CHECK(error_category(ErrorCode::OK) == ErrorCategory::None);
    CHECK(error_category(ErrorCode::EMPTY_GROUP) == ErrorCategory::Geometry);
    CHECK(error_category(ErrorCode::DEGENERATE_PLATE) == ErrorCategory::Geometry);
    CHECK(error_category(ErrorCode::INVALID_PROPERTY) == ErrorCategory::Usage);
    CHECK(error_category(ErrorCode::MISSING_PLATE) == ErrorCategory::Usage);
    CHECK(error_category(ErrorCode::SOLVER_CONVERGENCE_FAILED) == ErrorCategory::Convergence);
}

TEST_CASE("ConnexError: default is OK", "[errors]") {
    ConnexError err;
    CHECK(err.is_ok());
    CHECK_FALSE(err.is_error());
    CHECK(err.to_string() == "OK");
}

TEST_CASE("ConnexError: zero_inertia factory carries details", "[errors]") {
    ConnexError err = ConnexError::zero_inertia("Ip", 1000.0);

    CHECK(err.code == ErrorCode::ZERO_INERTIA);
    CHECK(err.details.at("quantity") == "Ip");
    CHECK_FALSE(err.suggestion.empty());

    std::string text = err.to_string();
    CHECK_THAT(text, ContainsSubstring("[ZERO_INERTIA]"));
    CHECK_THAT(text, ContainsSubstring("Suggestion:"));
}

TEST_CASE("AnalysisError: subclasses keep the record", "[errors]") {
    try {
        throw ConvergenceError(ConnexError::not_converged(100, 0.5));
    } catch (const AnalysisError& e) {
        CHECK(e.code() == ErrorCode::SOLVER_CONVERGENCE_FAILED);
        CHECK(e.error().details.at("iterations") == "100");
        CHECK_THAT(std::string(e.what()), ContainsSubstring("SOLVER_CONVERGENCE_FAILED"));
    }

    CHECK_THROWS_AS(throw DegenerateGeometryError(ConnexError::empty_group()),
                    std::runtime_error);
}

TEST_CASE("WarningList: add, contains and summary", "[warnings]") {
    WarningList list;
    CHECK_FALSE(list.has_warnings());
    CHECK(list.summary() == "No warnings");

    list.add(ConnexWarning::single_element_group());
    list.add(ConnexWarning::fastener_outside_plate({2, 3}));
    list.add(ConnexWarning::rows_merged("z", 1e-9));

    CHECK(list.count() == 3);
    CHECK(list.contains(WarningCode::FASTENER_OUTSIDE_PLATE));
    CHECK_FALSE(list.contains(WarningCode::ICR_ELASTIC_FALLBACK));
    CHECK(list.count_by_severity(WarningSeverity::High) == 1);
    CHECK(list.count_by_severity(WarningSeverity::Low) == 1);
    CHECK_THAT(list.summary(), ContainsSubstring("3 warning(s)"));

    WarningList other;
    other.add(ConnexWarning::icr_elastic_fallback("concentric shear"));
    list.merge(other);
    CHECK(list.count() == 4);
    CHECK(list.contains(WarningCode::ICR_ELASTIC_FALLBACK));
}

TEST_CASE("ConnexWarning: formatted string lists elements", "[warnings]") {
    ConnexWarning w = ConnexWarning::fastener_outside_plate({1, 4});
    std::string text = w.to_string();
    CHECK_THAT(text, ContainsSubstring("[HIGH]"));
    CHECK_THAT(text, ContainsSubstring("FASTENER_OUTSIDE_PLATE"));
    CHECK_THAT(text, ContainsSubstring("1, 4"));
}
