#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "shift_roster/reporter.hpp"
#include "roster_fixtures.hpp"
#include <sstream>

using namespace shift_roster;
using namespace fixtures;

// ============================================================================
// Availability coverage
// ============================================================================

TEST_CASE("Report for a complete roster is approved", "[reporter]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime, {{1, {"S"}}});
    Problem p = make_problem({w}, {make_store("Store 1", {{"Kitchen", 1}})});

    Schedule s;
    s.add(make_assignment(w, kStart, "S", "09:00 - 17:30", 8.5, "Store 1"));

    RunContext ctx;
    CoverageReporter reporter(p, ctx);
    auto report = reporter.build(s);

    REQUIRE(report.approved());
    REQUIRE(report.total_slots == 1);
    REQUIRE(report.filled == 1);
    REQUIRE(report.coverage_percent == 100.0);
    REQUIRE(report.summary == "Roster is complete and meets all requirements.");
    REQUIRE(report.recommendations == std::vector<std::string>{"Roster is optimal. No changes needed."});
    REQUIRE(report.staffing_checks.size() == 1);
    REQUIRE(report.met_count() == 1);
}

TEST_CASE("Report classifies unfilled and mismatched slots", "[reporter]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime,
                         {{1, {"S"}}, {2, {"S"}}, {3, {"2F"}}, {4, {"S"}}, {5, {"/"}}});
    Problem p = make_problem({w}, {make_store("Store 1", {{"Kitchen", 1}})});

    Schedule s;
    s.add(make_assignment(w, kStart, "S", "09:00 - 17:30", 8.5, "Store 1"));
    s.add(make_assignment(w, kStart.add_days(1), "M", "10:00 - 18:00", 8.0, "Store 1"));
    s.add(make_assignment(w, kStart.add_days(2), "1F", "06:30 - 15:30", 9.0, "Store 1"));

    RunContext ctx;
    CoverageReporter reporter(p, ctx);
    auto report = reporter.build(s);

    // 勤務不可日は枠に含めない
    REQUIRE(report.total_slots == 4);
    REQUIRE(report.filled == 2);
    REQUIRE(report.mismatched == 1);
    REQUIRE(report.unfilled == 1);
    REQUIRE(report.coverage_percent == Catch::Approx(50.0));
    REQUIRE(reporter.coverage_percent(s) == Catch::Approx(50.0));

    REQUIRE(report.availability_checks[1].status == SlotStatus::Mismatch);
    REQUIRE(report.availability_checks[1].assigned_shift == "M");
    REQUIRE(report.availability_checks[2].status == SlotStatus::Filled);
    REQUIRE(report.availability_checks[3].status == SlotStatus::Unfilled);
    REQUIRE(report.availability_checks[3].assigned_shift.empty());

    REQUIRE_FALSE(report.approved());
    REQUIRE(report.summary == "Roster is mostly complete but has minor issues that need review.");
    REQUIRE(report.recommendations.size() == 2);
    REQUIRE(report.recommendations[0]
            == "Fill 1 unfilled availability slots to maximize employee utilization.");
    REQUIRE(report.recommendations[1]
            == "Review 1 shift assignments that don't match employee availability preferences.");
}

TEST_CASE("Coverage percent is rounded to two decimals", "[reporter]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime,
                         {{1, {"S"}}, {2, {"S"}}, {3, {"S"}}});
    Problem p = make_problem({w}, {});

    Schedule s;
    s.add(make_assignment(w, kStart, "S", "09:00 - 17:30", 8.5, ""));

    RunContext ctx;
    CoverageReporter reporter(p, ctx);
    REQUIRE(reporter.coverage_percent(s) == Catch::Approx(33.33));

    SECTION("no availability at all gives zero") {
        Problem none = make_problem({make_worker("W2", "Kitchen", EmploymentClass::Casual, {})}, {});
        CoverageReporter empty(none, ctx);
        REQUIRE(empty.coverage_percent(Schedule()) == 0.0);
    }
}

// ============================================================================
// Staffing
// ============================================================================

TEST_CASE("Staffing checks cover every declared station", "[reporter]") {
    auto w = make_worker("K1", "Kitchen", EmploymentClass::FullTime, {{1, {"S"}}});
    Problem p = make_problem({w}, {
        make_store("Store 1", {{"Kitchen", 2}, {"Counter", 1}, {"Dessert", 0}}),
        make_store("Store 2", {{"Kitchen", 1}}),
    });

    Schedule s;
    s.add(make_assignment(w, kStart, "S", "09:00 - 17:30", 8.5, "Store 1"));

    RunContext ctx;
    CoverageReporter reporter(p, ctx);
    auto checks = reporter.check_staffing(s);

    // Store 2 はこの日に割当がないので対象外
    REQUIRE(checks.size() == 3);

    REQUIRE(checks[0].station == "Counter");
    REQUIRE(checks[0].status == StaffingStatus::Understaffed);
    REQUIRE(checks[0].details == "Required: 1, Assigned: 0 (Shortage: 1)");

    REQUIRE(checks[1].station == "Dessert");
    REQUIRE(checks[1].status == StaffingStatus::Met);
    REQUIRE(checks[1].details == "Required: 0, Assigned: 0");

    REQUIRE(checks[2].station == "Kitchen");
    REQUIRE(checks[2].assigned == 1);
    REQUIRE(checks[2].required == 2);
    REQUIRE(checks[2].status == StaffingStatus::Understaffed);

    auto report = reporter.build(s);
    REQUIRE(report.understaffed_count() == 2);
    REQUIRE(report.recommendations.back()
            == "Address 2 understaffed stations to meet operational requirements.");
}

TEST_CASE("Many unfilled slots are significant gaps", "[reporter]") {
    std::vector<Worker> workers;
    for (int i = 0; i < 7; ++i) {
        workers.push_back(make_worker("W" + std::to_string(i), "Kitchen",
                                      EmploymentClass::Casual, {{1, {"S"}}}));
    }
    Problem p = make_problem(workers, {make_store("Store 1", {{"Kitchen", 1}})});

    RunContext ctx;
    CoverageReporter reporter(p, ctx);
    auto report = reporter.build(Schedule());

    REQUIRE(report.unfilled == 7);
    REQUIRE(report.staffing_checks.empty());
    REQUIRE(report.summary == "Roster has significant gaps that need attention.");
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("Rendered report", "[reporter]") {
    auto w = make_worker("K1", "Kitchen", EmploymentClass::FullTime, {{1, {"S"}}, {2, {"S"}}});
    Problem p = make_problem({w}, {make_store("Store 1", {{"Kitchen", 1}, {"Counter", 1}})});

    Schedule s;
    s.add(make_assignment(w, kStart, "S", "09:00 - 17:30", 8.5, "Store 1"));

    RunContext ctx;
    CoverageReporter reporter(p, ctx);
    std::ostringstream out;
    reporter.render(reporter.build(s), out);
    const std::string text = out.str();

    REQUIRE(text.find("ROSTER STATUS: NEEDS_REVIEW") != std::string::npos);
    REQUIRE(text.find("Coverage: 50%") != std::string::npos);
    REQUIRE(text.find("Worker K1 (K1) on 2025-01-07: Available for S, but not assigned")
            != std::string::npos);
    REQUIRE(text.find("Store 1 - 2025-01-06:") != std::string::npos);
    REQUIRE(text.find("  Counter: 0/1 (understaffed)") != std::string::npos);
    REQUIRE(text.find("1. Fill 1 unfilled availability slots") != std::string::npos);
    REQUIRE(text.find("END OF REPORT") != std::string::npos);
}
