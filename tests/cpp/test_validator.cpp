#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "shift_roster/validator.hpp"
#include "roster_fixtures.hpp"
#include <sstream>

using namespace shift_roster;
using namespace fixtures;

namespace {

std::vector<Violation> of_kind(const std::vector<Violation>& all, ViolationKind kind) {
    std::vector<Violation> out;
    for (const auto& v : all) {
        if (v.kind() == kind) out.push_back(v);
    }
    return out;
}

} // namespace

// ============================================================================
// Availability
// ============================================================================

TEST_CASE("AvailabilityRule", "[validator][availability]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime,
                         {{1, {"S"}}, {2, {"/"}}, {3, {"2F"}}, {4, {"1F"}}});
    Problem p = make_problem({w}, {make_store("Store 1", {{"Kitchen", 1}})});
    AvailabilityRule rule;

    SECTION("assignment on an unavailable day is critical") {
        Schedule s;
        s.add(make_assignment(w, kStart.add_days(1), "S", "09:00 - 17:30", 8.5, "Store 1"));
        std::vector<Violation> out;
        rule.check(s, p, out);

        REQUIRE(out.size() == 1);
        REQUIRE(out[0].is_critical());
        REQUIRE(out[0].kind() == ViolationKind::Availability);
        REQUIRE(out[0].worker_id == "W1");
        REQUIRE(out[0].message == "Employee Worker W1 assigned S on 2025-01-07 but is unavailable");
        REQUIRE_FALSE(std::get<AvailabilityDetail>(out[0].detail).requested.has_value());
    }

    SECTION("a different code from the request is a warning") {
        Schedule s;
        s.add(make_assignment(w, kStart, "M", "10:00 - 18:00", 8.0, "Store 1"));
        std::vector<Violation> out;
        rule.check(s, p, out);

        REQUIRE(out.size() == 1);
        REQUIRE(out[0].severity == Severity::Warning);
        REQUIRE(out[0].message == "Employee Worker W1 assigned M on 2025-01-06 but requested S");
        const auto& d = std::get<AvailabilityDetail>(out[0].detail);
        REQUIRE(d.requested == std::optional<std::string>("S"));
        REQUIRE(d.assigned == "M");
    }

    SECTION("flexible codes are interchangeable in both directions") {
        Schedule s;
        s.add(make_assignment(w, kStart.add_days(2), "1F", "06:30 - 15:30", 9.0, "Store 1"));
        s.add(make_assignment(w, kStart.add_days(3), "S", "09:00 - 17:30", 8.5, "Store 1"));
        s.add(make_assignment(w, kStart, "2F", "14:00 - 23:00", 9.0, "Store 1"));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.empty());
    }

    SECTION("a matching code is not a violation") {
        Schedule s;
        s.add(make_assignment(w, kStart, "S", "09:00 - 17:30", 8.5, "Store 1"));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.empty());
    }

    SECTION("dates outside the horizon have no availability") {
        Schedule s;
        s.add(make_assignment(w, kStart.add_days(20), "S", "09:00 - 17:30", 8.5, "Store 1"));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].is_critical());
    }
}

// ============================================================================
// Shift length and rest
// ============================================================================

TEST_CASE("ShiftLengthRule", "[validator][labour]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime, {{1, {"X"}}, {2, {"3F"}}});
    Problem p = make_problem({w}, {});
    ShiftLengthRule rule;

    Schedule s;
    s.add(make_assignment(w, kStart, "X", "10:00 - 12:30", 2.5, ""));
    s.add(make_assignment(w, kStart.add_days(1), "3F", "08:00 - 20:00", 13.0, ""));
    s.add(make_assignment(w, kStart.add_days(2), "S", "09:00 - 17:30", 12.0, ""));

    std::vector<Violation> out;
    rule.check(s, p, out);
    REQUIRE(out.size() == 2);

    const auto& under = std::get<ShiftLengthDetail>(out[0].detail);
    REQUIRE(under.side == LengthBound::Under);
    REQUIRE(under.bound == 3.0);
    REQUIRE(under.observed == 2.5);

    const auto& over = std::get<ShiftLengthDetail>(out[1].detail);
    REQUIRE(over.side == LengthBound::Over);
    REQUIRE(over.bound == 12.0);
    REQUIRE(out[1].message == "Shift length 13 hours exceeds maximum 12 hours");
}

TEST_CASE("RestPeriodRule", "[validator][labour]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime, {{1, {"L"}}, {2, {"E"}}});
    Problem p = make_problem({w}, {});
    RestPeriodRule rule;
    Date day2 = kStart.add_days(1);

    SECTION("short rest between consecutive days") {
        Schedule s;
        s.add(make_assignment(w, day2, "E", "07:12 - 15:00", 7.8, ""));
        s.add(make_assignment(w, kStart, "L", "14:00 - 23:00", 9.0, ""));

        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].is_critical());
        REQUIRE(out[0].date == day2);
        REQUIRE(out[0].shift_code == "E");
        const auto& d = std::get<RestPeriodDetail>(out[0].detail);
        REQUIRE(d.observed == Catch::Approx(8.2));
        REQUIRE(d.required == 10.0);
        REQUIRE(d.previous_date == kStart);
    }

    SECTION("the full minimum applies regardless of iteration") {
        // 9.5 時間は最終反復のエンジンしきい値は満たすが最低休息は満たさない
        Schedule s;
        s.add(make_assignment(w, kStart, "L", "14:00 - 23:00", 9.0, ""));
        s.add(make_assignment(w, day2, "E", "08:30 - 16:00", 7.5, ""));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.size() == 1);
    }

    SECTION("non-consecutive days and unparsable times are skipped") {
        Schedule s;
        s.add(make_assignment(w, kStart, "L", "14:00 - 23:00", 9.0, ""));
        s.add(make_assignment(w, kStart.add_days(2), "E", "07:12 - 15:00", 7.8, ""));
        s.add(make_assignment(w, kStart.add_days(3), "E", "TBD", 7.8, ""));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.empty());
    }
}

// ============================================================================
// Coverage
// ============================================================================

TEST_CASE("ManagerCoverageRule", "[validator][coverage]") {
    auto a = make_worker("A", "Kitchen", EmploymentClass::FullTime, {{1, {"S"}}});
    auto b = make_worker("B", "Kitchen", EmploymentClass::FullTime, {{1, {"S"}}});
    Problem p = make_problem({a, b}, {make_store("Store 1", {{"Kitchen", 1}})});
    ManagerCoverageRule rule;

    SECTION("one tagged member covers the group") {
        Schedule s;
        s.add(make_assignment(a, kStart, "S", "09:00 - 17:30", 8.5, "Store 1", ""));
        s.add(make_assignment(b, kStart, "S", "09:00 - 17:30", 8.5, "Store 1", "MGR01"));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.empty());
    }

    SECTION("untagged group is one critical violation") {
        Schedule s;
        s.add(make_assignment(a, kStart, "S", "09:00 - 17:30", 8.5, "Store 1", ""));
        s.add(make_assignment(b, kStart, "S", "09:00 - 17:30", 8.5, "Store 1", ""));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].is_critical());
        REQUIRE(out[0].worker_id.empty());
        const auto& d = std::get<ManagerCoverageDetail>(out[0].detail);
        REQUIRE(d.shift_time == "09:00 - 17:30");
        REQUIRE(d.group_size == 2);
    }

    SECTION("manager ids outside the declared roster do not count") {
        p.managers = {Manager{"MGR01", "Alex Smith"}};
        Schedule s;
        s.add(make_assignment(a, kStart, "S", "09:00 - 17:30", 8.5, "Store 1", "MGR99"));
        std::vector<Violation> out;
        rule.check(s, p, out);
        REQUIRE(out.size() == 1);
    }
}

TEST_CASE("StoreCoverageRule", "[validator][coverage]") {
    auto k = make_worker("K1", "Kitchen", EmploymentClass::FullTime, {{1, {"S"}}});
    Problem p = make_problem({k}, {
        make_store("Store 1", {{"Kitchen", 1}, {"Counter", 2}, {"Dessert", 0}}),
        make_store("Store 2", {{"Kitchen", 1}}),
    });
    StoreCoverageRule rule;

    Schedule s;
    s.add(make_assignment(k, kStart, "S", "09:00 - 17:30", 8.5, "Store 1"));

    std::vector<Violation> out;
    rule.check(s, p, out);

    // Store 2 は割当のない日なので対象外
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].severity == Severity::Warning);
    REQUIRE(out[0].worker_id.empty());
    const auto& d = std::get<StoreCoverageDetail>(out[0].detail);
    REQUIRE(d.store == "Store 1");
    REQUIRE(d.missing_stations == std::vector<std::string>{"Counter"});
}

// ============================================================================
// Validator
// ============================================================================

TEST_CASE("Validator runs every rule and is pure", "[validator]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime, {{1, {"L"}}, {2, {"E"}}});
    Problem p = make_problem({w}, {make_store("Store 1", {{"Kitchen", 1}, {"Counter", 1}})});

    Schedule s;
    s.add(make_assignment(w, kStart, "L", "14:00 - 23:00", 9.0, "Store 1"));
    s.add(make_assignment(w, kStart.add_days(1), "E", "07:12 - 15:00", 7.8, "Store 1", ""));
    s.add(make_assignment(w, kStart.add_days(2), "X", "10:00 - 12:30", 2.5, "Store 1"));

    Validator validator;
    REQUIRE(validator.rules().size() == 5);

    auto first = validator.validate(s, p);
    auto second = validator.validate(s, p);
    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(key_of(first[i]) == key_of(second[i]));
        REQUIRE(first[i].message == second[i].message);
    }

    REQUIRE(of_kind(first, ViolationKind::Availability).size() == 1);
    REQUIRE(of_kind(first, ViolationKind::ManagerCoverage).size() == 1);
    REQUIRE(of_kind(first, ViolationKind::ShiftLength).size() == 1);
    REQUIRE(of_kind(first, ViolationKind::RestPeriod).size() == 1);
    REQUIRE(of_kind(first, ViolationKind::StoreCoverage).size() == 3);
    REQUIRE(count_critical(first) == 4);

    SECTION("verbose logging reports counts per rule") {
        std::ostringstream log;
        RunContext ctx(log);
        ctx.set_verbose(true);
        auto logged = validator.validate(s, p, ctx);
        REQUIRE(logged.size() == first.size());
        REQUIRE(log.str().find("% [verbose] rule rest_period: 1 violations") != std::string::npos);
    }

    SECTION("printed form") {
        auto rest = of_kind(first, ViolationKind::RestPeriod);
        std::ostringstream os;
        os << rest[0];
        REQUIRE(os.str().rfind("[critical] rest_period 2025-01-07 W1 E: ", 0) == 0);
    }
}

TEST_CASE("Validator without constraint data", "[validator]") {
    auto w = make_worker("W1", "Kitchen", EmploymentClass::FullTime, {{1, {"S"}}});
    Problem p = make_problem({w}, {});
    p.constraints.reset();

    Schedule s;
    s.add(make_assignment(w, kStart, "S", "09:00 - 17:30", 8.5, ""));

    Validator validator;
    REQUIRE_THROWS_AS(validator.validate(s, p), DataUnavailable);
}

TEST_CASE("Empty schedule has no violations", "[validator]") {
    Problem p = make_problem({make_worker("W1", "Kitchen", EmploymentClass::FullTime, {})},
                             {make_store("Store 1", {{"Kitchen", 1}})});
    Validator validator;
    REQUIRE(validator.validate(Schedule(), p).empty());
}
