#include "shift_roster/rst/model.hpp"
#include <set>
#include <stdexcept>

namespace shift_roster {
namespace rst {

void Model::add_shift_decl(ShiftDecl decl) {
    shift_decls_.push_back(std::move(decl));
}

void Model::add_store_decl(StoreDecl decl) {
    store_decls_.push_back(std::move(decl));
}

void Model::add_holiday(std::string date) {
    holidays_.push_back(std::move(date));
}

void Model::add_manager_decl(ManagerDecl decl) {
    manager_decls_.push_back(std::move(decl));
}

void Model::add_worker_decl(WorkerDecl decl) {
    worker_decls_.push_back(std::move(decl));
}

LimitsDecl& Model::limits() {
    if (!limits_) {
        limits_ = LimitsDecl();
    }
    return *limits_;
}

namespace {

Date parse_date_or_throw(const std::string& text, const std::string& what) {
    auto date = Date::parse(text);
    if (!date) {
        throw std::runtime_error("Invalid " + what + " date: " + text);
    }
    return *date;
}

void apply_limit(ConstraintParams& params, const std::string& key, double value) {
    if (value < 0) {
        throw std::runtime_error("Negative value for limit: " + key);
    }
    if (key == "min_shift_hours") {
        params.min_shift_hours = value;
    } else if (key == "max_shift_hours") {
        params.max_shift_hours = value;
    } else if (key == "min_rest_hours") {
        params.min_rest_hours = value;
    } else if (key == "daily_hour_cap") {
        params.daily_hour_cap = value;
    } else if (key == "max_managers_per_store_day") {
        if (value < 1) {
            throw std::runtime_error("max_managers_per_store_day must be at least 1");
        }
        params.max_managers_per_store_day = static_cast<size_t>(value);
    } else if (key == "meal_break_threshold_hours") {
        params.meal_break_threshold_hours = value;
    } else if (key == "meal_break_minutes") {
        params.meal_break_minutes = static_cast<int>(value);
    } else if (key == "saturday_rate") {
        params.saturday_rate = value;
    } else if (key == "sunday_rate") {
        params.sunday_rate = value;
    } else if (key == "holiday_rate") {
        params.holiday_rate = value;
    } else {
        throw std::runtime_error("Unknown limit: " + key);
    }
}

ConstraintParams build_limits(const LimitsDecl& decl) {
    ConstraintParams params;
    for (const auto& [key, value] : decl.values) {
        apply_limit(params, key, value);
    }
    for (const auto& [name, cap] : decl.weekly_caps) {
        auto employment = parse_employment_class(name);
        if (!employment) {
            throw std::runtime_error("Unknown employment class in weekly_cap: " + name);
        }
        if (cap < 0) {
            throw std::runtime_error("Negative weekly_cap for " + name);
        }
        params.weekly_hour_caps[*employment] = cap;
    }
    if (decl.flexible) {
        params.flexible_codes = std::set<std::string>(decl.flexible->begin(), decl.flexible->end());
    }
    if (params.min_shift_hours > params.max_shift_hours) {
        throw std::runtime_error("min_shift_hours exceeds max_shift_hours");
    }
    return params;
}

StoreProfile build_store(const StoreDecl& decl) {
    StoreProfile store;
    store.name = decl.name;
    store.traffic = decl.traffic;
    if (decl.traffic < 0) {
        throw std::runtime_error("Negative traffic for store: " + decl.name);
    }
    for (const auto& st : decl.stations) {
        if (st.minimum < 0) {
            throw std::runtime_error("Negative minimum for station " + st.name
                                     + " in store " + decl.name);
        }
        if (!store.station_minimums.emplace(st.name, static_cast<int>(st.minimum)).second) {
            throw std::runtime_error("Duplicate station " + st.name + " in store " + decl.name);
        }
    }
    for (const auto& pk : decl.peaks) {
        auto range = parse_time_range(pk.hours);
        if (!range) {
            throw std::runtime_error("Invalid peak hours in store " + decl.name + ": " + pk.hours);
        }
        PeakWindow window;
        window.hours = *range;
        for (const auto& day : pk.days) {
            auto weekday = parse_weekday(day);
            if (!weekday) {
                throw std::runtime_error("Unknown weekday in store " + decl.name + ": " + day);
            }
            window.weekdays.push_back(*weekday);
        }
        store.peaks.push_back(std::move(window));
    }
    return store;
}

} // namespace

Problem Model::to_problem(std::optional<Date> start_override) const {
    Problem problem;

    if (start_override) {
        problem.start = *start_override;
    } else if (start_) {
        problem.start = parse_date_or_throw(*start_, "start");
    } else {
        problem.start = Date::today();
    }

    for (const auto& decl : shift_decls_) {
        if (decl.time != "TBD" && !parse_time_range(decl.time)) {
            throw std::runtime_error("Invalid time range for shift " + decl.code + ": " + decl.time);
        }
        if (decl.hours < 0) {
            throw std::runtime_error("Negative hours for shift: " + decl.code);
        }
        if (!problem.catalog.add(ShiftDefinition{decl.code, decl.time, decl.hours, decl.name})) {
            throw std::runtime_error("Duplicate shift code: " + decl.code);
        }
    }

    std::set<std::string> known_stations;
    for (const auto& decl : store_decls_) {
        if (problem.find_store(decl.name)) {
            throw std::runtime_error("Duplicate store: " + decl.name);
        }
        problem.stores.push_back(build_store(decl));
        for (const auto& st : decl.stations) {
            known_stations.insert(st.name);
        }
    }

    if (limits_) {
        problem.constraints = build_limits(*limits_);
    }

    for (const auto& text : holidays_) {
        problem.holidays.insert(parse_date_or_throw(text, "holiday"));
    }

    std::set<std::string> manager_ids;
    for (const auto& decl : manager_decls_) {
        if (!manager_ids.insert(decl.id).second) {
            throw std::runtime_error("Duplicate manager id: " + decl.id);
        }
        problem.managers.push_back(Manager{decl.id, decl.name});
    }

    std::set<std::string> worker_ids;
    for (const auto& decl : worker_decls_) {
        if (!worker_ids.insert(decl.id).second) {
            throw std::runtime_error("Duplicate worker id: " + decl.id);
        }
        auto employment = parse_employment_class(decl.employment);
        if (!employment) {
            throw std::runtime_error("Unknown employment class for worker " + decl.id
                                     + ": " + decl.employment);
        }
        if (!known_stations.empty() && known_stations.count(decl.station) == 0) {
            throw std::runtime_error("Worker " + decl.id + " references unknown station: "
                                     + decl.station);
        }
        if (decl.availability.size() > static_cast<size_t>(kHorizonDays)) {
            throw std::runtime_error("Worker " + decl.id + " has "
                                     + std::to_string(decl.availability.size())
                                     + " availability entries (at most "
                                     + std::to_string(kHorizonDays) + ")");
        }

        Worker worker;
        worker.id = decl.id;
        worker.name = decl.name;
        worker.employment = *employment;
        worker.station = decl.station;
        for (size_t i = 0; i < decl.availability.size(); ++i) {
            worker.set_availability(static_cast<int>(i) + 1, decl.availability[i]);
        }
        problem.workers.push_back(std::move(worker));
    }

    return problem;
}

} // namespace rst
} // namespace shift_roster
