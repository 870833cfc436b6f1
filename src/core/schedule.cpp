#include "shift_roster/schedule.hpp"
#include <set>

namespace shift_roster {

std::string to_string(AssignmentStatus status) {
    switch (status) {
        case AssignmentStatus::Scheduled: return "Scheduled";
        case AssignmentStatus::Weekend:   return "Weekend";
    }
    return "Scheduled";
}

bool Schedule::add(Assignment assignment) {
    auto key = std::make_pair(assignment.worker_id, assignment.date);
    if (index_.count(key)) {
        return false;
    }
    index_[key] = assignments_.size();
    assignments_.push_back(std::move(assignment));
    return true;
}

const Assignment* Schedule::find(const std::string& worker_id, const Date& date) const {
    auto it = index_.find(std::make_pair(worker_id, date));
    return it == index_.end() ? nullptr : &assignments_[it->second];
}

double Schedule::total_hours() const {
    double total = 0.0;
    for (const auto& a : assignments_) total += a.hours;
    return total;
}

double Schedule::paid_hours() const {
    double total = 0.0;
    for (const auto& a : assignments_) total += a.paid_hours();
    return total;
}

size_t Schedule::distinct_workers() const {
    std::set<std::string> ids;
    for (const auto& a : assignments_) ids.insert(a.worker_id);
    return ids.size();
}

void Schedule::write_table(std::ostream& out) const {
    out << "Date\tDay\tEmployee Name\tEmployee ID\tHours\tShift Code\tShift Time\t"
        << "Employment Type\tStatus\tStation\tStore\tManager\n";
    for (const auto& a : assignments_) {
        out << a.date.to_string() << '\t'
            << a.weekday << '\t'
            << a.worker_name << '\t'
            << a.worker_id << '\t'
            << format_hours(a.hours) << '\t'
            << a.shift_code << '\t'
            << a.shift_time << '\t'
            << to_string(a.employment) << '\t'
            << to_string(a.status) << '\t'
            << a.station << '\t'
            << a.store << '\t'
            << a.manager_name << '\n';
    }
}

} // namespace shift_roster
