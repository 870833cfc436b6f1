#include "shift_roster/engine.hpp"
#include <algorithm>
#include <vector>

namespace shift_roster {

namespace {

// 反復ごとの休息しきい値の引き下げ幅（時間）
const double kRestRelaxation[] = {3.0, 2.0, 1.5, 1.0, 0.5, 0.0};
constexpr int kRestRelaxationSteps = sizeof(kRestRelaxation) / sizeof(kRestRelaxation[0]);

constexpr double kPeakBonus = 0.1;
constexpr double kStoreJitter = 0.05;
constexpr double kStoreFloorShare = 0.6;

} // namespace

double rest_threshold(int iteration, double statutory_minimum) {
    int step = std::clamp(iteration, 0, kRestRelaxationSteps - 1);
    return std::max(0.0, statutory_minimum - kRestRelaxation[step]);
}

uint32_t seed_for_iteration(uint32_t base_seed, int iteration) {
    return base_seed + static_cast<uint32_t>(iteration);
}

AssignmentEngine::AssignmentEngine(const Problem& problem, RunContext& context)
    : problem_(problem)
    , limits_(problem.limits())
    , context_(context) {}

Schedule AssignmentEngine::generate(const IterationMemory& memory, int iteration) {
    iteration_ = iteration;
    rng_.seed(seed_for_iteration(base_seed_, iteration));
    staffing_ = StaffingLedger();
    daily_hours_.clear();
    weekly_hours_.clear();
    stats_ = EngineStats();

    ManagerRoster roster(problem_.managers, limits_.max_managers_per_store_day);

    std::vector<const Worker*> order;
    order.reserve(problem_.workers.size());
    for (const auto& w : problem_.workers) {
        order.push_back(&w);
    }
    std::shuffle(order.begin(), order.end(), rng_);

    double threshold = rest_threshold(iteration_, limits_.min_rest_hours);
    if (context_.verbose()) {
        context_.log() << "% [verbose] generate iteration=" << iteration_
                       << " rest_threshold=" << format_hours(threshold)
                       << " memory=" << memory.size() << "\n";
    }

    Schedule schedule;

    for (int day = 1; day <= kHorizonDays; ++day) {
        const Date date = problem_.date_of(day);

        // 1-2. 不足ステーションの従業員を前へ
        auto deficits = staffing_.deficits(problem_.stores, date);
        auto ordered = prioritize_workers(order, deficits);

        for (const Worker* worker : ordered) {
            // 3. 勤務不可日は割当なし（違反ではない）
            auto requested = worker->requested_code(day);
            if (!requested) {
                continue;
            }
            ++stats_.candidates;

            // 4. 記憶による上書き
            if (memory.is_blacklisted(worker->id, date)) {
                skip(*worker, date, *requested, SkipReason::Blacklisted);
                continue;
            }
            auto code = choose_code(*worker, day, date, memory);
            if (!code) {
                continue;
            }

            // 5-6. 勤務時間
            double hours = resolve_hours(*worker, date, *code, memory);

            // 7. 日・週の上限
            auto day_key = std::make_pair(worker->id, date);
            auto week_key = std::make_pair(worker->id, date.week_start());
            if (daily_hours_[day_key] + hours > limits_.daily_hour_cap) {
                skip(*worker, date, *code, SkipReason::DailyCap);
                continue;
            }
            if (weekly_hours_[week_key] + hours > limits_.weekly_cap(worker->employment)) {
                skip(*worker, date, *code, SkipReason::WeeklyCap);
                continue;
            }

            // 8. 休息
            const std::string shift_time = problem_.catalog.time_of(*code);
            if (iteration_ >= kRestMemoryIteration && memory.is_rest_flagged(worker->id, date)) {
                skip(*worker, date, *code, SkipReason::RestFlagged);
                continue;
            }
            if (const Assignment* prev = schedule.find(worker->id, date.add_days(-1))) {
                auto rest = rest_hours_between(prev->date, prev->shift_time, date, shift_time);
                if (rest && *rest < threshold) {
                    skip(*worker, date, *code, SkipReason::RestPeriod);
                    continue;
                }
            }

            // 9-10. 店舗とステーション
            const StoreProfile* store = choose_store(*worker, parse_time_range(shift_time), date);
            if (store && !station_has_room(*store, date, worker->station)) {
                skip(*worker, date, *code, SkipReason::StationCapacity);
                continue;
            }
            const std::string store_name = store ? store->name : std::string();

            // 11. マネージャー
            const Manager* manager = roster.assign(store_name, date, rng_);

            // 12. 記録
            Assignment a;
            a.date = date;
            a.weekday = date.weekday_name();
            a.worker_id = worker->id;
            a.worker_name = worker->name;
            a.employment = worker->employment;
            a.shift_code = *code;
            a.shift_time = shift_time;
            a.hours = hours;
            a.store = store_name;
            a.station = worker->station;
            if (manager) {
                a.manager_id = manager->id;
                a.manager_name = manager->name;
            }
            a.status = date.is_weekend() ? AssignmentStatus::Weekend : AssignmentStatus::Scheduled;
            a.meal_break_minutes = hours >= limits_.meal_break_threshold_hours
                                 ? limits_.meal_break_minutes : 0;
            a.pay_multiplier = pay_multiplier(date);

            if (!schedule.add(std::move(a))) {
                continue;
            }
            staffing_.add(store_name, date, worker->station);
            daily_hours_[day_key] += hours;
            weekly_hours_[week_key] += hours;
            ++stats_.assigned;
        }
    }

    if (context_.verbose()) {
        context_.log() << "% [verbose] generated " << stats_.assigned << " assignments"
                       << " (" << stats_.skipped << " skipped, "
                       << stats_.substitutions << " substituted, "
                       << stats_.clamped << " clamped)\n";
    }
    return schedule;
}

std::optional<std::string> AssignmentEngine::choose_code(const Worker& worker, int day,
                                                         const Date& date,
                                                         const IterationMemory& memory) {
    const std::string requested = *worker.requested_code(day);
    auto preferred = memory.preferred_code(worker.id, date);

    if (memory.is_problematic(worker.id, date, requested)) {
        if (preferred && *preferred != requested && worker.offers(day, *preferred)) {
            ++stats_.substitutions;
            return preferred;
        }
        if (iteration_ >= kEscalationIteration) {
            skip(worker, date, requested, SkipReason::ProblematicShift);
            return std::nullopt;
        }
        return requested;
    }

    if (preferred && *preferred != requested && worker.offers(day, *preferred)) {
        ++stats_.substitutions;
        return preferred;
    }
    return requested;
}

double AssignmentEngine::resolve_hours(const Worker& worker, const Date& date,
                                       const std::string& code, const IterationMemory& memory) {
    double raw = problem_.catalog.resolve_hours(code, limits_.min_shift_hours);
    double hours = std::clamp(raw, limits_.min_shift_hours, limits_.max_shift_hours);

    // 記録された違反側に外れている場合だけ境界値に合わせる
    if (auto issue = memory.length_issue(worker.id, date)) {
        bool under = issue->side == LengthBound::Under && raw < limits_.min_shift_hours;
        bool over = issue->side == LengthBound::Over && raw > limits_.max_shift_hours;
        if (under || over) {
            hours = std::clamp(issue->bound, limits_.min_shift_hours, limits_.max_shift_hours);
        }
    }
    if (hours != raw) {
        ++stats_.clamped;
    }
    return hours;
}

const StoreProfile* AssignmentEngine::choose_store(const Worker& worker,
                                                   const std::optional<TimeRange>& shift,
                                                   const Date& date) {
    const auto& stores = problem_.stores;
    if (stores.empty()) {
        return nullptr;
    }

    std::vector<const StoreProfile*> candidates;
    for (const auto& s : stores) {
        if (s.requires_station(worker.station)) {
            candidates.push_back(&s);
        }
    }
    // 1店舗だけが持つステーションは必ずその店舗へ
    if (candidates.size() == 1) {
        return candidates.front();
    }
    if (candidates.empty()) {
        for (const auto& s : stores) {
            candidates.push_back(&s);
        }
        if (candidates.size() == 1) {
            return candidates.front();
        }
    }

    double total_traffic = 0.0;
    for (const auto* s : candidates) {
        total_traffic += std::max(0.0, s->traffic);
    }

    const double n = static_cast<double>(candidates.size());
    std::uniform_real_distribution<double> jitter(-kStoreJitter, kStoreJitter);
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto* s : candidates) {
        double w = total_traffic > 0.0 ? std::max(0.0, s->traffic) / total_traffic : 1.0 / n;
        if (shift && s->is_peak(*shift, date.weekday())) {
            w += kPeakBonus;
        }
        w += jitter(rng_);
        weights.push_back(std::max(w, kStoreFloorShare / n));
    }

    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return candidates[pick(rng_)];
}

bool AssignmentEngine::station_has_room(const StoreProfile& store, const Date& date,
                                        const std::string& station) const {
    int required = store.minimum(station);
    int ceiling = required > 0 ? required * kStationCeilingFactor : kOptionalStationCeiling;
    if (staffing_.count(store.name, date, station) < ceiling) {
        return true;
    }

    // 上限到達時は、半分も埋まっていない別ステーションがある場合だけ断る
    for (const auto& [sibling, sibling_required] : store.station_minimums) {
        if (sibling == station || sibling_required <= 0) {
            continue;
        }
        if (staffing_.count(store.name, date, sibling) < sibling_required * 0.5) {
            return false;
        }
    }
    return true;
}

double AssignmentEngine::pay_multiplier(const Date& date) const {
    if (problem_.is_holiday(date)) return limits_.holiday_rate;
    switch (date.weekday()) {
        case 5: return limits_.saturday_rate;
        case 6: return limits_.sunday_rate;
        default: return 1.0;
    }
}

void AssignmentEngine::skip(const Worker& worker, const Date& date, const std::string& code,
                            SkipReason reason) {
    ++stats_.skipped;
    context_.record_skip(SkipRecord{iteration_, worker.id, date, code, reason});
}

} // namespace shift_roster
