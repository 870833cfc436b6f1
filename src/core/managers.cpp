#include "shift_roster/managers.hpp"
#include <algorithm>
#include <cstdio>

namespace shift_roster {

namespace {

const char* const kFirstNames[] = {
    "Amelia", "Benjamin", "Charlotte", "Daniel", "Eleanor", "Felix", "Grace",
    "Harrison", "Isla", "Jack", "Kate", "Liam", "Mia", "Nathan", "Olivia",
    "Patrick", "Ruby", "Samuel", "Tessa", "William",
};

const char* const kLastNames[] = {
    "Anderson", "Brown", "Campbell", "Davies", "Edwards", "Fraser", "Gibson",
    "Harris", "Jenkins", "Kelly", "Lawson", "Mitchell", "Nguyen", "O'Brien",
    "Parker", "Robinson", "Stewart", "Thompson", "Walsh", "Young",
};

constexpr size_t kFirstCount = sizeof(kFirstNames) / sizeof(kFirstNames[0]);
constexpr size_t kLastCount = sizeof(kLastNames) / sizeof(kLastNames[0]);

std::string manager_id(size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "MGR%02zu", index + 1);
    return buf;
}

} // namespace

size_t default_manager_count(size_t worker_count) {
    return std::max<size_t>(20, worker_count / 2);
}

std::vector<Manager> generate_managers(size_t count, uint32_t seed) {
    std::mt19937 rng(seed);

    // 全組み合わせをシャッフルして先頭から使う
    std::vector<std::pair<size_t, size_t>> combos;
    combos.reserve(kFirstCount * kLastCount);
    for (size_t f = 0; f < kFirstCount; ++f) {
        for (size_t l = 0; l < kLastCount; ++l) {
            combos.emplace_back(f, l);
        }
    }
    std::shuffle(combos.begin(), combos.end(), rng);

    std::vector<Manager> managers;
    managers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const auto& combo = combos[i % combos.size()];
        std::string name = std::string(kFirstNames[combo.first]) + " " + kLastNames[combo.second];
        if (i >= combos.size()) {
            // 組み合わせを使い切ったら番号で区別
            name += " " + std::to_string(i / combos.size() + 1);
        }
        managers.push_back(Manager{manager_id(i), name});
    }
    return managers;
}

ManagerRoster::ManagerRoster(const std::vector<Manager>& pool, size_t max_per_store_day)
    : pool_(pool)
    , max_per_store_day_(std::max<size_t>(1, max_per_store_day)) {}

const Manager* ManagerRoster::assign(const std::string& store, const Date& date, std::mt19937& rng) {
    if (pool_.empty()) {
        return nullptr;
    }

    auto& used = used_[std::make_pair(store, date)];

    if (used.size() < max_per_store_day_ && used.size() < pool_.size()) {
        std::vector<size_t> fresh;
        for (size_t i = 0; i < pool_.size(); ++i) {
            if (std::find(used.begin(), used.end(), i) == used.end()) {
                fresh.push_back(i);
            }
        }
        std::uniform_int_distribution<size_t> pick(0, fresh.size() - 1);
        size_t idx = fresh[pick(rng)];
        used.push_back(idx);
        return &pool_[idx];
    }

    // 上限到達: 既存のマネージャーを再利用
    std::uniform_int_distribution<size_t> pick(0, used.size() - 1);
    return &pool_[used[pick(rng)]];
}

size_t ManagerRoster::distinct_count(const std::string& store, const Date& date) const {
    auto it = used_.find(std::make_pair(store, date));
    return it == used_.end() ? 0 : it->second.size();
}

} // namespace shift_roster
