#include "jikanwari_csp/model.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace jikanwari_csp {

size_t Model::add_lecture(LectureId id, Domain domain) {
    if (index_.count(id)) {
        throw std::invalid_argument("Duplicate lecture: " + id.key());
    }
    size_t idx = lectures_.size();
    index_.emplace(id, idx);
    lectures_.push_back(std::move(id));
    domains_.push_back(std::move(domain));
    return idx;
}

const Domain* Model::find_domain(const LectureId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &domains_[it->second];
}

size_t Model::index_of(const LectureId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? SIZE_MAX : it->second;
}

std::vector<size_t> Model::empty_domains() const {
    std::vector<size_t> result;
    for (size_t i = 0; i < domains_.size(); ++i) {
        if (domains_[i].empty()) {
            result.push_back(i);
        }
    }
    return result;
}

ModelSummary Model::summary() const {
    ModelSummary s;
    s.variable_count = lectures_.size();
    if (domains_.empty()) {
        return s;
    }

    size_t total = 0;
    s.min_domain_size = domains_.front().size();
    s.max_domain_size = domains_.front().size();
    for (const auto& d : domains_) {
        total += d.size();
        s.min_domain_size = std::min(s.min_domain_size, d.size());
        s.max_domain_size = std::max(s.max_domain_size, d.size());
    }
    s.average_domain_size = static_cast<double>(total) / static_cast<double>(domains_.size());

    for (const auto& id : lectures_) {
        s.lectures_per_section[id.section_id]++;
    }
    return s;
}

} // namespace jikanwari_csp
