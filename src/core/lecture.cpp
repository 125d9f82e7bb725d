#include "jikanwari_csp/lecture.hpp"

namespace jikanwari_csp {

std::string LectureId::key() const {
    return section_id + "_" + course_id + "_L" + std::to_string(lecture_number);
}

size_t LectureIdHash::operator()(const LectureId& id) const {
    std::hash<std::string> hs;
    size_t h = hs(id.section_id);
    h ^= hs(id.course_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<int>()(id.lecture_number) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

} // namespace jikanwari_csp
