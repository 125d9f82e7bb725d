#include "jikanwari_csp/domain.hpp"
#include <algorithm>

namespace jikanwari_csp {

bool Domain::contains(const value_type& value) const {
    return std::find(values_.begin(), values_.end(), value) != values_.end();
}

} // namespace jikanwari_csp
