/**
 * @file domain.hpp
 * @brief 割り当て候補の定義域
 */
#ifndef JIKANWARI_CSP_DOMAIN_HPP
#define JIKANWARI_CSP_DOMAIN_HPP

#include "jikanwari_csp/lecture.hpp"
#include <utility>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief 講義コマの定義域（候補値の順序付き列）
 *
 * 全ての候補値は単項制約（教室種別・担当資格・曜日の都合）を満たしている。
 * 構築後は変更されず、探索は候補の中から選ぶだけである。
 * 並び順は列挙順（時限 → 教室 → 教員）で、値順序のシャッフル前の初期順として使われる。
 */
class Domain {
public:
    using value_type = AssignmentValue;

    /**
     * @brief 空の定義域を作成
     */
    Domain() = default;

    /**
     * @brief 値リストから定義域を作成（順序を保持）
     */
    explicit Domain(std::vector<value_type> values) : values_(std::move(values)) {}

    /**
     * @brief 末尾に候補を追加（構築時のみ）
     */
    void push_back(value_type value) { values_.push_back(std::move(value)); }

    bool empty() const { return values_.empty(); }
    size_t size() const { return values_.size(); }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(const value_type& value) const;

    /**
     * @brief 全候補への参照を取得
     */
    const std::vector<value_type>& values() const { return values_; }

    const value_type& operator[](size_t i) const { return values_[i]; }
    std::vector<value_type>::const_iterator begin() const { return values_.begin(); }
    std::vector<value_type>::const_iterator end() const { return values_.end(); }

private:
    std::vector<value_type> values_;
};

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_DOMAIN_HPP
