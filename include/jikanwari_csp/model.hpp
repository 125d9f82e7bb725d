/**
 * @file model.hpp
 * @brief 時間割CSPモデル（変数と定義域）
 */
#ifndef JIKANWARI_CSP_MODEL_HPP
#define JIKANWARI_CSP_MODEL_HPP

#include "jikanwari_csp/domain.hpp"
#include "jikanwari_csp/lecture.hpp"
#include <map>
#include <string>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief モデルの要約（問題規模の確認用）
 */
struct ModelSummary {
    size_t variable_count = 0;
    size_t min_domain_size = 0;
    size_t max_domain_size = 0;
    double average_domain_size = 0.0;
    std::map<std::string, size_t> lectures_per_section;
};

/**
 * @brief 時間割CSPモデル
 *
 * 講義コマ（変数）と、それぞれの定義域を登録順に保持する。
 * 変数はインデックスでも LectureId でも参照できる。
 * 1回の求解要求ごとに構築され、求解中は読み取り専用である。
 */
class Model {
public:
    Model() = default;

    /**
     * @brief 変数を追加
     * @param id 講義コマの識別子
     * @param domain 定義域
     * @return 変数のインデックス
     * @throws std::invalid_argument 同じ識別子が登録済みの場合
     */
    size_t add_lecture(LectureId id, Domain domain);

    /**
     * @brief 変数の数
     */
    size_t size() const { return lectures_.size(); }
    bool empty() const { return lectures_.empty(); }

    /**
     * @brief 変数リストを取得（登録順）
     */
    const std::vector<LectureId>& lectures() const { return lectures_; }

    /**
     * @brief インデックスで定義域を取得
     */
    const Domain& domain(size_t var_idx) const { return domains_[var_idx]; }

    /**
     * @brief 識別子で定義域を取得（無ければ nullptr）
     */
    const Domain* find_domain(const LectureId& id) const;

    /**
     * @brief 識別子から変数インデックスを検索
     * @return 見つからなければ SIZE_MAX
     */
    size_t index_of(const LectureId& id) const;

    /**
     * @brief 識別子が登録済みか
     */
    bool contains(const LectureId& id) const { return index_.count(id) > 0; }

    /**
     * @brief 構築時の警告を追加
     */
    void add_diagnostic(std::string message) { diagnostics_.push_back(std::move(message)); }

    /**
     * @brief 構築時の警告（科目が見つからない、担当教員がいない等）
     */
    const std::vector<std::string>& diagnostics() const { return diagnostics_; }

    /**
     * @brief 空の定義域を持つ変数のインデックス一覧
     */
    std::vector<size_t> empty_domains() const;

    /**
     * @brief モデルの要約を計算
     */
    ModelSummary summary() const;

private:
    std::vector<LectureId> lectures_;
    std::vector<Domain> domains_;
    std::map<LectureId, size_t> index_;
    std::vector<std::string> diagnostics_;
};

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_MODEL_HPP
