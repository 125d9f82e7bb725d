/**
 * @file model_builder.hpp
 * @brief 参照データから変数と定義域を生成する
 */
#ifndef JIKANWARI_CSP_MODEL_BUILDER_HPP
#define JIKANWARI_CSP_MODEL_BUILDER_HPP

#include "jikanwari_csp/entities.hpp"
#include "jikanwari_csp/model.hpp"
#include <string>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief 単位数から週あたりのコマ数を求める
 *
 * 1→1, 2→1, 3→2, 4→2, 5→3, それ以外→2
 */
int lectures_per_week(int credits);

/**
 * @brief 定義域生成器
 *
 * 各クラスの履修科目ごとに週コマ数ぶんの講義コマを作成し、
 * 単項制約を満たす (timeslot, room, instructor) の組を全て列挙する。
 *
 * 科目表にない科目はスキップし、診断メッセージを残す（ビルド全体は失敗しない）。
 * 担当可能な教員や種別の合う教室が無い場合、講義コマは作成するが定義域は空になる。
 */
class ModelBuilder {
public:
    explicit ModelBuilder(const ReferenceData& reference);

    /**
     * @brief 指定クラスのモデルを構築
     * @param section_ids 対象クラス ID（この順で変数を作成）
     */
    Model build(const std::vector<std::string>& section_ids) const;

    /**
     * @brief 1コマ分の定義域を生成
     *
     * 外側ループ: 時限、中ループ: 種別の合う教室、内ループ: 担当可能かつ
     * その曜日に都合のつく教員（いずれも登録順）。
     */
    Domain build_domain(const Course& course) const;

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    void warn(Model& model, std::string message) const;

    const ReferenceData& reference_;
    bool verbose_ = false;
};

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_MODEL_BUILDER_HPP
