/**
 * @file sample_instance.hpp
 * @brief 動作確認用の組み込み問題インスタンス
 */
#ifndef JIKANWARI_CSP_SAMPLE_INSTANCE_HPP
#define JIKANWARI_CSP_SAMPLE_INSTANCE_HPP

#include "jikanwari_csp/entities.hpp"
#include <string>
#include <vector>

namespace jikanwari_csp {

/**
 * @brief サンプルの参照データ
 *
 * 日〜木の5曜日 × 4時限（TS0〜TS19、TS(4*day + position)）、
 * 講義室 R101〜R106、実験室 L1〜L4、科目7、教員6、クラス4。
 */
ReferenceData sample_reference_data();

/**
 * @brief サンプルのクラス ID（S1_L1〜S4_L1）
 */
std::vector<std::string> sample_section_ids();

} // namespace jikanwari_csp

#endif // JIKANWARI_CSP_SAMPLE_INSTANCE_HPP
