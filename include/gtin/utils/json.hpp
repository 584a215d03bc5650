#pragma once

#include "gtin/model/gtin.hpp"
#include "gtin/parse/classifier.hpp"

#include <nlohmann/json.hpp>

namespace gtin::utils {

/**
 * @brief GTIN 与 JSON 之间的交换编码。
 *
 * 说明：
 * - 编码：规范数字串（例如 "071720539774"）；
 * - 解码：与文本解析完全一致（提取数字 + 完整分类/校验流程，默认 ParseOptions），
 *   因此 "0 71720 53977 4" 也能解码；
 * - 非字符串 JSON 视为 0 位数字（invalid_length）。
 */
[[nodiscard]] nlohmann::json encode_json(const gtin::model::Gtin& value);

/**
 * @brief 非抛出版本的解码。
 */
[[nodiscard]] gtin::parse::ParseResult decode_json(const nlohmann::json& j);

}  // namespace gtin::utils

namespace nlohmann {

/**
 * Gtin 没有默认构造，因此通过 adl_serializer 特化接入 nlohmann::json；
 * j.get<Gtin>() 失败时抛出 std::system_error（error_code 为 gtin::core::errc）。
 */
template <>
struct adl_serializer<gtin::model::Gtin> {
  static void to_json(json& j, const gtin::model::Gtin& value);
  static gtin::model::Gtin from_json(const json& j);
};

}  // namespace nlohmann
