#include "gtin/utils/json.hpp"

#include "gtin/core/error.hpp"

#include "core/logger.hpp"

#include <string>
#include <system_error>

namespace gtin::utils {

nlohmann::json encode_json(const gtin::model::Gtin& value) { return nlohmann::json(value.to_string()); }

gtin::parse::ParseResult decode_json(const nlohmann::json& j) {
  if (!j.is_string()) {
    gtin::core::library_logger().debug("cannot decode JSON {} as GTIN", j.type_name());
    gtin::parse::ParseResult result;
    result.ec = gtin::core::make_error_code(gtin::core::errc::invalid_length);
    return result;
  }
  return gtin::parse::classify(j.get_ref<const std::string&>());
}

}  // namespace gtin::utils

namespace nlohmann {

void adl_serializer<gtin::model::Gtin>::to_json(json& j, const gtin::model::Gtin& value) {
  j = gtin::utils::encode_json(value);
}

gtin::model::Gtin adl_serializer<gtin::model::Gtin>::from_json(const json& j) {
  auto result = gtin::utils::decode_json(j);
  if (!result.ok()) {
    // system_error::what() 会自动追加 ec.message()，这里只补充位数。
    if (result.ec == gtin::core::errc::invalid_length) {
      throw std::system_error(result.ec, "digit count " + std::to_string(result.digit_count));
    }
    throw std::system_error(result.ec);
  }
  return *result.value;
}

}  // namespace nlohmann
