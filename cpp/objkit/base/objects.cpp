#include "objkit/base/objects.hpp"

namespace objkit {

ToStringHelper::ToStringHelper(std::string class_name, FormatSettings settings)
    : class_name_(std::move(class_name)), settings_(std::move(settings)) {
  settings_.validate_or_throw();
}

std::string ToStringHelper::format() const {
  std::string out;
  out.reserve(settings_.reserve_hint);
  out += class_name_;
  out += settings_.open_brace;
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (i != 0) out += settings_.field_separator;
    out += fields_[i];
  }
  out += settings_.close_brace;
  return out;
}

std::ostream& operator<<(std::ostream& os, const ToStringHelper& helper) {
  return os << helper.format();
}

std::string_view first_non_null(const char* first, const char* second) {
  if (first != nullptr) return first;
  OBJKIT_ENSURE(second != nullptr, ErrorCode::kInvalidArgument,
                "first_non_null: both arguments are null");
  return second;
}

}  // namespace objkit
