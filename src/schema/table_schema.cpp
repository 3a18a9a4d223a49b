#include "schema/table_schema.hpp"

#include <cmath>
#include <format>
#include <limits>

namespace ingestgate {

namespace {

Result<FieldValue> decode_field(const FieldDef& field, const nlohmann::json& value) {
    auto mismatch = [&field] {
        return Result<FieldValue>::error(ErrorCategory::INVALID_RECORD,
            std::format("field '{}' must be of type {}", field.name,
                        field_type_to_string(field.type)));
    };

    switch (field.type) {
        case FieldType::STRING:
            if (!value.is_string()) return mismatch();
            return Result<FieldValue>::ok(value.get<std::string>());

        case FieldType::INT32: {
            if (!value.is_number_integer()) return mismatch();
            if (value.is_number_unsigned()) {
                const auto u = value.get<uint64_t>();
                if (u > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
                    return Result<FieldValue>::error(ErrorCategory::INVALID_RECORD,
                        std::format("field '{}' is out of int32 range", field.name));
                }
                return Result<FieldValue>::ok(static_cast<int32_t>(u));
            }
            const auto v = value.get<int64_t>();
            if (v < std::numeric_limits<int32_t>::min() ||
                v > std::numeric_limits<int32_t>::max()) {
                return Result<FieldValue>::error(ErrorCategory::INVALID_RECORD,
                    std::format("field '{}' is out of int32 range", field.name));
            }
            return Result<FieldValue>::ok(static_cast<int32_t>(v));
        }

        case FieldType::INT64:
            if (!value.is_number_integer()) return mismatch();
            if (value.is_number_unsigned() &&
                value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Result<FieldValue>::error(ErrorCategory::INVALID_RECORD,
                    std::format("field '{}' is out of int64 range", field.name));
            }
            return Result<FieldValue>::ok(value.get<int64_t>());

        case FieldType::FLOAT: {
            if (!value.is_number()) return mismatch();
            const double d = value.get<double>();
            if (!std::isfinite(d) || std::fabs(d) > std::numeric_limits<float>::max()) {
                return Result<FieldValue>::error(ErrorCategory::INVALID_RECORD,
                    std::format("field '{}' is out of range for float", field.name));
            }
            return Result<FieldValue>::ok(static_cast<float>(d));
        }

        case FieldType::DOUBLE:
            if (!value.is_number()) return mismatch();
            return Result<FieldValue>::ok(value.get<double>());

        case FieldType::BOOL:
            if (!value.is_boolean()) return mismatch();
            return Result<FieldValue>::ok(value.get<bool>());
    }
    return mismatch();
}

} // anonymous namespace

// ============================================================================
// Record
// ============================================================================

nlohmann::json Record::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, value] : fields) {
        std::visit([&out, &name](const auto& v) { out[name] = v; }, value);
    }
    return out;
}

const FieldValue* Record::find(std::string_view name) const {
    for (const auto& [field_name, value] : fields) {
        if (field_name == name) {
            return &value;
        }
    }
    return nullptr;
}

// ============================================================================
// TableSchema
// ============================================================================

TableSchema::TableSchema(std::string table_key,
                         std::string table_name,
                         std::string message_name,
                         std::vector<FieldDef> fields)
    : table_key_(std::move(table_key)),
      table_name_(std::move(table_name)),
      message_name_(std::move(message_name)),
      fields_(std::move(fields)) {}

Result<Record> TableSchema::decode(const nlohmann::json& body) const {
    if (!body.is_object()) {
        return Result<Record>::error(ErrorCategory::INVALID_RECORD,
            "request body must be a JSON object");
    }

    Record record;
    record.fields.reserve(fields_.size());

    for (const auto& field : fields_) {
        const auto it = body.find(field.name);
        if (it == body.end() || it->is_null()) {
            return Result<Record>::error(ErrorCategory::INVALID_RECORD,
                std::format("field '{}' is required", field.name));
        }

        auto value = decode_field(field, *it);
        if (value.is_error()) {
            return Result<Record>::error(value.error_category(), value.error_message());
        }
        record.fields.emplace_back(field.name, std::move(value.value()));
    }

    return Result<Record>::ok(std::move(record));
}

} // namespace ingestgate
