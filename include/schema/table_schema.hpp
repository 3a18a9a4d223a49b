#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ingestgate {

struct FieldDef {
    std::string name;
    FieldType type = FieldType::STRING;
};

using FieldValue = std::variant<std::string, int32_t, int64_t, float, double, bool>;

/**
 * @brief One validated, typed record ready for submission
 *
 * Fields appear in schema order. The wire encoding is the provider's concern;
 * to_json() is offered for providers that persist JSON.
 */
struct Record {
    std::vector<std::pair<std::string, FieldValue>> fields;

    [[nodiscard]] nlohmann::json to_json() const;

    /// Pointer to a field's value, nullptr if absent.
    [[nodiscard]] const FieldValue* find(std::string_view name) const;
};

/**
 * @brief Per-table schema resolved once at configuration load
 *
 * Doubles as the record codec: decode() validates a request body against the
 * field list and produces a typed Record. Every configured field is required;
 * keys that are not in the schema are ignored.
 */
class TableSchema {
public:
    TableSchema(std::string table_key,
                std::string table_name,
                std::string message_name,
                std::vector<FieldDef> fields);

    [[nodiscard]] Result<Record> decode(const nlohmann::json& body) const;

    const std::string& table_key() const { return table_key_; }
    const std::string& table_name() const { return table_name_; }
    const std::string& message_name() const { return message_name_; }
    const std::vector<FieldDef>& fields() const { return fields_; }

private:
    std::string table_key_;
    std::string table_name_;
    std::string message_name_;
    std::vector<FieldDef> fields_;
};

using TableSchemaPtr = std::shared_ptr<const TableSchema>;

} // namespace ingestgate
