#pragma once

#include <string>
#include <variant>
#include <vector>

namespace searchlink::cluster {

struct Field;

/**
 * Leaf field type as named by the mapping (keyword, long, text, ...)
 */
struct PrimitiveType {
    std::string name;

    bool operator==(const PrimitiveType& other) const { return name == other.name; }
};

/**
 * Date field with its accepted formats, in mapping order.
 * Empty formats means the cluster default date format applies.
 */
struct DateTimeType {
    std::vector<std::string> formats;

    bool operator==(const DateTimeType& other) const { return formats == other.formats; }
};

/**
 * Nested object with ordered sub-fields
 */
struct ObjectType {
    std::vector<Field> fields;

    bool operator==(const ObjectType& other) const;
};

using FieldType = std::variant<PrimitiveType, DateTimeType, ObjectType>;

struct Field {
    std::string name;
    FieldType type;

    bool operator==(const Field& other) const {
        return name == other.name && type == other.type;
    }
};

inline bool ObjectType::operator==(const ObjectType& other) const {
    return fields == other.fields;
}

/**
 * Field schema of one index
 */
struct IndexMetadata {
    ObjectType schema;

    bool operator==(const IndexMetadata& other) const { return schema == other.schema; }
};

/**
 * Split a mapping "format" value on "||". Trailing empty items are dropped
 * once a separator was found: "" gives {""} and "||" gives {}.
 * A field without a "format" key has no formats at all.
 */
std::vector<std::string> splitDateFormats(const std::string& format);

/**
 * Inverse of splitDateFormats for lists without empty items
 */
std::string joinDateFormats(const std::vector<std::string>& formats);

} // namespace searchlink::cluster
