#include "json.hpp"
#include "exception.hpp"
#include "yyjson.h"
#include <cmath>
#include <cstdlib>
#include <string>

namespace bondcpp {
    namespace bond_json {

        namespace {
            yyjson_mut_val* real_or_null(yyjson_mut_doc* doc, double d) {
                if (!std::isfinite(d)) {
                    return yyjson_mut_null(doc);
                }
                return yyjson_mut_real(doc, d);
            }
        }

        yyjson_mut_val* to_yyjson_val(const Value& value, yyjson_mut_doc* doc);

        std::string to_json_string(const Value& value, bool pretty) {
            yyjson_mut_doc* doc = yyjson_mut_doc_new(nullptr);
            if (!doc) {
                throw bondcpp::exception("Failed to allocate JSON document");
            }
            yyjson_mut_val* root = to_yyjson_val(value, doc);
            yyjson_mut_doc_set_root(doc, root);
            yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
            char* json_str = yyjson_mut_write(doc, flags, nullptr);
            if (!json_str) {
                yyjson_mut_doc_free(doc);
                throw bondcpp::exception("Failed to write JSON document");
            }
            std::string result(json_str);
            free(json_str);
            yyjson_mut_doc_free(doc);
            return result;
        }

        yyjson_mut_val* to_yyjson_val(const Value& value, yyjson_mut_doc* doc) {
            switch (value.type()) {
                case Type::Stop:
                case Type::StopBase:
                case Type::Unavailable:
                    return yyjson_mut_null(doc);
                case Type::Bool:
                    return yyjson_mut_bool(doc, value.as_bool());
                case Type::Int8:
                case Type::Int16:
                case Type::Int32:
                case Type::Int64:
                    return yyjson_mut_sint(doc, value.as_int());
                case Type::Uint8:
                case Type::Uint16:
                case Type::Uint32:
                case Type::Uint64:
                    return yyjson_mut_uint(doc, value.as_uint());
                case Type::Float:
                    return real_or_null(doc, value.as_float());
                case Type::Double:
                    return real_or_null(doc, value.as_double());
                case Type::String:
                case Type::Wstring: {
                    const std::string& str = value.as_string();
                    return yyjson_mut_strncpy(doc, str.data(), str.size());
                }
                case Type::Struct: {
                    yyjson_mut_val* obj = yyjson_mut_obj(doc);
                    for (const Value& field : value.children()) {
                        std::string key = std::to_string(field.id());
                        yyjson_mut_val* key_val = yyjson_mut_strncpy(doc, key.data(), key.size());
                        // put replaces an earlier field with the same id
                        yyjson_mut_obj_put(obj, key_val, to_yyjson_val(field, doc));
                    }
                    return obj;
                }
                case Type::List:
                case Type::Set: {
                    yyjson_mut_val* arr = yyjson_mut_arr(doc);
                    for (const Value& element : value.children()) {
                        yyjson_mut_arr_append(arr, to_yyjson_val(element, doc));
                    }
                    return arr;
                }
                case Type::Map: {
                    yyjson_mut_val* arr = yyjson_mut_arr(doc);
                    for (const auto& [key, item] : value.as_map()) {
                        yyjson_mut_val* entry = yyjson_mut_obj(doc);
                        yyjson_mut_obj_add_val(doc, entry, "key", to_yyjson_val(key, doc));
                        yyjson_mut_obj_add_val(doc, entry, "value", to_yyjson_val(item, doc));
                        yyjson_mut_arr_append(arr, entry);
                    }
                    return arr;
                }
            }
            return yyjson_mut_null(doc);
        }
    }
} // namespace bondcpp
