#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <simdjson.h>

#include "wirelink/core/codec/codec.hpp"
#include "wirelink/core/config/defaults.hpp"
#include "lcr/log/logger.hpp"


namespace wirelink::core::codec {

namespace {

using config::MAX_JSON_DEPTH;
using OrderedValue = nlohmann::ordered_json;

// -----------------------------------------------------------------------------
// CBOR nesting guard
//
// nlohmann's CBOR reader recurses once per nested array or map. This SAX pass
// builds nothing; it only counts depth and stops the reader before the stack
// is at risk.
// -----------------------------------------------------------------------------
class CborDepthGuard {
public:
    using number_integer_t = Value::number_integer_t;
    using number_unsigned_t = Value::number_unsigned_t;
    using number_float_t = Value::number_float_t;
    using string_t = Value::string_t;
    using binary_t = Value::binary_t;

    bool null() { return true; }
    bool boolean(bool) { return true; }
    bool number_integer(number_integer_t) { return true; }
    bool number_unsigned(number_unsigned_t) { return true; }
    bool number_float(number_float_t, const string_t&) { return true; }
    bool string(string_t&) { return true; }
    bool binary(binary_t&) { return true; }
    bool key(string_t&) { return true; }

    bool start_object(std::size_t) { return enter_(); }
    bool end_object() { --depth_; return true; }
    bool start_array(std::size_t) { return enter_(); }
    bool end_array() { --depth_; return true; }

    bool parse_error(std::size_t, const std::string&, const nlohmann::json::exception& e) {
        error_ = e.what();
        return false;
    }

    [[nodiscard]]
    const std::string& error() const noexcept { return error_; }

private:
    bool enter_() {
        if (++depth_ > MAX_JSON_DEPTH) {
            error_ = "CBOR nesting exceeds " + std::to_string(MAX_JSON_DEPTH) + " levels";
            return false;
        }
        return true;
    }

    std::size_t depth_{0};
    std::string error_;
};

// Rebuilds `v` with map members in RFC 8949 deterministic order: keys sorted
// by their encoded form, i.e. shorter keys first, then bytewise.
[[nodiscard]]
OrderedValue to_canonical_order(const Value& v) {
    switch (v.type()) {
        case Value::value_t::object: {
            const auto& members = v.get_ref<const Value::object_t&>();
            std::vector<const Value::object_t::value_type*> sorted;
            sorted.reserve(members.size());
            for (const auto& member : members) {
                sorted.push_back(&member);
            }
            std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) {
                if (a->first.size() != b->first.size()) {
                    return a->first.size() < b->first.size();
                }
                return a->first < b->first;
            });
            OrderedValue out = OrderedValue::object();
            for (const auto* member : sorted) {
                out[member->first] = to_canonical_order(member->second);
            }
            return out;
        }
        case Value::value_t::array: {
            OrderedValue out = OrderedValue::array();
            for (const auto& item : v) {
                out.push_back(to_canonical_order(item));
            }
            return out;
        }
        case Value::value_t::binary: {
            const auto& bin = v.get_binary();
            return bin.has_subtype() ? OrderedValue::binary(bin, bin.subtype()) : OrderedValue::binary(bin);
        }
        case Value::value_t::string:
            return OrderedValue(v.get_ref<const Value::string_t&>());
        case Value::value_t::boolean:
            return OrderedValue(v.get<bool>());
        case Value::value_t::number_integer:
            return OrderedValue(v.get<Value::number_integer_t>());
        case Value::value_t::number_unsigned:
            return OrderedValue(v.get<Value::number_unsigned_t>());
        case Value::value_t::number_float:
            return OrderedValue(v.get<Value::number_float_t>());
        default:
            return OrderedValue(nullptr);
    }
}

[[nodiscard]]
bool contains_non_finite(const Value& v) noexcept {
    switch (v.type()) {
        case Value::value_t::number_float:
            return !std::isfinite(v.get_ref<const Value::number_float_t&>());
        case Value::value_t::array:
        case Value::value_t::object:
            for (const auto& child : v) {
                if (contains_non_finite(child)) {
                    return true;
                }
            }
            return false;
        default:
            return false;
    }
}

// Materializes a simdjson DOM element into the codec value model.
[[nodiscard]]
simdjson::error_code to_value(simdjson::dom::element el, Value& out) {
    switch (el.type()) {
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array arr;
            if (auto err = el.get(arr)) {
                return err;
            }
            out = Value::array();
            for (simdjson::dom::element child : arr) {
                Value item;
                if (auto err = to_value(child, item)) {
                    return err;
                }
                out.push_back(std::move(item));
            }
            return simdjson::SUCCESS;
        }
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object obj;
            if (auto err = el.get(obj)) {
                return err;
            }
            out = Value::object();
            for (simdjson::dom::key_value_pair field : obj) {
                Value item;
                if (auto err = to_value(field.value, item)) {
                    return err;
                }
                out[std::string(field.key)] = std::move(item);
            }
            return simdjson::SUCCESS;
        }
        case simdjson::dom::element_type::INT64: {
            std::int64_t v{};
            if (auto err = el.get(v)) {
                return err;
            }
            out = v;
            return simdjson::SUCCESS;
        }
        case simdjson::dom::element_type::UINT64: {
            std::uint64_t v{};
            if (auto err = el.get(v)) {
                return err;
            }
            out = v;
            return simdjson::SUCCESS;
        }
        case simdjson::dom::element_type::DOUBLE: {
            double v{};
            if (auto err = el.get(v)) {
                return err;
            }
            out = v;
            return simdjson::SUCCESS;
        }
        case simdjson::dom::element_type::STRING: {
            std::string_view v;
            if (auto err = el.get(v)) {
                return err;
            }
            out = std::string(v);
            return simdjson::SUCCESS;
        }
        case simdjson::dom::element_type::BOOL: {
            bool v{};
            if (auto err = el.get(v)) {
                return err;
            }
            out = v;
            return simdjson::SUCCESS;
        }
        case simdjson::dom::element_type::NULL_VALUE:
            out = nullptr;
            return simdjson::SUCCESS;
    }
    return simdjson::INCORRECT_TYPE;
}

[[nodiscard]]
Error encode_json(const Value& value, Bytes& out) {
    if (contains_non_finite(value)) {
        return Error::encode_failure("non-finite number has no JSON representation");
    }
    std::string text;
    try {
        // Strict UTF-8: invalid sequences in strings are rejected, never replaced
        text = value.dump(-1, ' ', false, Value::error_handler_t::strict);
    } catch (const nlohmann::json::exception& e) {
        return Error::encode_failure(e.what());
    }
    out.assign(text.begin(), text.end());
    return Error::none();
}

[[nodiscard]]
Error encode_cbor(const Value& value, Bytes& out) {
    try {
        out = OrderedValue::to_cbor(to_canonical_order(value));
    } catch (const nlohmann::json::exception& e) {
        return Error::encode_failure(e.what());
    }
    return Error::none();
}

[[nodiscard]]
Error decode_json(std::span<const std::uint8_t> in, Value& out) {
    // simdjson needs SIMDJSON_PADDING readable bytes past the end of input
    simdjson::padded_string text(reinterpret_cast<const char*>(in.data()), in.size());
    simdjson::dom::parser parser;
    if (auto err = parser.allocate(text.size() + 1, MAX_JSON_DEPTH)) {
        return Error::decode_failure(simdjson::error_message(err));
    }
    simdjson::dom::element root;
    if (auto err = parser.parse(text).get(root)) {
        return Error::decode_failure(simdjson::error_message(err));
    }
    Value tree;
    if (auto err = to_value(root, tree)) {
        return Error::decode_failure(simdjson::error_message(err));
    }
    out = std::move(tree);
    return Error::none();
}

[[nodiscard]]
Error decode_cbor(std::span<const std::uint8_t> in, Value& out) {
    if (in.empty()) {
        return Error::decode_failure("empty CBOR input");
    }
    try {
        CborDepthGuard guard;
        if (!Value::sax_parse(in.begin(), in.end(), &guard, nlohmann::json::input_format_t::cbor, true)) {
            return Error::decode_failure(guard.error().empty() ? "malformed CBOR" : guard.error());
        }
        // strict = true: trailing bytes after the first data item are an error
        out = Value::from_cbor(in.begin(), in.end(), true, true);
    } catch (const nlohmann::json::exception& e) {
        return Error::decode_failure(e.what());
    }
    return Error::none();
}

} // namespace


Error encode(const Value& value, Format format, Bytes& out) {
    Error err;
    switch (format) {
        case Format::Json: err = encode_json(value, out); break;
        case Format::Cbor: err = encode_cbor(value, out); break;
        default:
            err = Error::encode_failure("unsupported format");
            break;
    }
    if (!err.ok()) {
        WL_DEBUG("[CODEC] " << format << " encode failed: " << err.message);
    }
    return err;
}

Error decode(std::span<const std::uint8_t> in, Format format, Value& out) {
    Error err;
    switch (format) {
        case Format::Json: err = decode_json(in, out); break;
        case Format::Cbor: err = decode_cbor(in, out); break;
        default:
            err = Error::decode_failure("unsupported format");
            break;
    }
    if (!err.ok()) {
        WL_DEBUG("[CODEC] " << format << " decode of " << in.size() << " bytes failed: " << err.message);
    }
    return err;
}

} // namespace wirelink::core::codec
