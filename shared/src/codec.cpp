#include "portbridge/codec.hpp"

#include "portbridge/base64.hpp"
#include "portbridge/errors.hpp"

using json = nlohmann::json;

namespace portbridge {

namespace {

const json& require_field(const json& payload, const char* field, const char* marker) {
    auto it = payload.find(field);
    if (it == payload.end()) {
        throw codec_error(std::string(marker) + " payload is missing '" + field + "'");
    }
    return *it;
}

Shape decode_shape(const json& shape) {
    if (!shape.is_array()) {
        throw codec_error("array shape must be a list of non-negative integers");
    }
    Shape out;
    out.reserve(shape.size());
    for (const auto& dim : shape) {
        if (dim.is_number_unsigned()) {
            out.push_back(dim.get<std::size_t>());
        } else if (dim.is_number_integer() && dim.get<std::int64_t>() >= 0) {
            out.push_back(static_cast<std::size_t>(dim.get<std::int64_t>()));
        } else {
            throw codec_error("array shape must be a list of non-negative integers");
        }
    }
    return out;
}

List frame_rows(const DataFrame& frame) {
    const NdArray& values = frame.values();
    const std::size_t rows = frame.rows();
    const std::size_t cols = frame.cols();
    List out;
    out.reserve(rows);
    for (std::size_t r = 0; r < rows; ++r) {
        List row;
        row.reserve(cols);
        for (std::size_t c = 0; c < cols; ++c) {
            row.push_back(element_value(values, r * cols + c));
        }
        out.emplace_back(std::move(row));
    }
    return out;
}

} // namespace

Codec::Codec(Capabilities caps) : caps_(caps) {
    // frames are carried by typed arrays
    if (!caps_.arrays) caps_.frames = false;
}

// ---------------------------------------------------------------------------
// decode: wire -> native
// ---------------------------------------------------------------------------

Value Codec::decode(const json& wire) const {
    switch (wire.type()) {
    case json::value_t::object: {
        if (auto it = wire.find(markers::array); it != wire.end()) {
            if (!caps_.arrays) {
                throw unsupported_type_error("typed arrays (__numpy_array__) are not enabled in this worker");
            }
            return Value(decode_array(*it));
        }
        if (auto it = wire.find(markers::frame); it != wire.end()) {
            if (!caps_.frames) {
                throw unsupported_type_error("data frames (__pandas_df__) are not enabled in this worker");
            }
            return Value(decode_frame(*it));
        }
        if (auto it = wire.find(markers::bytes); it != wire.end()) {
            if (!it->is_string()) {
                throw codec_error("__bytes__ payload must be a base64 string");
            }
            return Value(base64_decode(it->get_ref<const std::string&>()));
        }
        Dict out;
        for (auto it = wire.begin(); it != wire.end(); ++it) {
            out.emplace(it.key(), decode(it.value()));
        }
        return Value(std::move(out));
    }
    case json::value_t::array: {
        List out;
        out.reserve(wire.size());
        for (const auto& item : wire) out.push_back(decode(item));
        return Value(std::move(out));
    }
    case json::value_t::boolean:
        return Value(wire.get<bool>());
    case json::value_t::number_integer:
        return Value(wire.get<std::int64_t>());
    case json::value_t::number_unsigned:
        return Value(wire.get<std::uint64_t>());
    case json::value_t::number_float:
        return Value(wire.get<double>());
    case json::value_t::string:
        return Value(wire.get<std::string>());
    case json::value_t::binary:
        return Value(Bytes(wire.get_binary().begin(), wire.get_binary().end()));
    case json::value_t::null:
    case json::value_t::discarded:
        break;
    }
    return Value();
}

NdArray Codec::decode_array(const json& payload) const {
    if (!payload.is_object()) {
        throw codec_error("__numpy_array__ payload must be a mapping");
    }
    const json& tag = require_field(payload, "dtype", markers::array);
    if (!tag.is_string()) {
        throw codec_error("array dtype must be a string");
    }
    // unknown tags are read as f64 rather than rejected
    const DType dtype = dtype_from_tag(tag.get_ref<const std::string&>()).value_or(DType::F64);

    const Shape shape = decode_shape(require_field(payload, "shape", markers::array));

    const json& data = require_field(payload, "data", markers::array);
    if (!data.is_string()) {
        throw codec_error("array data must be a base64 string");
    }
    return NdArray::from_buffer(dtype, base64_decode(data.get_ref<const std::string&>()), shape);
}

DataFrame Codec::decode_frame(const json& payload) const {
    if (!payload.is_object()) {
        throw codec_error("__pandas_df__ payload must be a mapping");
    }

    const json& data = require_field(payload, "data", markers::frame);
    auto wrapped = data.is_object() ? data.find(markers::array) : data.end();
    NdArray values = decode_array(wrapped != data.end() ? *wrapped : data);

    const json& columns = require_field(payload, "columns", markers::frame);
    if (!columns.is_array()) {
        throw codec_error("frame columns must be a list");
    }
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) {
        names.push_back(c.is_string() ? c.get<std::string>() : c.dump());
    }

    std::optional<List> index;
    auto it = payload.find("index");
    if (it != payload.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw codec_error("frame index must be a list or null");
        }
        if (!it->empty()) {
            List labels;
            labels.reserve(it->size());
            for (const auto& label : *it) labels.push_back(decode(label));
            index = std::move(labels);
        }
    }
    return DataFrame(std::move(values), std::move(names), std::move(index));
}

// ---------------------------------------------------------------------------
// encode: native -> wire
// ---------------------------------------------------------------------------

json Codec::encode(const Value& value) const {
    switch (value.kind()) {
    case Value::Kind::Null:
        return nullptr;
    case Value::Kind::Bool:
        return *value.get_if<bool>();
    case Value::Kind::Int:
        return *value.get_if<std::int64_t>();
    case Value::Kind::UInt:
        return *value.get_if<std::uint64_t>();
    case Value::Kind::Double:
        return *value.get_if<double>();
    case Value::Kind::String:
        return *value.get_if<std::string>();
    case Value::Kind::Bytes:
        return json{{markers::bytes, base64_encode(*value.get_if<Bytes>())}};
    case Value::Kind::List: {
        json out = json::array();
        for (const auto& item : *value.get_if<List>()) out.push_back(encode(item));
        return out;
    }
    case Value::Kind::Dict: {
        json out = json::object();
        for (const auto& [k, item] : *value.get_if<Dict>()) out[k] = encode(item);
        return out;
    }
    case Value::Kind::Array:
        if (caps_.arrays) return json{{markers::array, encode_array(*value.get_if<NdArray>())}};
        return encode_iterable(value);
    case Value::Kind::Frame:
        if (caps_.frames) return json{{markers::frame, encode_frame(*value.get_if<DataFrame>())}};
        return encode_iterable(value);
    case Value::Kind::Series:
        // name and index do not survive the trip
        if (caps_.arrays) return json{{markers::array, encode_array(value.get_if<Series>()->values)}};
        return encode_iterable(value);
    case Value::Kind::Object:
        return encode_iterable(value);
    }
    return nullptr;
}

json Codec::encode_iterable(const Value& value) const {
    switch (value.kind()) {
    case Value::Kind::Array:
        return encode(Value(to_nested_list(*value.get_if<NdArray>())));
    case Value::Kind::Frame:
        return encode(Value(frame_rows(*value.get_if<DataFrame>())));
    case Value::Kind::Series:
        return encode(Value(to_nested_list(value.get_if<Series>()->values)));
    default:
        break;
    }

    const ObjectPtr* obj = value.get_if<ObjectPtr>();
    if (!obj || !*obj) return nullptr;
    const Object& o = **obj;
    if (o.iterable()) {
        try {
            return encode(Value(o.items()));
        } catch (const std::exception&) {
            // not iterable after all, fall through to repr
        }
    }
    try {
        return o.repr();
    } catch (const std::exception& e) {
        return "<" + exception_type_name(e) + " raised in repr>";
    }
}

json Codec::encode_array(const NdArray& array) const {
    return json{
        {"dtype", to_string(array.dtype())},
        {"shape", array.shape()},
        {"data", base64_encode(array.data())},
    };
}

json Codec::encode_frame(const DataFrame& frame) const {
    json index = nullptr;
    if (frame.index()) index = encode(Value(*frame.index()));
    return json{
        {"columns", frame.columns()},
        {"data", encode_array(frame.values())},
        {"index", index},
    };
}

} // namespace portbridge
