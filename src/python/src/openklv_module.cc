#include "openklv/ber_decode.h"
#include "openklv/build_info.h"
#include "openklv/int128.h"
#include "openklv/klv.h"
#include "openklv/universal_set.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace openklv {
namespace {

    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static std::span<const std::byte> bytes_view(const nb::bytes& data)
    {
        return std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                              data.c_str()),
                                          data.size());
    }


    // Python ints are arbitrary precision; go through the decimal form.
    static nb::object u128_to_py(uint128_t v)
    {
        const std::string text = u128_to_string(v);
        PyObject* obj = PyLong_FromString(text.c_str(), nullptr, 10);
        if (!obj) {
            throw nb::python_error();
        }
        return nb::steal(obj);
    }


    [[noreturn]] static void throw_status(const char* what, KlvStatus status)
    {
        std::string msg(what);
        msg.append(": ");
        msg.append(klv_status_name(status));
        throw nb::value_error(msg.c_str());
    }


    static nb::tuple decode_ber_to_python(const nb::bytes& data, bool strict)
    {
        EncodingPolicy policy;
        policy.strict     = strict;
        uint128_t value   = 0;
        uint64_t consumed = 0;
        const KlvStatus st = decode_ber(bytes_view(data), &value, &consumed,
                                        policy);
        if (st != KlvStatus::Ok) {
            throw_status("BER decode failed", st);
        }
        return nb::make_tuple(u128_to_py(value), consumed);
    }


    static nb::tuple decode_ber_oid_to_python(const nb::bytes& data,
                                              bool strict)
    {
        EncodingPolicy policy;
        policy.strict     = strict;
        uint128_t value   = 0;
        uint64_t consumed = 0;
        const KlvStatus st = decode_ber_oid(bytes_view(data), &value,
                                            &consumed, policy);
        if (st != KlvStatus::Ok) {
            throw_status("BER-OID decode failed", st);
        }
        return nb::make_tuple(u128_to_py(value), consumed);
    }


    static nb::list read_universal_sets_to_python(const nb::bytes& data,
                                                  nb::object key_obj,
                                                  bool lenient, bool strict)
    {
        UniversalKey key = kUasDatalinkLocalSetKey;
        if (!key_obj.is_none()) {
            const nb::bytes key_bytes = nb::cast<nb::bytes>(key_obj);
            if (!make_universal_key(bytes_view(key_bytes), &key)) {
                throw nb::value_error("key must be exactly 16 bytes");
            }
        }

        UniversalSetOptions options;
        options.skip_malformed                = lenient;
        options.local_set.klv.encoding.strict = strict;

        ByteCursor cursor(bytes_view(data));
        std::vector<UniversalSet> sets;
        UniversalSetResult r;
        {
            nb::gil_scoped_release gil_release;
            r = read_universal_sets(cursor, key, &sets, options);
        }
        if (r.status != KlvStatus::Ok) {
            throw_status("universal set decode failed", r.status);
        }

        nb::list out;
        for (const UniversalSet& set : sets) {
            nb::dict entries;
            for (const auto& [tag, klv] : set.local_set) {
                std::span<const std::byte> value;
                const KlvStatus st = klv_value_span(cursor, klv, &value);
                if (st != KlvStatus::Ok) {
                    throw_status("value access failed", st);
                }
                entries[u128_to_py(tag)] = nb::bytes(
                    reinterpret_cast<const char*>(value.data()), value.size());
            }
            nb::dict item;
            item["key_offset"] = set.key_offset;
            item["length"]     = set.length;
            item["entries"]    = std::move(entries);
            out.append(std::move(item));
        }
        return out;
    }

}  // namespace
}  // namespace openklv


NB_MODULE(_openklv, m)
{
    using namespace openklv;

    m.doc()               = "OpenKLV KLV metadata decoding bindings (nanobind).";
    m.attr("__version__") = std::string(build_info().version);

    m.def("info_lines", &info_lines,
          "Returns the two-line OpenKLV build info header.");
    m.def("read_ber", &decode_ber_to_python, "data"_a, "strict"_a = true,
          "Decodes a BER length; returns (value, consumed).");
    m.def("read_ber_oid", &decode_ber_oid_to_python, "data"_a,
          "strict"_a = true,
          "Decodes a BER-OID value; returns (value, consumed).");
    m.def("read_universal_sets", &read_universal_sets_to_python, "data"_a,
          "key"_a = nb::none(), "lenient"_a = false, "strict"_a = true,
          "Locates universal keys in data and returns one dict per set with "
          "key_offset, length and a tag -> value bytes mapping.");
}
