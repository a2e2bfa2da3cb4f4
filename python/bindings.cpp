// python/bindings.cpp — Pybind11 bindings for the decfix module.

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <decfix/decfix.hpp>

namespace py = pybind11;
namespace core = decfix::core;
using core::detail::int128;

// 128-bit values cross the boundary as decimal text; Python ints have no fixed width.
template <typename Int>
static py::int_ to_python_int(Int value) {
    const auto parts = core::detail::split(value);
    std::string text = decfix::io::detail::magnitude_string(parts.magnitude);
    if (parts.negative) {
        text.insert(text.begin(), '-');
    }
    const auto builtins = py::module_::import("builtins");
    return builtins.attr("int")(text);
}

template <typename Int>
static Int from_python_int(const py::int_& value) {
    const std::string text = py::str(value);
    Int result{};
    switch (decfix::io::detail::parse_decimal_integer(text, result)) {
    case decfix::io::detail::parse_status::ok:
        return result;
    case decfix::io::detail::parse_status::out_of_range:
        throw std::overflow_error("integer does not fit the target width");
    case decfix::io::detail::parse_status::invalid:
        break;
    }
    throw py::value_error("integer could not be read as decimal text");
}

static py::object optional_int(const std::optional<int128>& value) {
    if (!value) {
        return py::none();
    }
    return to_python_int(*value);
}

namespace {

template <typename Fixed>
Fixed require(const std::optional<Fixed>& value, const char* operation) {
    if (!value) {
        throw std::overflow_error(std::string(operation) + " overflowed the fixed-point range");
    }
    return *value;
}

template <typename Fixed>
Fixed divide_or_raise(const Fixed& lhs, const Fixed& rhs) {
    if (rhs.is_zero()) {
        PyErr_SetString(PyExc_ZeroDivisionError, "fixed-point division by zero");
        throw py::error_already_set();
    }
    return require(lhs.checked_div(rhs), "division");
}

template <typename Ratio>
void bind_per_thing(py::module_& module, const char* name) {
    using parts_type = typename Ratio::parts_type;
    py::class_<Ratio> cls(module, name, "A ratio in [0, 1] stored as parts of a fixed accuracy");
    cls.def(py::init<>())
        .def_static("zero", &Ratio::zero)
        .def_static("one", &Ratio::one)
        .def_static(
            "from_parts",
            [](const py::int_& parts) { return Ratio::from_parts(from_python_int<parts_type>(parts)); },
            py::arg("parts"), "Build a ratio from parts, clamping to the accuracy")
        .def_property_readonly_static("ACCURACY",
                                      [](const py::object&) { return to_python_int(Ratio::ACCURACY); })
        .def("deconstruct", [](const Ratio& self) { return to_python_int(self.deconstruct()); })
        .def("is_zero", &Ratio::is_zero)
        .def("is_one", &Ratio::is_one)
        .def(
            "mul_int",
            [](const Ratio& self, const py::int_& value) {
                return to_python_int(self.mul_int(from_python_int<int128>(value)));
            },
            py::arg("value"), "Scale an integer, rounding the remainder to the nearest part")
        .def("__eq__", [](const Ratio& a, const Ratio& b) { return a == b; })
        .def("__lt__", [](const Ratio& a, const Ratio& b) { return a < b; })
        .def("__le__", [](const Ratio& a, const Ratio& b) { return a <= b; })
        .def("__hash__", [](const Ratio& self) { return static_cast<std::size_t>(self.deconstruct()); })
        .def("__repr__", [name](const Ratio& self) {
            return std::string(name) + "(" + std::string(py::str(to_python_int(self.deconstruct()))) + "/" +
                   std::string(py::str(to_python_int(Ratio::ACCURACY))) + ")";
        });
}

template <typename Fixed>
void bind_fixed(py::module_& module, const char* name) {
    using inner_type = typename Fixed::inner_type;
    py::class_<Fixed> cls(module, name, "A signed decimal fixed-point value stored as inner / DIV");
    cls.def(py::init<>())
        .def(py::init([](const py::int_& whole) { return Fixed(from_python_int<int128>(whole)); }),
             py::arg("whole"), "Whole units, saturating at the bounds")
        .def(py::init([](const core::perbill& ratio) { return Fixed(ratio); }), py::arg("ratio"))
        .def(py::init([](const core::perquintill& ratio) { return Fixed(ratio); }), py::arg("ratio"))
        .def_property_readonly_static("DIV", [](const py::object&) { return to_python_int(Fixed::DIV); })
        .def_property_readonly_static("PRECISION", [](const py::object&) { return Fixed::PRECISION; })
        .def_static(
            "from_inner",
            [](const py::int_& inner) { return Fixed::from_inner(from_python_int<inner_type>(inner)); },
            py::arg("inner"))
        .def("into_inner", [](const Fixed& self) { return to_python_int(self.into_inner()); })
        .def_static(
            "from_integer",
            [](const py::int_& value) {
                return Fixed::from_integer(core::detail::saturating_cast<inner_type>(from_python_int<int128>(value)));
            },
            py::arg("value"), "Whole units, saturating at the bounds")
        .def_static(
            "checked_from_integer",
            [](const py::int_& value) -> std::optional<Fixed> {
                const auto narrowed = core::detail::checked_cast<inner_type>(from_python_int<int128>(value));
                if (!narrowed) {
                    return std::nullopt;
                }
                return Fixed::checked_from_integer(*narrowed);
            },
            py::arg("value"))
        .def_static(
            "checked_from_rational",
            [](const py::int_& numerator, const py::int_& denominator) -> std::optional<Fixed> {
                const auto narrowed = core::detail::checked_cast<inner_type>(from_python_int<int128>(denominator));
                if (!narrowed) {
                    return std::nullopt;
                }
                return Fixed::checked_from_rational(from_python_int<int128>(numerator), *narrowed);
            },
            py::arg("numerator"), py::arg("denominator"))
        .def_static("zero", &Fixed::zero)
        .def_static("one", &Fixed::one)
        .def_static("min_value", &Fixed::min_value)
        .def_static("max_value", &Fixed::max_value)
        .def("is_zero", &Fixed::is_zero)
        .def("is_positive", &Fixed::is_positive)
        .def("is_negative", &Fixed::is_negative)
        .def("signum", &Fixed::signum)
        .def("checked_add", &Fixed::checked_add, py::arg("rhs"))
        .def("checked_sub", &Fixed::checked_sub, py::arg("rhs"))
        .def("checked_mul", &Fixed::checked_mul, py::arg("rhs"))
        .def("checked_div", &Fixed::checked_div, py::arg("rhs"))
        .def("saturating_add", &Fixed::saturating_add, py::arg("rhs"))
        .def("saturating_sub", &Fixed::saturating_sub, py::arg("rhs"))
        .def("saturating_mul", &Fixed::saturating_mul, py::arg("rhs"))
        .def("saturating_abs", &Fixed::saturating_abs)
        .def("saturating_pow", &Fixed::saturating_pow, py::arg("exponent"))
        .def(
            "checked_mul_int",
            [](const Fixed& self, const py::int_& other) {
                return optional_int(self.checked_mul_int(from_python_int<int128>(other)));
            },
            py::arg("other"))
        .def(
            "checked_div_int",
            [](const Fixed& self, const py::int_& other) {
                return optional_int(self.checked_div_int(from_python_int<int128>(other)));
            },
            py::arg("other"))
        .def(
            "saturating_mul_int",
            [](const Fixed& self, const py::int_& other) {
                return to_python_int(self.saturating_mul_int(from_python_int<int128>(other)));
            },
            py::arg("other"), "Saturates at the signed 128-bit bounds")
        .def(
            "saturated_multiply_accumulate",
            [](const Fixed& self, const py::int_& value) {
                return to_python_int(self.saturated_multiply_accumulate(from_python_int<int128>(value)));
            },
            py::arg("value"), "value + self * value, saturating at the signed 128-bit bounds")
        .def("to_bytes",
             [](const Fixed& self) {
                 const auto bytes = self.to_bytes();
                 return py::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
             })
        .def_static("from_bytes",
                    [](const py::bytes& data) {
                        const std::string raw = data;
                        std::array<std::uint8_t, sizeof(inner_type)> bytes{};
                        if (raw.size() != bytes.size()) {
                            throw py::value_error("from_bytes expects exactly " + std::to_string(bytes.size()) +
                                                  " little-endian bytes");
                        }
                        std::memcpy(bytes.data(), raw.data(), bytes.size());
                        return Fixed::from_bytes(bytes);
                    })
        .def_static(
            "from_inner_string",
            [](const std::string& text) {
                try {
                    return decfix::io::from_inner_string<Fixed>(text);
                } catch (const std::out_of_range& error) {
                    throw std::overflow_error(error.what());
                }
            },
            py::arg("text"))
        .def("to_inner_string", [](const Fixed& self) { return decfix::io::to_inner_string(self); })
        .def("__str__", [](const Fixed& self) { return decfix::io::to_string(self); })
        .def("__repr__",
             [name](const Fixed& self) { return std::string(name) + "(" + decfix::io::to_string(self) + ")"; })
        .def("__add__", [](const Fixed& a, const Fixed& b) { return require(a.checked_add(b), "addition"); })
        .def("__sub__", [](const Fixed& a, const Fixed& b) { return require(a.checked_sub(b), "subtraction"); })
        .def("__mul__", [](const Fixed& a, const Fixed& b) { return require(a.checked_mul(b), "multiplication"); })
        .def("__truediv__", [](const Fixed& a, const Fixed& b) { return divide_or_raise(a, b); })
        .def("__neg__", [](const Fixed& a) { return require(Fixed::zero().checked_sub(a), "negation"); })
        .def("__abs__", [](const Fixed& a) { return a.saturating_abs(); })
        .def("__eq__", [](const Fixed& a, const Fixed& b) { return a == b; })
        .def("__ne__", [](const Fixed& a, const Fixed& b) { return a != b; })
        .def("__lt__", [](const Fixed& a, const Fixed& b) { return a < b; })
        .def("__le__", [](const Fixed& a, const Fixed& b) { return a <= b; })
        .def("__gt__", [](const Fixed& a, const Fixed& b) { return a > b; })
        .def("__ge__", [](const Fixed& a, const Fixed& b) { return a >= b; })
        .def("__hash__", [](const Fixed& self) { return core::canonical_hash(self); });
}

} // namespace

PYBIND11_MODULE(decfix, module) {
    module.doc() = "Pybind11 bindings for the decfix decimal fixed-point kernel";
    module.attr("VERSION") = py::make_tuple(decfix::DECFIX_VERSION_MAJOR, decfix::DECFIX_VERSION_MINOR,
                                            decfix::DECFIX_VERSION_PATCH);

    bind_per_thing<core::perbill>(module, "Perbill");
    bind_per_thing<core::perquintill>(module, "Perquintill");
    bind_fixed<core::fixed_i64>(module, "FixedI64");
    bind_fixed<core::fixed_i128>(module, "FixedI128");
}
