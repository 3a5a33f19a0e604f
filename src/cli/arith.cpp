#include "nodus/cli/arith.hpp"

namespace nodus::cli {
    using nodus::core::i64;
    using nodus::core::Instance;
    using nodus::core::List;
    using nodus::core::make_status;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;
    using nodus::core::Value;
    using nodus::node::ArgList;

    namespace {
        struct Number {
            bool is_float{false};
            i64 i{0};
            double f{0.0};

            [[nodiscard]] double as_double() const noexcept { return is_float ? f : static_cast<double>(i); }
            [[nodiscard]] Value to_value() const { return is_float ? Value(f) : Value(i); }
        };

        enum class Op { Add, Mul };

        Status invalid_arg(std::size_t index) noexcept {
            return make_status(StatusDomain::Framework, StatusCode::Invalid, static_cast<nodus::core::u32>(index));
        }

        bool to_number(const Value& v, Number* out) noexcept {
            if (const i64* i = v.get_if<i64>()) {
                *out = Number{false, *i, 0.0};
                return true;
            }
            if (const double* f = v.get_if<double>()) {
                *out = Number{true, 0, *f};
                return true;
            }
            return false;
        }

        bool combine(Op op, const Number& a, const Number& b, Number* out) noexcept {
            if (a.is_float || b.is_float) {
                const double r = op == Op::Add ? a.as_double() + b.as_double() : a.as_double() * b.as_double();
                *out = Number{true, 0, r};
                return true;
            }
            i64 r{};
            const bool overflow = op == Op::Add ? __builtin_add_overflow(a.i, b.i, &r)
                                                : __builtin_mul_overflow(a.i, b.i, &r);
            if (overflow) {
                return false;
            }
            *out = Number{false, r, 0.0};
            return true;
        }

        Status fold(Op op, Number seed, const ArgList& args, Number* out) noexcept {
            Number acc = seed;
            for (std::size_t i = 0; i < args.size(); ++i) {
                Number n;
                if (!to_number(args[i], &n) || !combine(op, acc, n, &acc)) {
                    return invalid_arg(i);
                }
            }
            *out = acc;
            return nodus::core::ok_status();
        }

        // Accumulator state lives in fields[0].
        Status accumulator_total(const Instance& self, Number* out) noexcept {
            if (self.fields.size() != 1 || !to_number(self.fields[0], out)) {
                return make_status(StatusDomain::Framework, StatusCode::Corrupt);
            }
            return nodus::core::ok_status();
        }
    } // namespace

    nodus::node::Framework arith_framework() {
        nodus::node::Framework fw;
        fw.name = "arith";

        fw.attrs.emplace("add", nodus::node::make_function_node([](const ArgList& args, Value* out) -> Status {
            Number r;
            const Status s = fold(Op::Add, Number{}, args, &r);
            if (nodus::core::is_ok(s)) {
                *out = r.to_value();
            }
            return s;
        }));

        fw.attrs.emplace("mul", nodus::node::make_function_node([](const ArgList& args, Value* out) -> Status {
            Number r;
            const Status s = fold(Op::Mul, Number{false, 1, 0.0}, args, &r);
            if (nodus::core::is_ok(s)) {
                *out = r.to_value();
            }
            return s;
        }));

        std::unordered_map<std::string, nodus::node::MethodFn> methods;
        methods.emplace("add", [](Instance& self, const ArgList& args, Value* out) -> Status {
            Number total;
            Status s = accumulator_total(self, &total);
            if (!nodus::core::is_ok(s)) {
                return s;
            }
            s = fold(Op::Add, total, args, &total);
            if (!nodus::core::is_ok(s)) {
                return s;
            }
            self.fields[0] = total.to_value();
            *out = total.to_value();
            return nodus::core::ok_status();
        });
        methods.emplace("total", [](Instance& self, const ArgList& args, Value* out) -> Status {
            if (!args.empty()) {
                return invalid_arg(0);
            }
            Number total;
            const Status s = accumulator_total(self, &total);
            if (nodus::core::is_ok(s)) {
                *out = total.to_value();
            }
            return s;
        });
        methods.emplace("reset", [](Instance& self, const ArgList& args, Value* out) -> Status {
            if (!args.empty()) {
                return invalid_arg(0);
            }
            self.fields.assign(1, Value(i64{0}));
            *out = Value{};
            return nodus::core::ok_status();
        });

        fw.attrs.emplace("Accumulator", nodus::node::make_class_node(
            [](const ArgList& args, List* fields) -> Status {
                if (args.size() > 1) {
                    return invalid_arg(1);
                }
                Number start;
                if (!args.empty() && !to_number(args[0], &start)) {
                    return invalid_arg(0);
                }
                fields->assign(1, start.to_value());
                return nodus::core::ok_status();
            },
            std::move(methods)));

        return fw;
    }
} // namespace nodus::cli
