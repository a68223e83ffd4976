#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <ast/builders.hpp>
#include <ast/declaration.hpp>
#include <ast/type.hpp>
#include <backend/concrete.hpp>
#include <backend/symbolic.hpp>
#include <builtin/builtin.hpp>
#include <eval/error.hpp>
#include <eval/evaluator.hpp>
#include <eval/value_ops.hpp>
#include <fmt/format.h>
#include <gc.hpp>

namespace
{

auto show_error(std::string_view error_kind, std::string_view error_message)
{
    std::cerr << "Whoops! We ran into some " << error_kind << " error: \n  " << error_message << '\n';
}

enum class engine : std::uint8_t
{
    concrete,
    symbolic,
};

struct command_line_args
{
    bool help {};
    bool debug {};
    engine mode {};
};

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-s] [-d] [-h]\n\n", program);
    fmt::print("  -s  evaluate with the symbolic backend\n");
    fmt::print("  -d  trace declaration binding and comprehensions\n");
    fmt::print("  -h  show this help\n");
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg.size() != 2 || arg[0] != '-') {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        switch (arg[1]) {
            case 's':
                opts.mode = engine::symbolic;
                break;
            case 'h':
                opts.help = true;
                break;
            case 'd':
                opts.debug = true;
                break;
            default: {
                show_usage(program, fmt::format("invalid option {}", arg));
            }
        }
    }
    return opts;
}

struct showcase
{
    module_def mod;
    std::vector<std::pair<std::string, const expression*>> targets;
};

auto make_showcase() -> showcase
{
    const auto* integer = t_integer();
    const auto* int_fun = mono(t_fun(integer, integer));
    const auto* n = var("n");
    const auto is_zero = [integer, n]() { return binop("==", integer, n, int_lit(0)); };
    const auto pred = [integer, n]() { return binop("-", integer, n, int_lit(1)); };

    const auto* fact = make_decl("fact",
                                 int_fun,
                                 lam("n",
                                     integer,
                                     cond(integer,
                                          is_zero(),
                                          int_lit(1),
                                          binop("*", integer, n, app(var("fact"), {pred()})))));
    const auto* bool_fun = mono(t_fun(integer, t_bit()));
    const auto* even
        = make_decl("even", bool_fun, lam("n", integer, cond(t_bit(), is_zero(), bit_lit(true), app(var("odd"), {pred()}))));
    const auto* odd = make_decl(
        "odd", bool_fun, lam("n", integer, cond(t_bit(), is_zero(), bit_lit(false), app(var("even"), {pred()}))));

    const auto* point_type = t_record({{"x", integer}, {"y", integer}});
    auto* point = make<newtype>();
    point->name = "Point";
    point->fields = {{"x", integer}, {"y", integer}};
    const auto* origin = make_decl(
        "origin", mono(point_type), app(var("Point"), {record({{"x", int_lit(0)}, {"y", int_lit(0)}})}));

    showcase result;
    result.mod.name = "Showcase";
    result.mod.newtypes = {point};
    result.mod.decls = prelude_decls();
    result.mod.decls.push_back(recursive({fact}));
    result.mod.decls.push_back(recursive({even, odd}));
    result.mod.decls.push_back(non_recursive(origin));

    const auto* x = var("x");
    const auto* y = var("y");
    result.targets = {
        {"fact 10", app(var("fact"), {int_lit(10)})},
        {"even 7", app(var("even"), {int_lit(7)})},
        {"[(x, y) | x <- [1, 2, 3], y <- [10, 20]]",
         comprehension(t_num(6),
                       t_tuple({integer, integer}),
                       tuple({x, y}),
                       {{from("x", t_num(3), integer, list({int_lit(1), int_lit(2), int_lit(3)}, integer)),
                         from("y", t_num(2), integer, list({int_lit(10), int_lit(20)}, integer))}})},
        {"[x * x | x <- [1 ...]]",
         comprehension(t_inf(),
                       integer,
                       binop("*", integer, x, x),
                       {{from("x", t_inf(), integer, app(tapp(var("infFrom"), {integer}), {int_lit(1)}))}})},
        {"{ origin | y = 5 }", update(point_type, var("origin"), selector::record_sel("y"), int_lit(5))},
        {"[True, False, True, True]",
         list({bit_lit(true), bit_lit(false), bit_lit(true), bit_lit(true)}, t_bit())},
        {"if flag then 1 else 2", cond(integer, var("flag"), int_lit(1), int_lit(2))},
        {"error \"boom\"", app(tapp(var("error"), {integer, t_num(4)}), {str_lit("boom")})},
    };
    return result;
}

template<backend Sym>
auto run_showcase(const Sym& sym, const command_line_args& opts) -> int
{
    auto eval = evaluator<Sym> {sym, prelude_primitives(sym), eval_options {.debug = opts.debug}};
    const auto show = make_showcase();
    const auto* env = eval.module_env(show.mod);

    if constexpr (std::is_same_v<Sym, symbolic>) {
        env = env->bind_var_direct("flag", ready_value(sym, make_bit<Sym>(sym.fresh_bit("flag"))));
    } else {
        env = env->bind_var_direct("flag", ready_value(sym, make_bit<Sym>(sym.bit_lit(true))));
    }

    fmt::print("Evaluating module {} with the {} backend\n", show.mod.name, Sym::name);
    for (const auto& [text, expr] : show.targets) {
        try {
            fmt::print("{} = {}\n", text, inspect(sym, eval.eval_expr(expr, env)));
        } catch (const eval_error& err) {
            show_error("evaluation", fmt::format("{}: {}", text, err.what()));
        }
    }
    if (opts.debug) {
        env->debug();
    }
    return EXIT_SUCCESS;
}

}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (opts.mode == engine::symbolic) {
            const symbolic sym {};
            return run_showcase(sym, opts);
        }
        const concrete sym {};
        return run_showcase(sym, opts);
    } catch (const panic& err) {
        show_error("internal", err.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Caught an exception: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
