#include <functional>
#include <optional>
#include <string_view>

#include "testutils.hpp"

#include <ast/builders.hpp>
#include <builtin/builtin.hpp>

auto with_prelude(const decl_groups& decls) -> decl_groups
{
    auto result = prelude_decls();
    result.insert(result.end(), decls.begin(), decls.end());
    return result;
}

auto eval_error_of(const std::function<void()>& action) -> std::optional<eval_error>
{
    try {
        action();
    } catch (const eval_error& err) {
        return err;
    }
    return std::nullopt;
}

auto error_expr(const type_expr* type, std::string_view message) -> const expression*
{
    return app(tapp(var("error"), {type, t_num(message.size())}), {str_lit(message)});
}
