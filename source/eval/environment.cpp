#include <algorithm>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "environment.hpp"

#include <diagnostic/diagnostic.hpp>
#include <fmt/ostream.h>
#include <object/object.hpp>

environment::environment(environment* outer_env)
    : outer(outer_env)
{
}

auto environment::define(const std::string& name, object val) -> void
{
    store[name] = std::move(val);
}

auto environment::get(const std::string& name, const location& loc) const -> const object&
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    throw make_runtime_error(runtime_error_kind::undefined_variable, loc, "undefined variable '{}'", name);
}

auto environment::assign(const std::string& name, object val, const location& loc) -> const object&
{
    for (auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            itr->second = std::move(val);
            return itr->second;
        }
    }
    throw make_runtime_error(runtime_error_kind::undefined_variable, loc, "undefined variable '{}'", name);
}

void environment::debug(std::ostream& out) const
{
    std::vector<std::pair<std::string, const object*>> bindings;
    bindings.reserve(store.size());
    for (const auto& [name, val] : store) {
        bindings.emplace_back(name, &val);
    }
    std::sort(bindings.begin(), bindings.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    for (const auto& [name, val] : bindings) {
        fmt::print(out, "[{}] = {}\n", name, val->string());
    }
}
